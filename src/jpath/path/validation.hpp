#pragma once
#include <cstddef>
#include <string_view>

namespace JP {

struct ParseError {
    enum class Code {
        ExpectedRootOrDigit,
        ExpectedDotOrBracket,
        UnclosedBracket,
        EmptyFieldName,
        MissingIndexDigits,
        IndexOutOfRange,
        TrailingCharacters
    };
    Code code;
};

// Basic accepts the historical lenient grammar, Full rejects what Basic papers over.
enum struct ValidationLevel {
    None = 0,
    Basic,
    Full
};

constexpr auto get_error_message(ParseError::Code code) -> std::string_view {
    switch (code) {
    case ParseError::Code::ExpectedRootOrDigit:
        return "expected $ or numeric";
    case ParseError::Code::ExpectedDotOrBracket:
        return "expected . or [";
    case ParseError::Code::UnclosedBracket:
        return "expected ]";
    case ParseError::Code::EmptyFieldName:
        return "empty field name";
    case ParseError::Code::MissingIndexDigits:
        return "missing index digits";
    case ParseError::Code::IndexOutOfRange:
        return "index out of range";
    case ParseError::Code::TrailingCharacters:
        return "expected end of path";
    }
    return "unknown parse error";
}

// Byte length of the UTF-8 encoded alphabetic code point starting at pos, 0 when there is none.
auto path_letter_length(std::string_view text, std::size_t pos) noexcept -> std::size_t;

constexpr auto is_path_digit(char c) noexcept -> bool {
    return c >= '0' && c <= '9';
}

} // namespace JP
