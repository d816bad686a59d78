#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace JP {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        SyntaxError,
        NotApplicable
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

// Fixed messages, never interpolated.
inline constexpr std::string_view kNotApplicableMessage = "not applicable";
inline constexpr std::string_view kUnableToFindMessage  = "unable to find path to value";

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::SyntaxError:
        return "syntax_error";
    case Error::Code::NotApplicable:
        return "not_applicable";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

[[nodiscard]] inline auto notApplicable() -> Error {
    return Error{Error::Code::NotApplicable, std::string{kNotApplicableMessage}};
}

} // namespace JP
