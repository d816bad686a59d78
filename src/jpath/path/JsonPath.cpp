#include "JsonPath.hpp"
#include "log/TaggedLogger.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace JP {

namespace {

constexpr char ROOT                = '$';
constexpr char DOT                 = '.';
constexpr char BEGIN_INDEX         = '[';
constexpr char CLOSE_INDEX         = ']';
constexpr char BEGIN_REVERSE_INDEX = '#';
constexpr char REVERSE_SIGN        = '-';

struct DigitRun {
    std::size_t value    = 0;
    bool        empty    = true;
    bool        overflow = false;
};

auto scanDigits(std::string_view text, std::size_t& pos) -> DigitRun {
    auto const start = pos;
    while (pos < text.size() && is_path_digit(text[pos]))
        ++pos;

    DigitRun run;
    run.empty = (pos == start);
    if (!run.empty) {
        auto const result = std::from_chars(text.data() + start, text.data() + pos, run.value);
        if (result.ec != std::errc{}) {
            // Lenient grammar: an unparsable run reads as zero
            run.value    = 0;
            run.overflow = true;
        }
    }
    return run;
}

auto syntaxError([[maybe_unused]] std::string_view text, ParseError::Code code) -> std::unexpected<Error> {
    auto const message = get_error_message(code);
    jp_log("JsonPath::parse rejected '" + std::string(text) + "': " + std::string(message), "JsonPath");
    return std::unexpected(Error{Error::Code::SyntaxError, std::string{message}});
}

} // namespace

JsonPath::JsonPath(std::vector<JsonPathElement> elements)
    : elementList(std::move(elements)) {}

JsonPath::JsonPath(std::initializer_list<JsonPathElement> elements)
    : elementList(elements) {}

auto JsonPath::parse(std::string_view text, ValidationLevel level) -> Expected<JsonPath> {
    bool const  strict = (level == ValidationLevel::Full);
    std::size_t pos    = 0;

    if (text.empty())
        return syntaxError(text, ParseError::Code::ExpectedRootOrDigit);

    if (is_path_digit(text.front())) {
        auto const run = scanDigits(text, pos);
        if (strict && run.overflow)
            return syntaxError(text, ParseError::Code::IndexOutOfRange);
        if (strict && pos != text.size())
            return syntaxError(text, ParseError::Code::TrailingCharacters);
        return JsonPath{JsonPathElement::index(JsonPathIndex::fromStart(run.value))};
    }
    if (text.front() != ROOT)
        return syntaxError(text, ParseError::Code::ExpectedRootOrDigit);
    ++pos;

    std::vector<JsonPathElement> elements;
    while (pos < text.size()) {
        char const c = text[pos++];
        if (c == DOT) {
            auto const start = pos;
            while (auto const letter = path_letter_length(text, pos))
                pos += letter;
            if (strict && pos == start)
                return syntaxError(text, ParseError::Code::EmptyFieldName);
            elements.push_back(JsonPathElement::field(text.substr(start, pos - start)));
        } else if (c == BEGIN_INDEX) {
            bool fromEnd = false;
            bool hasSign = false;
            if (pos < text.size() && text[pos] == BEGIN_REVERSE_INDEX) {
                fromEnd = true;
                ++pos;
                if (pos < text.size() && text[pos] == REVERSE_SIGN) {
                    hasSign = true;
                    ++pos;
                }
            }
            auto const run = scanDigits(text, pos);
            if (pos >= text.size() || text[pos] != CLOSE_INDEX)
                return syntaxError(text, ParseError::Code::UnclosedBracket);
            ++pos;

            if (strict) {
                // "[#]" is the append marker, any other body needs digits
                if (run.empty && (!fromEnd || hasSign))
                    return syntaxError(text, ParseError::Code::MissingIndexDigits);
                if (run.overflow)
                    return syntaxError(text, ParseError::Code::IndexOutOfRange);
            }
            auto const index = fromEnd ? JsonPathIndex::fromEnd(run.value) : JsonPathIndex::fromStart(run.value);
            elements.push_back(JsonPathElement::index(index));
        } else {
            return syntaxError(text, ParseError::Code::ExpectedDotOrBracket);
        }
    }
    return JsonPath(std::move(elements));
}

auto JsonPath::elements() const noexcept -> std::vector<JsonPathElement> const& {
    return this->elementList;
}

auto JsonPath::size() const noexcept -> std::size_t {
    return this->elementList.size();
}

auto JsonPath::empty() const noexcept -> bool {
    return this->elementList.empty();
}

auto JsonPath::last() const noexcept -> JsonPathElement const* {
    if (this->elementList.empty())
        return nullptr;
    return &this->elementList.back();
}

auto JsonPath::view() const noexcept -> JsonPathView {
    return JsonPathView{JsonPathView::Elements(this->elementList)};
}

auto JsonPath::begin() const noexcept -> const_iterator {
    return this->elementList.begin();
}

auto JsonPath::end() const noexcept -> const_iterator {
    return this->elementList.end();
}

auto JsonPath::toString() const -> std::string {
    std::string out{ROOT};
    for (auto const& element : this->elementList) {
        if (element.isField()) {
            out.push_back(DOT);
            out += element.toString();
        } else {
            out.push_back(BEGIN_INDEX);
            out += element.toString();
            out.push_back(CLOSE_INDEX);
        }
    }
    return out;
}

} // namespace JP
