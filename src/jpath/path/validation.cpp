#include "validation.hpp"

#include <algorithm>
#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace JP {

auto path_letter_length(std::string_view text, std::size_t pos) noexcept -> std::size_t {
    if (pos >= text.size())
        return 0;

    auto const*   bytes  = reinterpret_cast<std::uint8_t const*>(text.data() + pos);
    auto const    length = static_cast<std::int32_t>(std::min<std::size_t>(text.size() - pos, U8_MAX_LENGTH));
    std::int32_t  offset = 0;
    UChar32       codePoint;
    U8_NEXT(bytes, offset, length, codePoint);
    // Ill-formed sequences decode to a negative value
    if (codePoint < 0 || !u_isUAlphabetic(codePoint))
        return 0;
    return static_cast<std::size_t>(offset);
}

} // namespace JP
