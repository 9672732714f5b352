#include "fingerprint.hpp"
#include "errors.hpp"

#include <charconv>
#include <format>

namespace doppel {

std::string Fingerprint::toHex() const
{
    return std::format("{:016x}", m_bits);
}

Fingerprint Fingerprint::fromHex(std::string_view text)
{
    if (text.size() != HEX_DIGITS) {
        throw IndexFormatError(std::format("Invalid fingerprint '{}': expected {} hex digits, got {}",
                                           text, HEX_DIGITS, text.size()));
    }

    std::uint64_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value, 16);

    // from_chars stops at the first non-hex character
    if (ec != std::errc{} || ptr != last) {
        throw IndexFormatError(std::format("Invalid fingerprint '{}': not a hexadecimal value", text));
    }

    return Fingerprint(value);
}

} // namespace doppel
