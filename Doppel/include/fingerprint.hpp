//
// fingerprint.hpp
// 64-bit perceptual fingerprint compared by Hamming distance
//

#pragma once

#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace doppel {

class Fingerprint {
public:
    static constexpr int BITS = 64;
    static constexpr int HEX_DIGITS = BITS / 4;

    constexpr Fingerprint() = default;
    constexpr explicit Fingerprint(std::uint64_t bits) : m_bits(bits) {}

    constexpr std::uint64_t bits() const { return m_bits; }

    // Number of differing bit positions, in [0, 64]
    constexpr int distance(const Fingerprint& other) const
    {
        return std::popcount(m_bits ^ other.m_bits);
    }

    /**
     * Text form used by the persisted index: 16 lowercase hex digits, most significant bit first
     */
    std::string toHex() const;

    /**
     * Parse the text form produced by toHex (either case accepted)
     * @throws IndexFormatError if the text is not exactly 16 hex digits
     */
    static Fingerprint fromHex(std::string_view text);

    constexpr auto operator<=>(const Fingerprint&) const = default;

private:
    std::uint64_t m_bits = 0;
};

inline int distance(const Fingerprint& a, const Fingerprint& b) { return a.distance(b); }

} // namespace doppel

template<>
struct std::hash<doppel::Fingerprint> {
    std::size_t operator()(const doppel::Fingerprint& fp) const noexcept
    {
        return std::hash<std::uint64_t>{}(fp.bits());
    }
};
