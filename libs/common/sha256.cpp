/**
 * @file sha256.cpp
 * @brief SHA-256 digest used for structural fingerprints (FIPS 180-4)
 *
 * - Round helpers are constexpr and use std::rotr from <bit>
 * - Message words are loaded with std::byteswap on little-endian hosts
 * - Indexed loops use std::views::enumerate
 */

#include "jsonts/common.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <ranges>
#include <span>

namespace jsonts::common {

namespace {

constexpr std::size_t kBlockSize = 64uz;
constexpr std::size_t kLengthOffset = 56uz;

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    {0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4,
     0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe,
     0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f,
     0x4a7484aa, 0x5cb0a9dc, 0x76f988da, 0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
     0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc,
     0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
     0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116,
     0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
     0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7,
     0xc67178f2}
};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab,
     0x5be0cd19}
};

[[nodiscard]] constexpr std::uint32_t choose(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr std::uint32_t majority(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_big_endian(const std::uint8_t* bytes) noexcept
{
    std::uint32_t word{};
    std::memcpy(&word, bytes, sizeof(word));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(word);
    } else {
        return word;
    }
}

class Sha256
{
public:
    void update(std::string_view data)
    {
        const auto bytes = std::span<const std::uint8_t>(
            reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
        for (const auto byte : bytes) {
            m_block[m_block_len++] = byte;
            if (m_block_len == kBlockSize) {
                compress();
                m_block_len = 0;
            }
        }
        m_total_bytes += data.size();
    }

    [[nodiscard]] std::array<std::uint8_t, 32> finish()
    {
        const std::uint64_t total_bits = m_total_bytes * 8U;

        m_block[m_block_len++] = 0x80;
        if (m_block_len > kLengthOffset) {
            std::ranges::fill(std::span(m_block).subspan(m_block_len), std::uint8_t{0});
            compress();
            m_block_len = 0;
        }
        std::ranges::fill(std::span(m_block).subspan(m_block_len, kLengthOffset - m_block_len),
                          std::uint8_t{0});
        for (auto [i, slot] : std::views::enumerate(std::span(m_block).subspan(kLengthOffset))) {
            const auto shift = (7U - static_cast<std::uint64_t>(i)) * 8U;
            slot = static_cast<std::uint8_t>(total_bits >> shift);
        }
        compress();

        std::array<std::uint8_t, 32> digest{};
        for (auto [i, word] : std::views::enumerate(m_state)) {
            const auto base = static_cast<std::size_t>(i) * 4uz;
            digest[base] = static_cast<std::uint8_t>(word >> 24U);
            digest[base + 1uz] = static_cast<std::uint8_t>(word >> 16U);
            digest[base + 2uz] = static_cast<std::uint8_t>(word >> 8U);
            digest[base + 3uz] = static_cast<std::uint8_t>(word);
        }
        return digest;
    }

private:
    void compress()
    {
        std::array<std::uint32_t, 64> schedule{};
        for (auto [i, word] : std::views::enumerate(std::span(schedule).first(16))) {
            word = load_big_endian(&m_block[static_cast<std::size_t>(i) * 4uz]);
        }
        for (std::size_t t = 16; t < schedule.size(); ++t) {
            schedule[t] = small_sigma1(schedule[t - 2]) + schedule[t - 7]
                          + small_sigma0(schedule[t - 15]) + schedule[t - 16];
        }

        auto work = m_state;
        for (auto [t, w] : std::views::enumerate(schedule)) {
            const std::uint32_t t1 = work[7] + big_sigma1(work[4]) + choose(work[4], work[5], work[6])
                                     + kRoundConstants[static_cast<std::size_t>(t)] + w;
            const std::uint32_t t2 = big_sigma0(work[0]) + majority(work[0], work[1], work[2]);
            std::ranges::rotate(work, work.end() - 1);
            work[4] += t1;
            work[0] = t1 + t2;
        }

        for (auto [state, delta] : std::views::zip(m_state, work)) {
            state += delta;
        }
    }

    std::array<std::uint32_t, 8> m_state = kInitialState;
    std::array<std::uint8_t, kBlockSize> m_block{};
    std::size_t m_block_len = 0;
    std::uint64_t m_total_bytes = 0;
};

[[nodiscard]] std::string to_hex(const std::array<std::uint8_t, 32>& digest)
{
    constexpr std::string_view kDigits = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2uz);
    for (const auto byte : digest) {
        hex.push_back(kDigits[byte >> 4U]);
        hex.push_back(kDigits[byte & 0x0FU]);
    }
    return hex;
}

}  // namespace

std::string sha256(std::string_view data)
{
    Sha256 hasher;
    hasher.update(data);
    return to_hex(hasher.finish());
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace jsonts::common
