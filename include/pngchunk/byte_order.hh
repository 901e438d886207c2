/**
 * @file byte_order.hh
 * @brief Big-endian load/store helpers for the chunk layer
 *
 * All multi-byte integers of the container (chunk lengths, checksums and
 * the header geometry) are stored big-endian.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Platform endianness detection using CMake-generated config
#if PNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    /**
     * @brief Read a 32-bit big-endian integer from raw bytes
     * @param src At least 4 readable bytes
     */
    inline std::uint32_t load_be32(const std::byte* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        if constexpr (!is_big_endian) {
            value = swap32(value);
        }
        return value;
    }

    /**
     * @brief Write a 32-bit integer to raw bytes in big-endian order
     * @param dst At least 4 writable bytes
     */
    inline void store_be32(std::byte* dst, std::uint32_t value) {
        if constexpr (!is_big_endian) {
            value = swap32(value);
        }
        std::memcpy(dst, &value, sizeof(value));
    }

    /**
     * @brief Write the low @p width bytes of @p value big-endian
     * @param dst At least width writable bytes
     * @param value Value to encode
     * @param width Number of bytes, 1..8
     */
    inline void store_be_n(std::byte* dst, std::uint64_t value, std::size_t width) {
        for (std::size_t i = 0; i < width; ++i) {
            dst[width - 1 - i] = static_cast<std::byte>(value & 0xFF);
            value >>= 8;
        }
    }
}
