/**
 * @file image_header.hh
 * @brief Geometry and encoding parameters carried by the IHDR chunk
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <ostream>

#include <pngchunk/chunk.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum color_type
     * @brief Color type byte of the header
     */
    enum class color_type : std::uint8_t {
        grayscale       = 0,
        truecolor       = 2,
        indexed         = 3,  ///< Palette based, requires PLTE
        grayscale_alpha = 4,
        truecolor_alpha = 6
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, color_type ct);

    /**
     * @struct image_header
     * @brief Decoded IHDR payload
     *
     * Layout (13 bytes): u32be width, u32be height, then one byte each for
     * bit depth, color type, compression, filter and interlace method.
     */
    struct PNGCHUNK_EXPORT image_header {
        static constexpr std::size_t encoded_size = 13;

        std::uint32_t width = 0;
        std::uint32_t height = 0;
        std::uint8_t bit_depth = 0;
        color_type color = color_type::truecolor;
        std::uint8_t compression_method = 0;
        std::uint8_t filter_method = 0;
        std::uint8_t interlace_method = 0;

        /**
         * @brief Decode from an IHDR payload
         * @throws format_error if the payload is shorter than 13 bytes
         *
         * Trailing bytes beyond the fixed layout are ignored. The color
         * type byte is stored as is, even if it is not a defined value.
         */
        static image_header decode(const byte_buffer& payload);

        /// Fixed 13 byte IHDR payload
        [[nodiscard]] byte_buffer encode() const;

        [[nodiscard]] bool is_indexed() const { return color == color_type::indexed; }

        [[nodiscard]] bool is_grayscale() const {
            return color == color_type::grayscale || color == color_type::grayscale_alpha;
        }
    };

} // namespace pngchunk
