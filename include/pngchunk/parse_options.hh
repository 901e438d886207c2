/**
 * @file parse_options.hh
 * @brief Parsing options for container buffers
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for container::parse
     */
    struct parse_options {
        /**
         * @brief Maximum allowed payload length in bytes
         *
         * Lengths above this are a format_error. The default is the
         * 2^31 - 1 limit of the format.
         */
        std::uint64_t max_chunk_size = 0x7FFFFFFFu;

        /**
         * @brief Reject chunks whose stored CRC does not match
         *
         * When false (default), a mismatch is only reported through
         * on_warning and the chunk is kept. serialize() writes the
         * corrected CRC either way.
         */
        bool verify_checksums = false;

        /**
         * @typedef warning_handler
         * @param offset Buffer offset of the chunk the warning is about
         * @param category Warning category ("checksum", "chunk_order")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
