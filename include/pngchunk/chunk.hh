/**
 * @file chunk.hh
 * @brief A single length-prefixed, tagged, checksummed record
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <pngchunk/chunk_tag.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    using byte_buffer = std::vector<std::byte>;

    /**
     * @class chunk
     * @brief One record of the container: tag, payload and CRC-32
     *
     * The chunk owns its payload. The stored checksum is only an
     * observation when the chunk came from a parsed buffer; encode()
     * always recomputes it from the current tag and payload.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /**
         * @brief Build a chunk and compute its checksum
         * @param tag Type code, not validated here
         * @param payload Payload bytes
         * @throws bounds_error if the payload does not fit the 32-bit length field
         */
        chunk(chunk_tag tag, byte_buffer payload);

        /**
         * @brief Chunk as read from a buffer
         *
         * Keeps the length field and checksum exactly as stored, so a
         * mismatching CRC can be reported later.
         */
        static chunk from_parsed(chunk_tag tag, byte_buffer payload, std::uint32_t stored_crc);

        [[nodiscard]] const chunk_tag& tag() const { return m_tag; }
        [[nodiscard]] const byte_buffer& payload() const { return m_payload; }

        /// Stored checksum, either computed or taken from the parsed buffer
        [[nodiscard]] std::uint32_t checksum() const { return m_checksum; }

        /// Length decoded from the stored 4-byte big-endian length field
        [[nodiscard]] std::uint32_t declared_length() const;

        /// Bytes taken by encode(): length, tag, payload and CRC
        [[nodiscard]] std::size_t encoded_size() const;

        /**
         * @brief Replace the payload wholesale
         *
         * Updates the length field and the checksum.
         * @throws bounds_error if the payload does not fit the 32-bit length field
         */
        void set_payload(byte_buffer payload);

        /// Overwrite the stored checksum from the current tag and payload
        void recompute_checksum();

        [[nodiscard]] std::uint32_t computed_checksum() const;

        /// True when the stored checksum equals CRC-32(tag ‖ payload)
        [[nodiscard]] bool stored_checksum_matches() const;

        /**
         * @brief On-wire record: u32be length, tag, payload, u32be CRC
         *
         * Refreshes the length field and the checksum first, so the output
         * reflects the current payload even after direct edits.
         */
        byte_buffer encode();

        /// Append the encoded record to @p out
        void encode_to(byte_buffer& out);

    private:
        chunk() = default;

        void refresh_length();

        std::array<std::byte, 4> m_length{};
        chunk_tag m_tag;
        byte_buffer m_payload;
        std::uint32_t m_checksum = 0;
    };

} // namespace pngchunk
