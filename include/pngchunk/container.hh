/**
 * @file container.hh
 * @brief Ordered chunk sequence of a PNG buffer: parse, validate, edit, serialize
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <variant>
#include <vector>

#include <pngchunk/chunk.hh>
#include <pngchunk/chunk_tag.hh>
#include <pngchunk/image_header.hh>
#include <pngchunk/parse_options.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /// No chunk with the requested tag
    struct not_found {};

    /**
     * @struct chunk_match
     * @brief One lookup hit: position in the sequence and the chunk itself
     *
     * The pointer stays valid until the sequence is modified
     * (insert, add, remove or set_bytes_at).
     */
    struct chunk_match {
        std::size_t index;
        const chunk* value;
    };

    /**
     * @brief Result of container::find_by_tag
     *
     * Holds not_found, a single chunk_match, or every match in sequence
     * order when the tag occurs more than once (only IDAT may repeat among
     * critical types).
     */
    using lookup_result = std::variant<not_found, chunk_match, std::vector<chunk_match>>;

    /**
     * @class container
     * @brief Exclusive owner of the chunk sequence of one PNG buffer
     *
     * A container only exists in a fully parsed state: parse() either
     * returns a valid container or throws. The chunk order is kept exactly
     * as read so that serialize() reproduces an unmodified input byte for
     * byte.
     *
     * No internal locking is done. Concurrent readers are fine, any
     * mutation needs exclusive access.
     */
    class PNGCHUNK_EXPORT container {
    public:
        /**
         * @brief Parse a complete PNG buffer
         * @param data Buffer start
         * @param size Buffer size in bytes
         * @param options Limits, checksum policy and warning callback
         * @throws format_error Missing signature/terminator, truncated or oversized chunk,
         *         short IHDR, or CRC mismatch when verify_checksums is set
         * @throws unknown_chunk_error Tag outside the critical and ancillary sets
         * @throws duplicate_chunk_error Repeated IHDR, PLTE or IEND
         * @throws missing_chunk_error No IHDR, IDAT or IEND, or no PLTE for indexed color
         * @throws unsupported_feature_error Grayscale or grayscale+alpha color type
         */
        static container parse(const std::byte* data, std::size_t size, const parse_options& options);

        static container parse(const byte_buffer& buffer, const parse_options& options);

        static container parse(const byte_buffer& buffer);

        /**
         * @brief Check the structural invariants of the current sequence
         *
         * IHDR, IDAT and IEND must be present, PLTE must be present for
         * indexed color, no critical type other than IDAT may repeat and
         * IEND must be last.
         */
        void validate() const;

        /**
         * @brief Find all chunks of one type
         * @return not_found, a single chunk_match, or every match in order
         */
        [[nodiscard]] lookup_result find_by_tag(const chunk_tag& tag) const;

        /// Number of chunks with the given tag
        [[nodiscard]] std::size_t count(const chunk_tag& tag) const;

        /// Index of the first chunk with the given tag
        [[nodiscard]] std::optional<std::size_t> index_of(const chunk_tag& tag) const;

        /**
         * @brief Overwrite a byte window of a chunk payload with a big-endian value
         * @param index Chunk position in the sequence
         * @param payload_offset First payload byte to replace
         * @param value Value to encode
         * @param width Window size in bytes, 1..8
         * @throws bounds_error If the chunk or the window does not exist, or
         *         @p value does not fit in @p width bytes. Nothing is modified.
         * @throws unsupported_feature_error If an IHDR edit selects a grayscale
         *         color type. Nothing is modified.
         *
         * The payload is rebuilt from prefix, encoded value and suffix and the
         * chunk checksum is refreshed. Edits of IHDR also update header().
         */
        void set_bytes_at(std::size_t index, std::size_t payload_offset,
                          std::uint64_t value, std::size_t width = 1);

        /**
         * @brief Validate and encode signature plus every chunk
         *
         * Every checksum is recomputed, so stored CRC mismatches of the input
         * are corrected in the output.
         */
        byte_buffer serialize();

        [[nodiscard]] const image_header& header() const { return m_header; }
        [[nodiscard]] std::uint32_t width() const { return m_header.width; }
        [[nodiscard]] std::uint32_t height() const { return m_header.height; }
        [[nodiscard]] std::uint8_t bit_depth() const { return m_header.bit_depth; }
        [[nodiscard]] color_type color() const { return m_header.color; }

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }

        /// @throws bounds_error for an index outside the sequence
        [[nodiscard]] const chunk& at(std::size_t index) const;

        /**
         * @brief Insert a chunk before position @p index
         * @throws bounds_error if index > size()
         *
         * Structural rules are checked by the next validate()/serialize().
         */
        void insert(std::size_t index, chunk c);

        /**
         * @brief Add a chunk where a writer would put it
         * @return Position of the new chunk
         *
         * IDAT goes right after the last IDAT so the data stays contiguous,
         * anything else goes in front of the IEND terminator.
         */
        std::size_t add(chunk c);

        /// @throws bounds_error for an index outside the sequence
        void remove(std::size_t index);

        /// Human readable dump of the header fields and the chunk order
        void summary(std::ostream& os) const;

    private:
        container() = default;

        std::vector<chunk> m_chunks;
        image_header m_header;
    };

} // namespace pngchunk
