//
// Chunk record encoding
//

#include <pngchunk/chunk.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <limits>

namespace pngchunk {

    chunk::chunk(chunk_tag tag, byte_buffer payload)
        : m_tag(tag)
        , m_payload(std::move(payload)) {
        refresh_length();
        recompute_checksum();
    }

    chunk chunk::from_parsed(chunk_tag tag, byte_buffer payload, std::uint32_t stored_crc) {
        chunk result;
        result.m_tag = tag;
        result.m_payload = std::move(payload);
        result.refresh_length();
        result.m_checksum = stored_crc;
        return result;
    }

    std::uint32_t chunk::declared_length() const {
        return load_be32(m_length.data());
    }

    std::size_t chunk::encoded_size() const {
        return chunk_overhead + m_payload.size();
    }

    void chunk::set_payload(byte_buffer payload) {
        m_payload = std::move(payload);
        refresh_length();
        recompute_checksum();
    }

    void chunk::recompute_checksum() {
        m_checksum = computed_checksum();
    }

    std::uint32_t chunk::computed_checksum() const {
        return chunk_crc(m_tag, m_payload);
    }

    bool chunk::stored_checksum_matches() const {
        return m_checksum == computed_checksum();
    }

    byte_buffer chunk::encode() {
        byte_buffer out;
        encode_to(out);
        return out;
    }

    void chunk::encode_to(byte_buffer& out) {
        refresh_length();
        recompute_checksum();

        std::size_t pos = out.size();
        out.resize(pos + encoded_size());
        std::byte* dst = out.data() + pos;

        std::copy(m_length.begin(), m_length.end(), dst);
        m_tag.to_bytes(dst + 4);
        std::copy(m_payload.begin(), m_payload.end(), dst + 8);
        store_be32(dst + 8 + m_payload.size(), m_checksum);
    }

    void chunk::refresh_length() {
        THROW_BOUNDS_IF(m_payload.size() > std::numeric_limits<std::uint32_t>::max(),
                        "Payload of chunk ", m_tag, " is ", m_payload.size(),
                        " bytes, which does not fit the 32-bit length field");
        store_be32(m_length.data(), static_cast<std::uint32_t>(m_payload.size()));
    }

} // namespace pngchunk
