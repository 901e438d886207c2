//
// Container parsing, validation and serialization
//

#include <pngchunk/container.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <cstring>
#include <ostream>
#include <unordered_set>

namespace pngchunk {

    namespace {
        template<typename... Args>
        void warn(const parse_options& options, std::uint64_t offset, std::string_view category, Args&&... args) {
            if (options.on_warning) {
                options.on_warning(offset, category, build_error_msg(std::forward<Args>(args)...));
            }
        }

        bool has_signature(const std::byte* data, std::size_t size) {
            return size >= signature_size && std::memcmp(data, signature.data(), signature_size) == 0;
        }

        bool has_terminator(const std::byte* data, std::size_t size) {
            return size >= signature_size + terminator_size &&
                   std::memcmp(data + size - terminator_size, terminator.data(), terminator_size) == 0;
        }
    }

    container container::parse(const byte_buffer& buffer) {
        return parse(buffer.data(), buffer.size(), parse_options{});
    }

    container container::parse(const byte_buffer& buffer, const parse_options& options) {
        return parse(buffer.data(), buffer.size(), options);
    }

    container container::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        THROW_FORMAT_UNLESS(has_signature(data, size), "PNG signature not found");
        THROW_FORMAT_UNLESS(has_terminator(data, size), "IEND terminator not found at end of buffer");

        container result;
        std::unordered_set<chunk_tag> seen_critical;
        std::size_t pos = signature_size;

        while (pos < size) {
            const std::uint64_t chunk_offset = pos;

            THROW_FORMAT_IF(size - pos < 8, "Truncated chunk header at offset ", chunk_offset,
                            ": only ", size - pos, " bytes left");
            const auto length = load_be32(data + pos);
            const auto tag = chunk_tag::from_bytes(data + pos + 4);
            pos += 8;

            if (!is_known_type(tag)) {
                THROW_CHUNK(unknown_chunk_error, tag, "Unknown chunk type ", tag, " of size ", length,
                            " bytes at offset ", chunk_offset);
            }

            if (is_critical_type(tag)) {
                bool first = seen_critical.insert(tag).second;
                if (!first && !is_repeatable_type(tag)) {
                    THROW_CHUNK(duplicate_chunk_error, tag, "Chunk of type ", tag,
                                " already exists, second one at offset ", chunk_offset);
                }
                if (!first && tag == tags::IDAT && result.m_chunks.back().tag() != tags::IDAT) {
                    warn(options, chunk_offset, "chunk_order",
                         "IDAT chunk at offset ", chunk_offset, " is not contiguous with the previous IDAT");
                }
            }

            THROW_FORMAT_IF(length > options.max_chunk_size,
                            "Chunk ", tag, " at offset ", chunk_offset, " has size ", length,
                            " bytes, which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");
            THROW_FORMAT_IF(size - pos < std::uint64_t(length) + 4,
                            "Truncated chunk ", tag, " at offset ", chunk_offset, ": declares ", length,
                            " payload bytes but only ", size - pos, " bytes left including CRC");

            byte_buffer payload(data + pos, data + pos + length);
            pos += length;
            const auto stored_crc = load_be32(data + pos);
            pos += 4;

            auto c = chunk::from_parsed(tag, std::move(payload), stored_crc);
            if (!c.stored_checksum_matches()) {
                THROW_FORMAT_IF(options.verify_checksums,
                                "CRC mismatch in chunk ", tag, " at offset ", chunk_offset);
                warn(options, chunk_offset, "checksum",
                     "CRC mismatch in chunk ", tag, " at offset ", chunk_offset, ", will be rewritten on serialize");
            }
            result.m_chunks.push_back(std::move(c));
        }

        auto ihdr = result.index_of(tags::IHDR);
        if (!ihdr) {
            THROW_CHUNK(missing_chunk_error, tags::IHDR, "No IHDR chunk detected in PNG");
        }
        result.m_header = image_header::decode(result.m_chunks[*ihdr].payload());

        result.validate();

        if (result.m_header.is_grayscale()) {
            THROW_UNSUPPORTED("Grayscale images currently unsupported (color type ",
                              result.m_header.color, ")");
        }

        return result;
    }

    void container::validate() const {
        for (const auto& tag : mandatory_tags) {
            if (count(tag) == 0) {
                THROW_CHUNK(missing_chunk_error, tag, "No ", tag.to_string(), " chunk detected in PNG");
            }
        }

        if (m_header.is_indexed() && std::holds_alternative<not_found>(find_by_tag(tags::PLTE))) {
            THROW_CHUNK(missing_chunk_error, tags::PLTE,
                        "No PLTE chunk detected in PNG with indexed color type");
        }

        for (const auto& tag : critical_tags) {
            if (!is_repeatable_type(tag) && count(tag) > 1) {
                THROW_CHUNK(duplicate_chunk_error, tag, "Chunk of type ", tag, " occurs ", count(tag), " times");
            }
        }

        THROW_FORMAT_UNLESS(m_chunks.back().tag() == tags::IEND,
                            "IEND must be the last chunk, found ", m_chunks.back().tag());
    }

    lookup_result container::find_by_tag(const chunk_tag& tag) const {
        std::vector<chunk_match> matches;
        for (std::size_t i = 0; i < m_chunks.size(); ++i) {
            if (m_chunks[i].tag() == tag) {
                matches.push_back({i, &m_chunks[i]});
            }
        }

        switch (matches.size()) {
            case 0:
                return not_found{};
            case 1:
                return matches.front();
            default:
                return matches;
        }
    }

    std::size_t container::count(const chunk_tag& tag) const {
        return static_cast<std::size_t>(std::count_if(m_chunks.begin(), m_chunks.end(),
            [&tag](const chunk& c) { return c.tag() == tag; }));
    }

    std::optional<std::size_t> container::index_of(const chunk_tag& tag) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(),
            [&tag](const chunk& c) { return c.tag() == tag; });
        if (it == m_chunks.end()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(it - m_chunks.begin());
    }

    void container::set_bytes_at(std::size_t index, std::size_t payload_offset,
                                 std::uint64_t value, std::size_t width) {
        THROW_BOUNDS_IF(index >= m_chunks.size(),
                        "Chunk index ", index, " out of range, container has ", m_chunks.size(), " chunks");
        THROW_BOUNDS_IF(width == 0 || width > 8, "Byte width ", width, " outside 1..8");
        THROW_BOUNDS_IF(width < 8 && (value >> (8 * width)) != 0,
                        "Value ", value, " does not fit in ", width, " bytes");

        const auto& old_payload = m_chunks[index].payload();
        THROW_BOUNDS_IF(payload_offset > old_payload.size() || width > old_payload.size() - payload_offset,
                        "Window [", payload_offset, ", ", payload_offset + width, ") exceeds payload of ",
                        m_chunks[index].tag(), " (", old_payload.size(), " bytes)");

        byte_buffer payload;
        payload.reserve(old_payload.size());
        payload.insert(payload.end(), old_payload.begin(), old_payload.begin() + payload_offset);
        payload.resize(payload_offset + width);
        store_be_n(payload.data() + payload_offset, value, width);
        payload.insert(payload.end(), old_payload.begin() + payload_offset + width, old_payload.end());

        if (m_chunks[index].tag() == tags::IHDR) {
            auto header = image_header::decode(payload);
            if (header.is_grayscale()) {
                THROW_UNSUPPORTED("Grayscale images currently unsupported (color type ", header.color, ")");
            }
            m_chunks[index].set_payload(std::move(payload));
            m_header = header;
            return;
        }

        m_chunks[index].set_payload(std::move(payload));
    }

    byte_buffer container::serialize() {
        validate();

        std::size_t total = signature_size;
        for (const auto& c : m_chunks) {
            total += c.encoded_size();
        }

        byte_buffer out;
        out.reserve(total);
        for (auto b : signature) {
            out.push_back(static_cast<std::byte>(b));
        }
        for (auto& c : m_chunks) {
            c.encode_to(out);
        }
        return out;
    }

    const chunk& container::at(std::size_t index) const {
        THROW_BOUNDS_IF(index >= m_chunks.size(),
                        "Chunk index ", index, " out of range, container has ", m_chunks.size(), " chunks");
        return m_chunks[index];
    }

    void container::insert(std::size_t index, chunk c) {
        THROW_BOUNDS_IF(index > m_chunks.size(),
                        "Insert position ", index, " out of range, container has ", m_chunks.size(), " chunks");
        m_chunks.insert(m_chunks.begin() + static_cast<std::ptrdiff_t>(index), std::move(c));
    }

    std::size_t container::add(chunk c) {
        std::size_t index = m_chunks.size();

        if (c.tag() == tags::IDAT) {
            auto last = std::find_if(m_chunks.rbegin(), m_chunks.rend(),
                [](const chunk& x) { return x.tag() == tags::IDAT; });
            if (last != m_chunks.rend()) {
                index = static_cast<std::size_t>(m_chunks.rend() - last);
            }
        }
        if (index == m_chunks.size() && !m_chunks.empty() && m_chunks.back().tag() == tags::IEND) {
            index = m_chunks.size() - 1;
        }

        insert(index, std::move(c));
        return index;
    }

    void container::remove(std::size_t index) {
        THROW_BOUNDS_IF(index >= m_chunks.size(),
                        "Chunk index ", index, " out of range, container has ", m_chunks.size(), " chunks");
        m_chunks.erase(m_chunks.begin() + static_cast<std::ptrdiff_t>(index));
    }

    void container::summary(std::ostream& os) const {
        os << "Image width: " << m_header.width << "px\n";
        os << "Image height: " << m_header.height << "px\n";
        os << "Image bit depth: " << static_cast<unsigned>(m_header.bit_depth) << "-bit\n";
        os << "Image color type: " << static_cast<unsigned>(m_header.color)
           << " (" << m_header.color << ")\n";
        os << "Image compression method: " << static_cast<unsigned>(m_header.compression_method) << "\n";
        os << "Image filter method: " << static_cast<unsigned>(m_header.filter_method) << "\n";
        os << "Image interlace method: " << static_cast<unsigned>(m_header.interlace_method) << "\n";
        os << "Order of chunks:";
        for (const auto& c : m_chunks) {
            os << ' ' << c.tag().to_string();
        }
        os << "\n";
    }

} // namespace pngchunk
