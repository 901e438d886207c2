//
// IHDR payload decoding
//

#include <pngchunk/image_header.hh>
#include <pngchunk/byte_order.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    std::ostream& operator<<(std::ostream& os, color_type ct) {
        switch (ct) {
            case color_type::grayscale:
                return os << "grayscale";
            case color_type::truecolor:
                return os << "truecolor";
            case color_type::indexed:
                return os << "indexed";
            case color_type::grayscale_alpha:
                return os << "grayscale+alpha";
            case color_type::truecolor_alpha:
                return os << "truecolor+alpha";
        }
        return os << "unknown(" << static_cast<unsigned>(ct) << ")";
    }

    image_header image_header::decode(const byte_buffer& payload) {
        THROW_FORMAT_IF(payload.size() < encoded_size,
                        "IHDR payload is ", payload.size(), " bytes, expected ", encoded_size);

        const std::byte* p = payload.data();
        image_header h;
        h.width = load_be32(p);
        h.height = load_be32(p + 4);
        h.bit_depth = std::to_integer<std::uint8_t>(p[8]);
        h.color = static_cast<color_type>(std::to_integer<std::uint8_t>(p[9]));
        h.compression_method = std::to_integer<std::uint8_t>(p[10]);
        h.filter_method = std::to_integer<std::uint8_t>(p[11]);
        h.interlace_method = std::to_integer<std::uint8_t>(p[12]);
        return h;
    }

    byte_buffer image_header::encode() const {
        byte_buffer out(encoded_size);
        store_be32(out.data(), width);
        store_be32(out.data() + 4, height);
        out[8] = static_cast<std::byte>(bit_depth);
        out[9] = static_cast<std::byte>(color);
        out[10] = static_cast<std::byte>(compression_method);
        out[11] = static_cast<std::byte>(filter_method);
        out[12] = static_cast<std::byte>(interlace_method);
        return out;
    }

} // namespace pngchunk
