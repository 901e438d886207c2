//
// CRC-32 via zlib
//

#include <pngchunk/crc.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngchunk {

    std::uint32_t chunk_crc(const chunk_tag& tag, const std::byte* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(tag.b.data()), 4);

        // zlib takes uInt lengths, feed large payloads in slices
        constexpr std::size_t max_slice = std::numeric_limits<uInt>::max();
        while (size > 0) {
            auto slice = static_cast<uInt>(std::min(size, max_slice));
            crc = crc32(crc, reinterpret_cast<const Bytef*>(data), slice);
            data += slice;
            size -= slice;
        }
        return static_cast<std::uint32_t>(crc);
    }

    std::uint32_t chunk_crc(const chunk_tag& tag, const std::vector<std::byte>& payload) {
        return chunk_crc(tag, payload.data(), payload.size());
    }

} // namespace pngchunk
