//
// CRC-32 over the type and payload of a chunk
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngchunk/chunk_tag.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Standard CRC-32 (ISO 3309 / ITU-T V.42) of tag followed by payload
     *
     * This is the value stored after every chunk. The length field is not
     * covered.
     */
    PNGCHUNK_EXPORT std::uint32_t chunk_crc(const chunk_tag& tag, const std::byte* data, std::size_t size);

    PNGCHUNK_EXPORT std::uint32_t chunk_crc(const chunk_tag& tag, const std::vector<std::byte>& payload);

} // namespace pngchunk
