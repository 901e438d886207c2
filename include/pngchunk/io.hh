//
// Stream helpers around the buffer based core
//

#pragma once

#include <iosfwd>

#include <pngchunk/chunk.hh>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @brief Read everything from the current position to the end of the stream
     * @throws io_error if the stream is in a bad state or a read fails
     */
    PNGCHUNK_EXPORT byte_buffer read_all(std::istream& is);

    /**
     * @brief Write a buffer to a stream
     * @throws io_error if the write fails
     */
    PNGCHUNK_EXPORT void write_all(std::ostream& os, const byte_buffer& data);

} // namespace pngchunk
