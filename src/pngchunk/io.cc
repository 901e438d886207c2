//
// Stream helpers
//

#include <istream>
#include <ostream>
#include <array>

#include <pngchunk/io.hh>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    byte_buffer read_all(std::istream& is) {
        THROW_IO_UNLESS(is.good(), "Stream in bad state");

        byte_buffer result;
        std::array<char, 64 * 1024> block;
        while (is) {
            is.read(block.data(), static_cast<std::streamsize>(block.size()));
            auto got = static_cast<std::size_t>(is.gcount());
            const auto* first = reinterpret_cast<const std::byte*>(block.data());
            result.insert(result.end(), first, first + got);
        }

        THROW_IO_IF(is.bad(), "Stream read failed after ", result.size(), " bytes");
        return result;
    }

    void write_all(std::ostream& os, const byte_buffer& data) {
        THROW_IO_UNLESS(os.good(), "Stream in bad state");

        os.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        os.flush();
        THROW_IO_IF(!os, "Failed to write ", data.size(), " bytes");
    }

} // namespace pngchunk
