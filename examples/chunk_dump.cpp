/**
 * @file chunk_dump.cpp
 * @brief List the chunks of a PNG file
 *
 * Prints the header fields, then one line per chunk with its position,
 * type, payload size, CRC and the properties encoded in the type code.
 */

#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/io.hh>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>

#include <pngchunk/chunk_types.hh>

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file.png> [--strict]\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open file: " << argv[1] << "\n";
        return 1;
    }

    pngchunk::parse_options options;
    options.verify_checksums = argc > 2 && std::string(argv[2]) == "--strict";
    options.on_warning = [](std::uint64_t offset,
                            std::string_view category,
                            std::string_view message) {
        std::cerr << "Warning at offset " << offset
                  << " [" << category << "]: " << message << "\n";
    };

    try {
        auto png = pngchunk::container::parse(pngchunk::read_all(file), options);

        std::cout << "File: " << argv[1] << "\n";
        std::cout << "=========================================\n";
        png.summary(std::cout);
        std::cout << "\n";

        std::map<std::string, std::size_t> per_type;
        std::uint64_t offset = pngchunk::signature_size;

        for (std::size_t i = 0; i < png.size(); ++i) {
            const auto& c = png.at(i);
            std::cout << std::setw(4) << i << "  "
                      << c.tag().to_string() << "  "
                      << std::setw(10) << c.declared_length() << " bytes  @ 0x"
                      << std::hex << std::setw(8) << std::setfill('0') << offset
                      << "  crc 0x" << std::setw(8) << c.checksum()
                      << std::dec << std::setfill(' ')
                      << (c.stored_checksum_matches() ? "" : " (mismatch)")
                      << "  " << (c.tag().is_critical() ? "critical" : "ancillary")
                      << (c.tag().is_public() ? "" : ", private")
                      << (c.tag().is_safe_to_copy() ? ", safe-to-copy" : "")
                      << (c.tag().is_reserved_valid() ? "" : ", reserved bit set")
                      << "\n";

            per_type[c.tag().to_string()]++;
            offset += c.encoded_size();
        }

        std::cout << "\nChunk types:\n";
        for (const auto& [type, n] : per_type) {
            std::cout << "  " << type << ": " << n << "\n";
        }
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
