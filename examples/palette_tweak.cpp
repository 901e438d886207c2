/**
 * @file palette_tweak.cpp
 * @brief Brighten one channel of every palette entry of an indexed PNG
 *
 * Loads a PNG, raises the chosen channel (green by default) of each PLTE
 * entry by a fixed step capped at 255, and writes the result to a new file.
 *
 * Usage: palette_tweak <input.png> <output.png> [r|g|b] [step]
 */

#include <pngchunk/container.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/io.hh>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>

namespace {
    int channel_index(const std::string& name) {
        if (name == "r") return 0;
        if (name == "g") return 1;
        if (name == "b") return 2;
        return -1;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <input.png> <output.png> [r|g|b] [step]\n";
        return 1;
    }

    std::string channel_name = argc > 3 ? argv[3] : "g";
    int channel = channel_index(channel_name);
    if (channel < 0) {
        std::cerr << "Channel must be one of r, g, b\n";
        return 1;
    }

    try {
        unsigned step = argc > 4 ? static_cast<unsigned>(std::stoul(argv[4])) : 18u;

        std::ifstream in(argv[1], std::ios::binary);
        if (!in) {
            std::cerr << "Failed to open file: " << argv[1] << "\n";
            return 1;
        }

        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset,
                                std::string_view category,
                                std::string_view message) {
            std::cerr << "Warning at offset " << offset
                      << " [" << category << "]: " << message << "\n";
        };

        auto png = pngchunk::container::parse(pngchunk::read_all(in), options);
        png.summary(std::cout);

        auto plte = png.index_of(pngchunk::tags::PLTE);
        if (!plte) {
            std::cerr << "Image has no palette, nothing to do\n";
            return 1;
        }

        const std::size_t entries = png.at(*plte).payload().size() / 3;
        std::size_t changed = 0;
        for (std::size_t i = 0; i < entries; ++i) {
            std::size_t offset = i * 3 + static_cast<std::size_t>(channel);
            unsigned current = std::to_integer<unsigned>(png.at(*plte).payload()[offset]);
            if (current == 255) {
                continue;
            }

            unsigned updated = std::min(current + step, 255u);
            png.set_bytes_at(*plte, offset, updated);
            std::cout << "Entry " << i << ": " << channel_name << " " << current << " -> " << updated << "\n";
            ++changed;
        }

        std::ofstream out(argv[2], std::ios::binary);
        if (!out) {
            std::cerr << "Failed to create file: " << argv[2] << "\n";
            return 1;
        }
        pngchunk::write_all(out, png.serialize());

        std::cout << changed << " of " << entries << " palette entries changed, written to " << argv[2] << "\n";
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
