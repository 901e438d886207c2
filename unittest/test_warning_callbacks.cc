//
// Warning callbacks and checksum policy
//

#include <doctest/doctest.h>
#include <pngchunk/container.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <algorithm>
#include <functional>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};

namespace {
    // IDAT at offset 33 (signature 8 + IHDR 25) with a wrong CRC
    byte_buffer png_with_bad_idat_crc() {
        return png_builder()
            .signature()
            .ihdr(1, 1)
            .chunk("IDAT", bytes({1, 2, 3}), 0x12345678u)
            .iend()
            .build();
    }
}

TEST_CASE("Warning callbacks - checksum") {
    SUBCASE("mismatch is reported and the chunk kept") {
        warning_tracker tracker;
        parse_options opts;
        opts.on_warning = std::ref(tracker);

        auto png = container::parse(png_with_bad_idat_crc(), opts);
        REQUIRE(tracker.count_category("checksum") == 1);
        CHECK(tracker.warnings[0].offset == 33);
        CHECK(tracker.warnings[0].message.find("'IDAT'") != std::string::npos);

        CHECK(png.at(1).checksum() == 0x12345678u);
        CHECK_FALSE(png.at(1).stored_checksum_matches());
    }

    SUBCASE("serialize writes the corrected CRC") {
        auto png = container::parse(png_with_bad_idat_crc());
        auto out = png.serialize();
        auto expected = png_builder().signature().ihdr(1, 1).idat(bytes({1, 2, 3})).iend().build();
        CHECK(out == expected);
        CHECK(out != png_with_bad_idat_crc());
    }

    SUBCASE("strict verification rejects the buffer") {
        parse_options opts;
        opts.verify_checksums = true;
        CHECK_THROWS_AS(container::parse(png_with_bad_idat_crc(), opts), format_error);
    }

    SUBCASE("strict verification accepts valid buffers") {
        parse_options opts;
        opts.verify_checksums = true;
        CHECK_NOTHROW((void)container::parse(indexed_png(), opts));
    }

    SUBCASE("no handler installed") {
        CHECK_NOTHROW((void)container::parse(png_with_bad_idat_crc()));
    }
}

TEST_CASE("Warning callbacks - chunk_order") {
    warning_tracker tracker;
    parse_options opts;
    opts.on_warning = std::ref(tracker);

    SUBCASE("split IDAT run") {
        auto data = png_builder()
            .signature()
            .ihdr(1, 1)
            .idat(bytes({1}))
            .chunk("tEXt", text_bytes("x"))
            .idat(bytes({2}))
            .iend()
            .build();
        (void)container::parse(data, opts);
        CHECK(tracker.count_category("chunk_order") == 1);
        CHECK_FALSE(tracker.has_warning("checksum"));
    }

    SUBCASE("contiguous IDAT run") {
        auto data = png_builder()
            .signature()
            .ihdr(1, 1)
            .idat(bytes({1}))
            .idat(bytes({2}))
            .idat(bytes({3}))
            .iend()
            .build();
        (void)container::parse(data, opts);
        CHECK(tracker.warnings.empty());
    }
}
