#include <doctest/doctest.h>
#include <pngchunk/container.hh>
#include <pngchunk/chunk_types.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <limits>

#include "test_utils.hh"

using namespace pngchunk;

TEST_SUITE("MUTATION") {
    TEST_CASE("patch one palette byte and parse again") {
        auto png = container::parse(indexed_png());
        auto r = png.find_by_tag(tags::PLTE);
        REQUIRE(std::holds_alternative<chunk_match>(r));
        auto plte_index = std::get<chunk_match>(r).index;

        // Green of entry 1
        png.set_bytes_at(plte_index, 4, 0x12);

        auto reparsed = container::parse(png.serialize());
        const auto& plte = reparsed.at(plte_index);
        CHECK(plte.tag() == tags::PLTE);
        CHECK(std::to_integer<int>(plte.payload()[4]) == 0x12);
        CHECK(std::to_integer<int>(plte.payload()[3]) == 0xFF);
        CHECK(std::to_integer<int>(plte.payload()[5]) == 0x00);
        CHECK(plte.stored_checksum_matches());
        CHECK(plte.checksum() == chunk_crc(tags::PLTE, plte.payload()));
    }

    TEST_CASE("patch refreshes the chunk checksum immediately") {
        auto png = container::parse(indexed_png());
        auto before = png.at(1).checksum();
        png.set_bytes_at(1, 0, 0x40);
        CHECK(png.at(1).checksum() != before);
        CHECK(png.at(1).stored_checksum_matches());
        CHECK(png.at(1).declared_length() == 12);
    }

    TEST_CASE("multi-byte big-endian values") {
        auto png = container::parse(minimal_png());

        png.set_bytes_at(0, 0, 0x01020304, 4);
        const auto& payload = png.at(0).payload();
        CHECK(payload[0] == std::byte{1});
        CHECK(payload[1] == std::byte{2});
        CHECK(payload[2] == std::byte{3});
        CHECK(payload[3] == std::byte{4});

        CHECK(png.width() == 0x01020304u);
        CHECK(png.height() == 3);

        auto reparsed = container::parse(png.serialize());
        CHECK(reparsed.width() == 0x01020304u);
        CHECK(reparsed.height() == 3);
    }

    TEST_CASE("patching the IHDR color type updates the header") {
        auto png = container::parse(minimal_png());
        auto ihdr_index = *png.index_of(tags::IHDR);

        png.set_bytes_at(ihdr_index, 9, 3);
        CHECK(png.color() == color_type::indexed);
        CHECK(png.header().is_indexed());

        // Indexed color without a palette cannot be written
        CHECK_THROWS_AS(png.serialize(), missing_chunk_error);

        png.set_bytes_at(ihdr_index, 9, 6);
        CHECK(png.color() == color_type::truecolor_alpha);
        auto reparsed = container::parse(png.serialize());
        CHECK(reparsed.color() == color_type::truecolor_alpha);
    }

    TEST_CASE("patching IHDR to grayscale is rejected") {
        auto original = minimal_png();
        auto png = container::parse(original);
        auto ihdr_index = *png.index_of(tags::IHDR);

        SUBCASE("grayscale") {
            CHECK_THROWS_AS(png.set_bytes_at(ihdr_index, 9, 0), unsupported_feature_error);
        }

        SUBCASE("grayscale+alpha") {
            CHECK_THROWS_AS(png.set_bytes_at(ihdr_index, 9, 4), unsupported_feature_error);
        }

        CHECK(png.color() == color_type::truecolor);
        CHECK(png.serialize() == original);
    }

    TEST_CASE("window ending exactly at the payload end") {
        auto png = container::parse(indexed_png());
        png.set_bytes_at(1, 10, 0xBEEF, 2);
        const auto& payload = png.at(1).payload();
        CHECK(payload.size() == 12);
        CHECK(payload[10] == std::byte{0xBE});
        CHECK(payload[11] == std::byte{0xEF});
    }

    TEST_CASE("full 8 byte width") {
        auto data = png_builder()
            .signature()
            .ihdr(1, 1)
            .idat(bytes({0, 0, 0, 0, 0, 0, 0, 0}))
            .iend()
            .build();
        auto png = container::parse(data);
        png.set_bytes_at(1, 0, std::numeric_limits<std::uint64_t>::max(), 8);
        const auto& payload = png.at(1).payload();
        CHECK(std::all_of(payload.begin(), payload.end(), [](std::byte b) { return b == std::byte{0xFF}; }));
    }

    TEST_CASE("bounds errors leave the container unchanged") {
        auto original = indexed_png();
        auto png = container::parse(original);

        SUBCASE("window past payload end") {
            CHECK_THROWS_AS(png.set_bytes_at(1, 11, 0x0102, 2), bounds_error);
        }

        SUBCASE("offset past payload end") {
            CHECK_THROWS_AS(png.set_bytes_at(1, 12, 1), bounds_error);
        }

        SUBCASE("offset overflow") {
            CHECK_THROWS_AS(png.set_bytes_at(1, std::numeric_limits<std::size_t>::max(), 1, 2), bounds_error);
        }

        SUBCASE("chunk index out of range") {
            CHECK_THROWS_AS(png.set_bytes_at(4, 0, 1), bounds_error);
        }

        SUBCASE("zero width") {
            CHECK_THROWS_AS(png.set_bytes_at(1, 0, 0, 0), bounds_error);
        }

        SUBCASE("width above 8") {
            CHECK_THROWS_AS(png.set_bytes_at(1, 0, 0, 9), bounds_error);
        }

        SUBCASE("value does not fit") {
            CHECK_THROWS_AS(png.set_bytes_at(1, 0, 0x100, 1), bounds_error);
            CHECK_THROWS_AS(png.set_bytes_at(1, 0, 0x10000, 2), bounds_error);
        }

        SUBCASE("empty payload") {
            CHECK_THROWS_AS(png.set_bytes_at(3, 0, 0), bounds_error);
        }

        CHECK(png.serialize() == original);
    }

    TEST_CASE("brighten every palette green channel") {
        auto png = container::parse(indexed_png());
        auto plte_index = *png.index_of(tags::PLTE);
        auto entries = png.at(plte_index).payload().size() / 3;

        for (std::size_t i = 0; i < entries; ++i) {
            auto offset = i * 3 + 1;
            auto current = std::to_integer<unsigned>(png.at(plte_index).payload()[offset]);
            png.set_bytes_at(plte_index, offset, std::min(current + 18u, 255u));
        }

        auto reparsed = container::parse(png.serialize());
        const auto& payload = reparsed.at(plte_index).payload();
        CHECK(std::to_integer<unsigned>(payload[1]) == 18);
        CHECK(std::to_integer<unsigned>(payload[4]) == 18);
        CHECK(std::to_integer<unsigned>(payload[7]) == 255);
        CHECK(std::to_integer<unsigned>(payload[10]) == 18);
        // Red and blue untouched
        CHECK(std::to_integer<unsigned>(payload[3]) == 255);
        CHECK(std::to_integer<unsigned>(payload[11]) == 255);
    }
}
