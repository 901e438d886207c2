//
// Fixed chunk type sets and framing constants of the container
//

#pragma once

#include <array>
#include <algorithm>
#include <cstddef>

#include <pngchunk/chunk_tag.hh>

namespace pngchunk {

    namespace tags {
        // Critical
        inline constexpr chunk_tag IHDR = "IHDR"_tag;
        inline constexpr chunk_tag PLTE = "PLTE"_tag;
        inline constexpr chunk_tag IDAT = "IDAT"_tag;
        inline constexpr chunk_tag IEND = "IEND"_tag;

        // Ancillary
        inline constexpr chunk_tag bKGD = "bKGD"_tag;
        inline constexpr chunk_tag cHRM = "cHRM"_tag;
        inline constexpr chunk_tag dSIG = "dSIG"_tag;
        inline constexpr chunk_tag eXIf = "eXIf"_tag;
        inline constexpr chunk_tag eXIF = "eXIF"_tag;  // legacy spelling
        inline constexpr chunk_tag gAMA = "gAMA"_tag;
        inline constexpr chunk_tag hIST = "hIST"_tag;
        inline constexpr chunk_tag iCCP = "iCCP"_tag;
        inline constexpr chunk_tag iTXt = "iTXt"_tag;
        inline constexpr chunk_tag pHYs = "pHYs"_tag;
        inline constexpr chunk_tag sBIT = "sBIT"_tag;
        inline constexpr chunk_tag sPLT = "sPLT"_tag;
        inline constexpr chunk_tag sRGB = "sRGB"_tag;
        inline constexpr chunk_tag sTER = "sTER"_tag;
        inline constexpr chunk_tag tEXt = "tEXt"_tag;
        inline constexpr chunk_tag tIME = "tIME"_tag;
        inline constexpr chunk_tag tRNS = "tRNS"_tag;
        inline constexpr chunk_tag zTXt = "zTXt"_tag;
    }

    inline constexpr std::array<chunk_tag, 4> critical_tags = {
        tags::IHDR, tags::PLTE, tags::IDAT, tags::IEND
    };

    inline constexpr std::array<chunk_tag, 18> ancillary_tags = {
        tags::bKGD, tags::cHRM, tags::dSIG, tags::eXIf, tags::eXIF, tags::gAMA,
        tags::hIST, tags::iCCP, tags::iTXt, tags::pHYs, tags::sBIT, tags::sPLT,
        tags::sRGB, tags::sTER, tags::tEXt, tags::tIME, tags::tRNS, tags::zTXt
    };

    // Types that must be present in every container (PLTE only for indexed color)
    inline constexpr std::array<chunk_tag, 3> mandatory_tags = {
        tags::IHDR, tags::IDAT, tags::IEND
    };

    inline constexpr std::size_t signature_size = 8;
    inline constexpr std::array<unsigned char, signature_size> signature = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
    };

    // Empty IEND chunk: length 0, tag, CRC of "IEND"
    inline constexpr std::size_t terminator_size = 12;
    inline constexpr std::array<unsigned char, terminator_size> terminator = {
        0x00, 0x00, 0x00, 0x00, 0x49, 0x45, 0x4E, 0x44, 0xAE, 0x42, 0x60, 0x82
    };

    // Length, tag and CRC around each payload
    inline constexpr std::size_t chunk_overhead = 12;

    inline bool is_critical_type(const chunk_tag& tag) {
        return std::find(critical_tags.begin(), critical_tags.end(), tag) != critical_tags.end();
    }

    inline bool is_ancillary_type(const chunk_tag& tag) {
        return std::find(ancillary_tags.begin(), ancillary_tags.end(), tag) != ancillary_tags.end();
    }

    inline bool is_known_type(const chunk_tag& tag) {
        return is_critical_type(tag) || is_ancillary_type(tag);
    }

    // IDAT is the only critical type allowed to occur more than once
    inline bool is_repeatable_type(const chunk_tag& tag) {
        return !is_critical_type(tag) || tag == tags::IDAT;
    }

} // namespace pngchunk
