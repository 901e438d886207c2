//
// Four byte chunk type code
//
#pragma once
#include <array>
#include <cstddef>
#include <cstring>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <ostream>
#include <iomanip>

namespace pngchunk {
    struct chunk_tag {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        constexpr chunk_tag() = default;

        constexpr chunk_tag(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // Runtime construction, the type code is exactly four characters
        explicit chunk_tag(std::string_view sv) {
            if (sv.size() != 4) {
                throw std::invalid_argument("Chunk tag must be exactly 4 characters, got " +
                                            std::to_string(sv.size()));
            }
            std::memcpy(b.data(), sv.data(), 4);
        }

        static chunk_tag from_bytes(const void* data) {
            chunk_tag result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const chunk_tag& o) const { return b == o.b; }
        bool operator!=(const chunk_tag& o) const { return !(*this == o); }

        // Property bits are bit 5 (the lowercase bit) of each byte.
        // Uppercase first letter means the chunk is critical.
        [[nodiscard]] constexpr bool is_critical() const { return (b[0] & 0x20) == 0; }
        [[nodiscard]] constexpr bool is_public() const { return (b[1] & 0x20) == 0; }
        [[nodiscard]] constexpr bool is_reserved_valid() const { return (b[2] & 0x20) == 0; }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return (b[3] & 0x20) != 0; }

        friend std::ostream& operator<<(std::ostream& os, const chunk_tag& t) {
            os << '\'';
            for (char c : t.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    // Escape non-printable characters
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            os << '\'';
            return os;
        }
    };

    struct chunk_tag_hash {
        std::size_t operator()(const chunk_tag& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Compile-time tag creation: "IHDR"_tag
    constexpr chunk_tag operator""_tag(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("Chunk tag literal must be exactly 4 characters");
        }
        return { str[0], str[1], str[2], str[3] };
    }
}

namespace std {
    template<>
    struct hash<pngchunk::chunk_tag> {
        std::size_t operator()(const pngchunk::chunk_tag& t) const noexcept {
            return pngchunk::chunk_tag_hash{}(t);
        }
    };
}
