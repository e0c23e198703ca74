/**
 * @file fourcc.hh
 * @brief Four-character chunk identifier
 */

#pragma once

#include <array>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <algorithm>
#include <stdexcept>
#include <ostream>
#include <iomanip>

namespace raff {
    /**
     * @struct fourcc
     * @brief Four raw identifier bytes as found in a chunk header
     *
     * A fourcc has no byte order: the bytes are compared and printed in
     * the order they appear in the file.
     */
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{c0, c1, c2, c3} {}

        // Shorter input is padded with spaces, longer input is cut
        explicit fourcc(std::string_view sv) {
            std::copy_n(sv.begin(), std::min(sv.size(), std::size_t(4)), b.begin());
        }

        fourcc(const char* str) : fourcc(std::string_view(str)) {}

        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string to_string_trimmed() const {
            auto str = to_string();
            str.erase(str.find_last_not_of(' ') + 1);
            return str;
        }

        // Native byte order, used for hashing only
        [[nodiscard]] std::uint32_t to_uint32() const {
            std::uint32_t result;
            std::memcpy(&result, b.data(), 4);
            return result;
        }

        [[nodiscard]] bool is_null() const {
            return std::all_of(b.begin(), b.end(), [](char c) { return c == '\0'; });
        }

        [[nodiscard]] bool is_printable() const {
            return std::all_of(b.begin(), b.end(), [](char c) {
                return c >= 32 && c <= 126;
            });
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        // Printed quoted, non-printable bytes escaped as \xNN
        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    auto flags = os.flags();
                    auto fill = os.fill();
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                    os.flags(flags);
                    os.fill(fill);
                }
            }
            return os << '\'';
        }
    };

    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            return (static_cast<std::size_t>(f.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("FourCC literal must be 4 characters or less");
        }
        return {
            len > 0 ? str[0] : ' ',
            len > 1 ? str[1] : ' ',
            len > 2 ? str[2] : ' ',
            len > 3 ? str[3] : ' '
        };
    }
}

namespace std {
    template<>
    struct hash<raff::fourcc> {
        std::size_t operator()(const raff::fourcc& f) const noexcept {
            return raff::fourcc_hash{}(f);
        }
    };
}
