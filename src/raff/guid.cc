//
// GUID text conversion and the Wave64 GUID table
//

#include <raff/guid.hh>
#include <raff/exceptions.hh>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ostream>

namespace raff {

    namespace {
        // Byte index into the file layout for each hex pair of the text form.
        // The first three groups are stored little-endian.
        constexpr int text_order[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};

        int hex_value(char c) {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        }
    }

    guid guid::from_bytes(const void* data) {
        guid result;
        std::memcpy(result.bytes.data(), data, result.bytes.size());
        return result;
    }

    guid guid::parse(std::string_view text) {
        THROW_PARSE_IF(text.size() != 36, "Invalid GUID '", text, "': expected 36 characters");

        guid result;
        std::size_t pair = 0;
        for (std::size_t i = 0; i < text.size(); ) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                THROW_PARSE_IF(text[i] != '-', "Invalid GUID '", text, "': expected '-' at position ", i);
                ++i;
                continue;
            }
            int hi = hex_value(text[i]);
            int lo = hex_value(text[i + 1]);
            THROW_PARSE_IF(hi < 0 || lo < 0, "Invalid GUID '", text, "': bad hex digit near position ", i);
            result.bytes[text_order[pair++]] = static_cast<std::byte>((hi << 4) | lo);
            i += 2;
        }
        return result;
    }

    std::string guid::to_string() const {
        static constexpr char digits[] = "0123456789ABCDEF";
        std::string out;
        out.reserve(36);
        for (std::size_t pair = 0; pair < 16; ++pair) {
            if (pair == 4 || pair == 6 || pair == 8 || pair == 10) {
                out.push_back('-');
            }
            auto v = static_cast<unsigned>(bytes[text_order[pair]]);
            out.push_back(digits[v >> 4]);
            out.push_back(digits[v & 0x0F]);
        }
        return out;
    }

    std::ostream& operator<<(std::ostream& os, const guid& g) {
        return os << g.to_string();
    }

    namespace wave64 {
        namespace {
            // Neither GUID starts with a readable tag
            const guid& marker_guid() {
                static const guid g = guid::parse("ABF76256-392D-11D2-86C7-00C04F8EDB8A");
                return g;
            }

            const guid& summarylist_guid() {
                static const guid g = guid::parse("925F94BC-525A-11D2-86DC-00C04F8EDB8A");
                return g;
            }
        }

        const guid& riff_guid() {
            static const guid g = guid::parse("66666972-912E-11CF-A5D6-28DB04C10000");
            return g;
        }

        const guid& list_guid() {
            static const guid g = guid::parse("7473696C-912F-11CF-A5D6-28DB04C10000");
            return g;
        }

        const guid& wave_guid() {
            static const guid g = guid::parse("65766177-ACF3-11D3-8CD1-00C04F8EDB8A");
            return g;
        }

        const guid& junk_guid() {
            static const guid g = guid::parse("6B6E756A-ACF3-11D3-8CD1-00C04F8EDB8A");
            return g;
        }

        fourcc to_fourcc(const guid& g) {
            if (g == riff_guid()) {
                return "RIFF"_4cc;
            }
            if (g == list_guid()) {
                return "LIST"_4cc;
            }
            if (g == wave_guid()) {
                return "WAVE"_4cc;
            }
            if (g == junk_guid()) {
                return "JUNK"_4cc;
            }
            if (g == marker_guid()) {
                return "cue "_4cc;
            }
            if (g == summarylist_guid()) {
                return "SMRY"_4cc;
            }
            return g.leading_fourcc();
        }

        bool is_known(const guid& g) {
            static const guid others[] = {
                guid::parse("20746D66-ACF3-11D3-8CD1-00C04F8EDB8A"),  // fmt
                guid::parse("74636166-ACF3-11D3-8CD1-00C04F8EDB8A"),  // fact
                guid::parse("61746164-ACF3-11D3-8CD1-00C04F8EDB8A"),  // data
                guid::parse("6C76656C-ACF3-11D3-8CD1-00C04F8EDB8A"),  // levl
                guid::parse("74786562-ACF3-11D3-8CD1-00C04F8EDB8A"),  // bext
            };
            if (g == riff_guid() || g == list_guid() || g == wave_guid() || g == junk_guid() ||
                g == marker_guid() || g == summarylist_guid()) {
                return true;
            }
            return std::find(std::begin(others), std::end(others), g) != std::end(others);
        }
    }

} // namespace raff
