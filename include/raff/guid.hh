/**
 * @file guid.hh
 * @brief 16-byte identifiers used by Sony Wave64 in place of fourcc tags
 */

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <iosfwd>
#include <raff/export_raff.h>
#include <raff/fourcc.hh>

namespace raff {

    /**
     * @struct guid
     * @brief Raw GUID bytes in file order
     *
     * Wave64 stores GUIDs in the mixed-endian Windows layout: the first
     * three groups are little-endian. Text conversion follows that layout.
     */
    struct RAFF_EXPORT guid {
        std::array<std::byte, 16> bytes{};

        static guid from_bytes(const void* data);

        /**
         * @brief Parse the canonical "XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX" form
         * @throws parse_error if the text is not a well formed GUID
         */
        static guid parse(std::string_view text);

        /// Canonical upper-case text form
        [[nodiscard]] std::string to_string() const;

        /// First four bytes in file order; Wave64 chunk GUIDs start with the chunk's fourcc
        [[nodiscard]] fourcc leading_fourcc() const {
            return fourcc::from_bytes(bytes.data());
        }

        bool operator==(const guid& o) const { return bytes == o.bytes; }
        bool operator!=(const guid& o) const { return !(*this == o); }
    };

    RAFF_EXPORT std::ostream& operator<<(std::ostream& os, const guid& g);

    namespace wave64 {
        RAFF_EXPORT const guid& riff_guid();
        RAFF_EXPORT const guid& list_guid();
        RAFF_EXPORT const guid& wave_guid();
        RAFF_EXPORT const guid& junk_guid();

        /**
         * @brief Map a Wave64 GUID to the fourcc used in chunk records
         *
         * The riff/list/wave/junk GUIDs map to their upper-case RIFF
         * names; any other GUID yields its leading four bytes, which for
         * the standard chunks ("fmt ", "data", "fact", ...) is the chunk id.
         */
        RAFF_EXPORT fourcc to_fourcc(const guid& g);

        /// True for the GUIDs listed in the Wave64 specification
        RAFF_EXPORT bool is_known(const guid& g);
    }

} // namespace raff
