/**
 * @file master_header.hh
 * @brief Outermost container header and variant information
 */

#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include <raff/fourcc.hh>
#include <raff/guid.hh>

namespace raff {

    /**
     * @enum container_variant
     * @brief Layout family selected from the master signature
     */
    enum class container_variant {
        iff85,  ///< EA IFF-85 FORM/LIST/CAT, big-endian
        riff,   ///< RIFF, little-endian
        rifx,   ///< RIFX/FIRR, big-endian RIFF
        rf64,   ///< RF64/BW64, 64-bit sizes in a ds64 chunk
        wave64  ///< Sony Wave64, GUID ids and 64-bit sizes
    };

    inline const char* to_string(container_variant v) {
        switch (v) {
            case container_variant::iff85:
                return "iff85";
            case container_variant::riff:
                return "riff";
            case container_variant::rifx:
                return "rifx";
            case container_variant::rf64:
                return "rf64";
            case container_variant::wave64:
                return "wave64";
        }
        return "unknown";
    }

    /**
     * @struct rf64_sizes
     * @brief Contents of an RF64/BW64 ds64 chunk
     */
    struct rf64_sizes {
        std::uint64_t riff_size = 0;
        std::uint64_t data_size = 0;
        std::uint64_t sample_count = 0;
        std::vector<std::pair<fourcc, std::uint64_t>> table;  ///< Per-chunk size overrides in file order
    };

    /**
     * @struct master_header
     * @brief The container's outer wrapper
     *
     * For 32-bit variants size counts the bytes following the 8-byte
     * id/size header. RF64 files with the 0xFFFFFFFF marker carry the
     * ds64 riff_size here instead. Wave64 stores the full file size,
     * master header included.
     */
    struct master_header {
        fourcc id;
        std::uint64_t size = 0;
        fourcc type;
        container_variant variant = container_variant::riff;
        std::optional<guid> id_guid;      ///< Wave64 only
        std::optional<guid> type_guid;    ///< Wave64 only
        std::optional<rf64_sizes> rf64;   ///< RF64/BW64 with a ds64 chunk
    };

} // namespace raff
