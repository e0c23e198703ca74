/**
 * @file chunk_record.hh
 * @brief One chunk as reported by a chunk_scanner
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <raff/fourcc.hh>
#include <raff/guid.hh>

namespace raff {

    /**
     * @struct chunk_record
     * @brief Identifier, size and position of a chunk, optionally with its bytes
     *
     * size excludes the header and any alignment padding; offset is the
     * source offset of the first payload byte.
     */
    struct chunk_record {
        fourcc id;
        std::uint64_t size = 0;
        std::uint64_t offset = 0;
        std::uint64_t header_offset = 0;
        std::optional<std::vector<std::byte>> payload;  ///< Present when payloads are materialized
        std::optional<fourcc> type;                     ///< Container type of an entered LIST/FORM/CAT/PROP
        std::optional<fourcc> current_form;             ///< Innermost enclosing form type
        std::optional<guid> uuid;                       ///< Wave64 chunk GUID
        int depth = 0;                                  ///< 0 for chunks directly under the master header
        bool is_container = false;

        /// One past the last payload byte
        [[nodiscard]] std::uint64_t end() const { return offset + size; }
    };

} // namespace raff
