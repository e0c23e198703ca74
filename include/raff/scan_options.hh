/**
 * @file scan_options.hh
 * @brief Configuration for a container scan
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string_view>
#include <unordered_set>
#include <raff/fourcc.hh>

namespace raff {

    /**
     * @struct scan_options
     * @brief Controls what a chunk_scanner reads and how strict it is
     */
    struct scan_options {
        /**
         * @brief Chunk ids whose bodies are skipped without being read
         *
         * Ignored chunks produce no record.
         */
        std::unordered_set<fourcc> ignore;

        /// Read each reported chunk's payload into its record
        bool materialize_payload = false;

        /**
         * @brief Enter LIST/FORM/CAT/PROP chunks and report their children
         *
         * Off by default: nested containers are reported as opaque chunks.
         */
        bool descend_containers = false;

        /**
         * @brief Strict parsing mode
         *
         * When true, structural violations throw parse_error. When false,
         * they are reported through on_warning and scanning continues.
         */
        bool strict = true;

        /**
         * @brief Largest payload that may be materialized
         *
         * Default is 4GB.
         */
        std::uint64_t max_chunk_size = std::uint64_t(1) << 32;

        /// Maximum nesting depth when descend_containers is set
        int max_depth = 64;

        /**
         * @typedef warning_handler
         * @param offset Source offset the warning refers to
         * @param category Short machine-readable tag, e.g. "missing_padding"
         * @param message Human-readable description
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /// Receives non-fatal conditions; unset means they are dropped
        warning_handler on_warning;

        [[nodiscard]] bool is_ignored(const fourcc& id) const {
            return !ignore.empty() && ignore.count(id) != 0;
        }
    };

} // namespace raff
