/**
 * @file parser.hh
 * @brief Convenience entry points over chunk_scanner and payload_dispatcher
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <raff/export_raff.h>
#include <raff/byte_source.hh>
#include <raff/chunk_record.hh>
#include <raff/chunk_scanner.hh>
#include <raff/decoder_registry.hh>
#include <raff/master_header.hh>
#include <raff/payload_dispatcher.hh>
#include <raff/scan_options.hh>

namespace raff {

    /**
     * @struct container_info
     * @brief A whole container scanned into memory
     */
    struct RAFF_EXPORT container_info {
        master_header master;
        byte_order order = byte_order::little;
        std::vector<chunk_record> chunks;

        /// First chunk with the given id, or nullptr
        [[nodiscard]] const chunk_record* find(const fourcc& id) const;

        /// Chunk ids in scan order
        [[nodiscard]] std::vector<fourcc> identifiers() const;
    };

    /**
     * @brief Scan a whole container and collect its records
     * @param source Source positioned at the master header
     * @param options Scan options (ignore set, payload materialization, ...)
     * @throws unrecognized_format_error, truncated_error, parse_error
     */
    RAFF_EXPORT container_info read_container(byte_source& source, const scan_options& options);

    /**
     * @brief Scan a whole container with default options
     */
    RAFF_EXPORT container_info read_container(byte_source& source);

    /**
     * @brief Call func for every chunk record in the source
     *
     * @tparam Func Callable accepting chunk_record&
     * @param source Source positioned at the master header
     * @param func Function to call for each chunk
     * @param options Scan options
     * @return The container's master header
     */
    template<typename Func>
    master_header for_each_chunk(byte_source& source, Func func, const scan_options& options) {
        auto scanner = chunk_scanner::create(source, options);

        while (auto chunk = scanner->next()) {
            func(*chunk);
        }
        return scanner->master();
    }

    template<typename Func>
    master_header for_each_chunk(byte_source& source, Func func) {
        return for_each_chunk(source, func, scan_options{});
    }

    /**
     * @brief Call func for every chunk after running it through the decoders
     *
     * Payloads are always materialized, whatever options says.
     *
     * @tparam Func Callable accepting decoded_chunk&
     */
    template<typename Func>
    master_header for_each_decoded_chunk(byte_source& source, const decoder_registry& decoders,
                                         Func func, const scan_options& options) {
        scan_options opts = options;
        opts.materialize_payload = true;

        auto scanner = chunk_scanner::create(source, opts);
        payload_dispatcher dispatcher(*scanner, decoders);

        while (auto chunk = dispatcher.next()) {
            func(*chunk);
        }
        return scanner->master();
    }

    template<typename Func>
    master_header for_each_decoded_chunk(byte_source& source, const decoder_registry& decoders, Func func) {
        return for_each_decoded_chunk(source, decoders, func, scan_options{});
    }

} // namespace raff
