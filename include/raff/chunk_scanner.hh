/**
 * @file chunk_scanner.hh
 * @brief Single-pass chunk discovery over IFF-family containers
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <raff/export_raff.h>
#include <raff/byte_order.hh>
#include <raff/byte_source.hh>
#include <raff/chunk_record.hh>
#include <raff/master_header.hh>
#include <raff/scan_options.hh>

namespace raff {

    /**
     * @class chunk_scanner
     * @brief Lazy, forward-only sequence of chunk records
     *
     * The master header is parsed when the scanner is created. Each call to
     * next() reads one chunk header and either materializes or skips the
     * payload. A scanner cannot be restarted: scanning again needs a fresh
     * byte_source and a fresh scanner.
     *
     * @code
     * auto src = raff::byte_source::open("sound.wav");
     * auto scanner = raff::chunk_scanner::create(*src);
     * while (auto chunk = scanner->next()) {
     *     std::cout << chunk->id << " " << chunk->size << "\n";
     * }
     * @endcode
     */
    class RAFF_EXPORT chunk_scanner {
    public:
        /**
         * @brief Detect the container variant and create its scanner
         * @param source Source positioned at the master header; must outlive the scanner
         * @throws unrecognized_format_error if the signature is unknown
         * @throws truncated_error if the master header is incomplete
         */
        static std::unique_ptr<chunk_scanner> create(byte_source& source);

        /**
         * @brief Detect the container variant and create its scanner with custom options
         */
        static std::unique_ptr<chunk_scanner> create(byte_source& source, const scan_options& options);

        virtual ~chunk_scanner() = default;

        chunk_scanner(const chunk_scanner&) = delete;
        chunk_scanner& operator = (const chunk_scanner&) = delete;

        [[nodiscard]] const master_header& master() const { return m_master; }
        [[nodiscard]] byte_order order() const { return m_byte_order; }
        [[nodiscard]] const scan_options& options() const { return m_options; }

        /**
         * @brief Produce the next chunk record
         * @return The record, or nullopt at the clean end of the container
         * @throws truncated_error if the container ends inside a header or payload
         * @throws parse_error on other structural violations in strict mode
         *
         * After an exception or the clean end, further calls return nullopt.
         */
        std::optional<chunk_record> next();

        [[nodiscard]] bool at_end() const { return m_ended; }

    protected:
        chunk_scanner(byte_source& source, const scan_options& options);

        // Read the next record; nullopt at clean end
        virtual std::optional<chunk_record> read_next_chunk() = 0;

        void warn(std::uint64_t offset, std::string_view category, const std::string& message) const;

        // Body handling shared by all variants. The source must be positioned
        // at the first payload byte; on return it is past the padding.
        void skip_body(const chunk_record& record, std::uint64_t padding);
        void read_body(chunk_record& record, std::uint64_t padding);
        void consume_padding(std::uint64_t padding);

        byte_source& m_source;
        scan_options m_options;
        master_header m_master;
        byte_order m_byte_order = byte_order::little;
        bool m_ended = false;
    };

} // namespace raff
