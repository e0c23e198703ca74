//
// chunk_scanner factory and body handling shared by all variants
//

#include <raff/chunk_scanner.hh>
#include <raff/exceptions.hh>
#include "iff_chunk_scanner.hh"
#include "rf64_chunk_scanner.hh"
#include "wave64_chunk_scanner.hh"

#include <array>

namespace raff {

    std::unique_ptr<chunk_scanner> chunk_scanner::create(byte_source& source) {
        scan_options default_opts;
        return create(source, default_opts);
    }

    std::unique_ptr<chunk_scanner> chunk_scanner::create(byte_source& source, const scan_options& options) {
        const std::uint64_t start = source.position();

        std::array<char, 4> magic{};
        std::size_t got = source.read(magic.data(), magic.size());
        if (got != magic.size()) {
            THROW_UNRECOGNIZED("Unrecognized container at offset ", start, ": only ", got,
                               " bytes available for the master signature");
        }

        fourcc id = fourcc::from_bytes(magic.data());

        if (id == "FORM"_4cc || id == "LIST"_4cc || id == "CAT "_4cc) {
            return std::make_unique<iff_chunk_scanner>(source, options, id, byte_order::big, container_variant::iff85);
        } else if (id == "RIFX"_4cc || id == "FIRR"_4cc) {
            return std::make_unique<iff_chunk_scanner>(source, options, id, byte_order::big, container_variant::rifx);
        } else if (id == "RIFF"_4cc) {
            return std::make_unique<iff_chunk_scanner>(source, options, id, byte_order::little, container_variant::riff);
        } else if (id == "RF64"_4cc || id == "BW64"_4cc) {
            return std::make_unique<rf64_chunk_scanner>(source, options, id);
        } else if (id == "riff"_4cc) {
            return std::make_unique<wave64_chunk_scanner>(source, options);
        }

        THROW_UNRECOGNIZED("Unknown master chunk identifier ", id, " at offset ", start);
    }

    chunk_scanner::chunk_scanner(byte_source& source, const scan_options& options)
        : m_source(source)
        , m_options(options) {
    }

    std::optional<chunk_record> chunk_scanner::next() {
        if (m_ended) {
            return std::nullopt;
        }

        try {
            auto record = read_next_chunk();
            if (!record) {
                m_ended = true;
            }
            return record;
        } catch (...) {
            m_ended = true;
            throw;
        }
    }

    void chunk_scanner::warn(std::uint64_t offset, std::string_view category, const std::string& message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

    void chunk_scanner::skip_body(const chunk_record& record, std::uint64_t padding) {
        m_source.seek_forward(record.size);
        consume_padding(padding);
    }

    void chunk_scanner::read_body(chunk_record& record, std::uint64_t padding) {
        if (record.size > m_options.max_chunk_size) {
            THROW_PARSE_IF(m_options.strict,
                           "Chunk '", record.id.to_string(), "' at offset ", record.header_offset,
                           " has size ", record.size, " bytes, which exceeds maximum allowed size of ",
                           m_options.max_chunk_size, " bytes");
            warn(record.header_offset, "size_limit",
                 build_error_msg("Chunk '", record.id.to_string(), "' size ", record.size,
                                 " exceeds maximum ", m_options.max_chunk_size, ", payload not read"));
            skip_body(record, padding);
            return;
        }

        // Fail before allocating a buffer for a size the data cannot back
        auto left = m_source.remaining();
        THROW_TRUNCATED_IF(left && record.size > *left, record.offset,
                           "Chunk '", record.id.to_string(), "' at offset ", record.header_offset,
                           " declares ", record.size, " bytes but only ", *left, " remain");

        record.payload = m_source.read_exact(static_cast<std::size_t>(record.size));
        consume_padding(padding);
    }

    void chunk_scanner::consume_padding(std::uint64_t padding) {
        if (padding == 0) {
            return;
        }

        // Writers often omit the final pad byte; only the end of data may cut it short
        const std::uint64_t at = m_source.position();
        const std::uint64_t skipped = m_source.skip(padding);
        if (skipped != padding) {
            warn(at, "missing_padding",
                 build_error_msg("Expected ", padding, " padding byte(s) at offset ", at,
                                 ", data ends after ", skipped));
        }
    }

} // namespace raff
