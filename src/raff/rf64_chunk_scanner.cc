//
// ds64 parsing and 64-bit size resolution for RF64/BW64
//

#include "rf64_chunk_scanner.hh"
#include <raff/exceptions.hh>

#include <limits>

namespace raff {

    static constexpr auto DS64 = "ds64"_4cc;
    static constexpr auto DATA = "data"_4cc;
    static constexpr std::uint32_t SIZE_MARKER = 0xFFFFFFFF;
    static constexpr std::uint64_t MAX_OFFSET = std::numeric_limits<std::uint64_t>::max();

    rf64_chunk_scanner::rf64_chunk_scanner(byte_source& source, const scan_options& options, fourcc magic)
        : iff_chunk_scanner(source, options, magic, byte_order::little, container_variant::rf64) {
        // A 32-bit master size with no room for a chunk header leaves nothing to
        // look ahead at; the regular loop handles the end of the container
        if (m_master.size != SIZE_MARKER && m_source.position() + 8 > m_cursor.container_end) {
            return;
        }

        // ds64 should come directly after the master header
        raw_header first;
        const bool has_first = read_header(first);

        if (has_first && first.id == DS64) {
            parse_ds64(first);
            return;
        }

        THROW_PARSE_IF(m_master.size == SIZE_MARKER,
                       "Expected 'ds64' chunk after ", magic, " header at offset ",
                       m_cursor.master_offset + 12, ", found ",
                       has_first ? "'" + first.id.to_string() + "'" : std::string("end of data"));

        if (has_first) {
            m_cursor.pending = first;
        }
    }

    void rf64_chunk_scanner::parse_ds64(const raw_header& header) {
        // ds64 must hold at least riff_size, data_size and sample_count
        const std::uint64_t size = header.size;
        THROW_PARSE_IF(size < 24,
                       "Invalid ds64 chunk at offset ", header.offset, ": size ", size,
                       " bytes is too small (minimum 24 bytes required)");

        // ds64 fields are always little-endian
        rf64_sizes sizes;
        sizes.riff_size = m_source.read<std::uint64_t>(byte_order::little);
        sizes.data_size = m_source.read<std::uint64_t>(byte_order::little);
        sizes.sample_count = m_source.read<std::uint64_t>(byte_order::little);
        std::uint64_t consumed = 24;

        if (size >= 28) {
            auto table_count = m_source.read<std::uint32_t>(byte_order::little);
            consumed += 4;

            // Each table entry is a fourcc followed by an 8-byte size
            const std::uint64_t expected = 28 + std::uint64_t(table_count) * 12;
            THROW_PARSE_IF(size < expected,
                           "Invalid ds64 chunk at offset ", header.offset, ": claims ", table_count,
                           " table entries requiring ", expected, " bytes, but chunk size is only ",
                           size, " bytes");

            for (std::uint32_t i = 0; i < table_count; i++) {
                fourcc id = m_source.read_fourcc();
                auto chunk_size = m_source.read<std::uint64_t>(byte_order::little);
                sizes.table.emplace_back(id, chunk_size);

                if (id == DATA && sizes.data_size == 0) {
                    sizes.data_size = chunk_size;
                }
            }
            consumed += std::uint64_t(table_count) * 12;
        }

        m_source.seek_forward(size - consumed);
        consume_padding(size & 1);

        if (m_master.size == SIZE_MARKER) {
            m_master.size = sizes.riff_size;
            const std::uint64_t header_end = m_cursor.master_offset + 8;
            set_container_end(sizes.riff_size > MAX_OFFSET - header_end
                                  ? MAX_OFFSET : header_end + sizes.riff_size);
        }
        m_master.rf64 = std::move(sizes);
    }

    std::uint64_t rf64_chunk_scanner::resolve_size(const fourcc& id, std::uint32_t raw_size, std::uint64_t header_offset) {
        if (raw_size != SIZE_MARKER || !m_master.rf64) {
            return raw_size;
        }

        const auto& sizes = *m_master.rf64;
        if (id == DATA && sizes.data_size > 0) {
            return sizes.data_size;
        }

        // The n-th chunk with a given id takes the n-th table entry for that id
        std::size_t& index = m_override_index[id];
        std::size_t seen = 0;
        for (const auto& [entry_id, entry_size] : sizes.table) {
            if (entry_id != id) {
                continue;
            }
            if (seen++ == index) {
                index++;
                return entry_size;
            }
        }

        warn(header_offset, "unresolved_size",
             build_error_msg("Chunk '", id.to_string(), "' at offset ", header_offset,
                             " has size 0xFFFFFFFF and no ds64 entry"));
        return raw_size;
    }

} // namespace raff
