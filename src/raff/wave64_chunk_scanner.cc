//
// Chunk loop for Sony Wave64
//

#include "wave64_chunk_scanner.hh"
#include <raff/exceptions.hh>

#include <array>
#include <cstring>
#include <limits>

namespace raff {

    static constexpr std::uint64_t HEADER_SIZE = 24;   // GUID + 64-bit size
    static constexpr std::uint64_t MASTER_SIZE = 40;   // riff GUID + size + wave GUID
    static constexpr std::uint64_t ALIGNMENT = 8;

    wave64_chunk_scanner::wave64_chunk_scanner(byte_source& source, const scan_options& options)
        : chunk_scanner(source, options) {
        m_byte_order = byte_order::little;
        const std::uint64_t master_offset = m_source.position() - 4;

        std::array<std::byte, 16> id_bytes;
        std::memcpy(id_bytes.data(), "riff", 4);
        std::size_t got = m_source.read(id_bytes.data() + 4, 12);
        guid id_guid = guid::from_bytes(id_bytes.data());

        if (got != 12 || id_guid != wave64::riff_guid()) {
            THROW_UNRECOGNIZED("Unknown master signature at offset ", master_offset,
                               ": 'riff' is not followed by the Wave64 RIFF GUID");
        }

        // The size includes the 40-byte master header itself
        auto size = m_source.read<std::uint64_t>(byte_order::little);
        guid type_guid = m_source.read_guid();

        if (!wave64::is_known(type_guid)) {
            warn(master_offset + 24, "unknown_guid",
                 build_error_msg("Unknown Wave64 form type GUID ", type_guid.to_string()));
        }

        m_master = master_header{
            .id = wave64::to_fourcc(id_guid),
            .size = size,
            .type = wave64::to_fourcc(type_guid),
            .variant = container_variant::wave64,
            .id_guid = id_guid,
            .type_guid = type_guid
        };
        THROW_PARSE_IF(size < MASTER_SIZE,
                       "Wave64 master at offset ", master_offset, " declares size ", size,
                       ", smaller than its ", MASTER_SIZE, "-byte header");

        const std::uint64_t max_offset = std::numeric_limits<std::uint64_t>::max();
        m_container_end = size > max_offset - master_offset ? max_offset : master_offset + size;
    }

    std::optional<chunk_record> wave64_chunk_scanner::read_next_chunk() {
        for (;;) {
            const std::uint64_t start = m_source.position();
            if (start >= m_container_end) {
                return std::nullopt;
            }

            if (m_container_end - start < HEADER_SIZE) {
                THROW_TRUNCATED_IF(m_options.strict, start,
                                   "Only ", m_container_end - start, " bytes left at offset ", start,
                                   " before container end at offset ", m_container_end,
                                   ", a Wave64 chunk header needs ", HEADER_SIZE);
                warn(start, "trailing_bytes",
                     build_error_msg("Ignoring ", m_container_end - start, " trailing bytes at offset ", start));
                return std::nullopt;
            }

            std::array<std::byte, HEADER_SIZE> buff;
            std::size_t got = m_source.read(buff.data(), buff.size());
            if (got == 0) {
                warn(start, "short_container",
                     build_error_msg("Data ends at offset ", start, " before the declared container end at offset ",
                                     m_container_end));
                return std::nullopt;
            }
            THROW_TRUNCATED_IF(got != buff.size(), start,
                               "Truncated Wave64 chunk header at offset ", start, ": got ", got,
                               " of ", HEADER_SIZE, " bytes");

            guid id_guid = guid::from_bytes(buff.data());
            std::uint64_t declared;
            std::memcpy(&declared, buff.data() + 16, sizeof(declared));
            if (!byte_order_native(byte_order::little)) {
                declared = swap_byte_order(declared);
            }

            // Without a usable size there is no way to find the next chunk
            THROW_PARSE_IF(declared < HEADER_SIZE,
                           "Wave64 chunk ", id_guid.to_string(), " at offset ", start, " declares size ",
                           declared, ", smaller than its ", HEADER_SIZE, "-byte header");

            const std::uint64_t payload_offset = start + HEADER_SIZE;
            std::uint64_t size = declared - HEADER_SIZE;

            if (size > m_container_end - payload_offset) {
                THROW_PARSE_IF(m_options.strict,
                               "Wave64 chunk ", id_guid.to_string(), " at offset ", start, " has size ", size,
                               " and extends past the container end at offset ", m_container_end);
                warn(start, "container_overrun",
                     build_error_msg("Wave64 chunk ", id_guid.to_string(), " size ", size,
                                     " clamped to container end at offset ", m_container_end));
                size = m_container_end - payload_offset;
            }

            if (!wave64::is_known(id_guid)) {
                warn(start, "unknown_guid", build_error_msg("Unknown Wave64 chunk GUID ", id_guid.to_string()));
            }

            chunk_record record;
            record.id = wave64::to_fourcc(id_guid);
            record.size = size;
            record.offset = payload_offset;
            record.header_offset = start;
            record.current_form = m_master.type;
            record.uuid = id_guid;

            const std::uint64_t unaligned = (HEADER_SIZE + size) % ALIGNMENT;
            const std::uint64_t padding = unaligned ? ALIGNMENT - unaligned : 0;

            if (m_options.is_ignored(record.id)) {
                skip_body(record, padding);
                continue;
            }

            if (m_options.materialize_payload) {
                read_body(record, padding);
            } else {
                skip_body(record, padding);
            }
            return record;
        }
    }

} // namespace raff
