//
// Chunk loop for the 32-bit tagged variants
//

#include "iff_chunk_scanner.hh"
#include <raff/exceptions.hh>

#include <array>
#include <cstring>

namespace raff {

    static constexpr auto FORM = "FORM"_4cc;
    static constexpr auto LIST = "LIST"_4cc;
    static constexpr auto CAT  = "CAT "_4cc;
    static constexpr auto PROP = "PROP"_4cc;

    static constexpr std::uint64_t HEADER_SIZE = 8;

    static bool is_group(const fourcc& id) {
        return id == FORM || id == LIST || id == CAT || id == PROP;
    }

    iff_chunk_scanner::iff_chunk_scanner(byte_source& source, const scan_options& options,
                                         fourcc magic, byte_order order, container_variant variant)
        : chunk_scanner(source, options) {
        m_byte_order = order;
        m_cursor.master_offset = m_source.position() - 4;

        auto size = m_source.read<std::uint32_t>(order);
        auto type = m_source.read_fourcc();

        m_master = master_header{
            .id = magic,
            .size = size,
            .type = type,
            .variant = variant
        };
        m_cursor.container_end = m_cursor.master_offset + HEADER_SIZE + size;
    }

    std::optional<chunk_record> iff_chunk_scanner::read_next_chunk() {
        for (;;) {
            leave_finished_containers();

            const std::uint64_t limit = innermost_end();
            raw_header header;

            if (m_cursor.pending) {
                header = *m_cursor.pending;
                m_cursor.pending.reset();
            } else {
                const std::uint64_t start = m_source.position();
                if (start >= limit) {
                    return std::nullopt;
                }

                if (limit - start < HEADER_SIZE) {
                    THROW_TRUNCATED_IF(m_options.strict, start,
                                       "Only ", limit - start, " bytes left at offset ", start,
                                       " before container end at offset ", limit,
                                       ", a chunk header needs ", HEADER_SIZE);
                    warn(start, "trailing_bytes",
                         build_error_msg("Ignoring ", limit - start, " trailing bytes at offset ", start));
                    if (m_cursor.frames.empty()) {
                        return std::nullopt;
                    }
                    m_source.seek_forward(limit - start);
                    continue;
                }

                if (!read_header(header)) {
                    warn(start, "short_container",
                         build_error_msg("Data ends at offset ", start, " before the declared container end at offset ",
                                         m_cursor.container_end));
                    return std::nullopt;
                }
            }

            std::uint64_t size = resolve_size(header.id, header.size, header.offset);
            const std::uint64_t payload_offset = header.offset + HEADER_SIZE;

            if (size > limit - payload_offset) {
                THROW_PARSE_IF(m_options.strict,
                               "Chunk '", header.id.to_string(), "' at offset ", header.offset,
                               " has size ", size, " and extends past its container end at offset ", limit);
                warn(header.offset, "container_overrun",
                     build_error_msg("Chunk '", header.id.to_string(), "' size ", size,
                                     " clamped to container end at offset ", limit));
                size = limit > payload_offset ? limit - payload_offset : 0;
            }

            chunk_record record;
            record.id = header.id;
            record.size = size;
            record.offset = payload_offset;
            record.header_offset = header.offset;
            record.current_form = current_form();
            record.depth = depth();

            const std::uint64_t padding = size & 1;

            if (header.id.is_null()) {
                warn(header.offset, "null_identifier",
                     build_error_msg("Skipping chunk with null identifier at offset ", header.offset));
                skip_body(record, padding);
                continue;
            }

            if (m_options.is_ignored(header.id)) {
                skip_body(record, padding);
                continue;
            }

            if (m_options.descend_containers && is_group(header.id) && enter_container(record, padding)) {
                return record;
            }

            if (is_group(header.id) && size >= 4) {
                read_group_body(record, padding);
                return record;
            }

            if (m_options.materialize_payload) {
                read_body(record, padding);
            } else {
                skip_body(record, padding);
            }
            return record;
        }
    }

    std::uint64_t iff_chunk_scanner::resolve_size(const fourcc&, std::uint32_t raw_size, std::uint64_t) {
        return raw_size;
    }

    bool iff_chunk_scanner::read_header(raw_header& out) {
        std::array<std::byte, HEADER_SIZE> buff;
        const std::uint64_t start = m_source.position();
        std::size_t got = m_source.read(buff.data(), buff.size());

        if (got == 0) {
            return false;
        }
        THROW_TRUNCATED_IF(got != buff.size(), start,
                           "Truncated chunk header at offset ", start, ": got ", got, " of ", HEADER_SIZE, " bytes");

        std::uint32_t size;
        std::memcpy(&size, buff.data() + 4, sizeof(size));
        if (!byte_order_native(m_byte_order)) {
            size = swap_byte_order(size);
        }

        out.id = fourcc::from_bytes(buff.data());
        out.size = size;
        out.offset = start;
        return true;
    }

    bool iff_chunk_scanner::enter_container(chunk_record& record, std::uint64_t padding) {
        if (record.depth >= m_options.max_depth) {
            THROW_PARSE_IF(m_options.strict,
                           "Container '", record.id.to_string(), "' at offset ", record.header_offset,
                           " would exceed maximum nesting depth of ", m_options.max_depth);
            warn(record.header_offset, "depth_limit",
                 build_error_msg("Container '", record.id.to_string(), "' would exceed maximum nesting depth ",
                                 m_options.max_depth, ", reporting it as a plain chunk"));
            return false;
        }

        if (record.size < 4) {
            THROW_PARSE_IF(m_options.strict,
                           "Container '", record.id.to_string(), "' at offset ", record.header_offset,
                           " has size ", record.size, ", too small for its type field");
            return false;
        }

        record.type = m_source.read_fourcc();
        record.is_container = true;

        m_cursor.frames.push_back(container_frame{
            .id = record.id,
            .type = *record.type,
            .end = record.offset + record.size,
            .padding = padding,
            .depth = record.depth
        });
        return true;
    }

    void iff_chunk_scanner::read_group_body(chunk_record& record, std::uint64_t padding) {
        if (m_options.materialize_payload) {
            read_body(record, padding);
            if (record.payload) {
                record.type = fourcc::from_bytes(record.payload->data());
            }
            return;
        }

        // Unentered groups still report their type
        record.type = m_source.read_fourcc();
        m_source.seek_forward(record.size - 4);
        consume_padding(padding);
    }

    void iff_chunk_scanner::leave_finished_containers() {
        while (!m_cursor.frames.empty() && m_source.position() >= m_cursor.frames.back().end) {
            const std::uint64_t padded_end = m_cursor.frames.back().end + m_cursor.frames.back().padding;
            m_cursor.frames.pop_back();

            // The last child's own pad byte may already have covered it
            const std::uint64_t pos = m_source.position();
            if (pos < padded_end) {
                consume_padding(padded_end - pos);
            }
        }
    }

    std::uint64_t iff_chunk_scanner::innermost_end() const {
        return m_cursor.frames.empty() ? m_cursor.container_end : m_cursor.frames.back().end;
    }

    std::optional<fourcc> iff_chunk_scanner::current_form() const {
        for (auto it = m_cursor.frames.rbegin(); it != m_cursor.frames.rend(); ++it) {
            if (it->id == FORM) {
                return it->type;
            }
        }
        // LIST and CAT masters carry a contents hint, not a form type
        if (m_master.id == LIST || m_master.id == CAT) {
            return std::nullopt;
        }
        return m_master.type;
    }

    int iff_chunk_scanner::depth() const {
        return m_cursor.frames.empty() ? 0 : m_cursor.frames.back().depth + 1;
    }

} // namespace raff
