//
// Scanner for containers with 4-byte ids and 32-bit sizes (IFF-85, RIFF, RIFX)
//

#pragma once

#include <raff/chunk_scanner.hh>
#include "scan_cursor.hh"

namespace raff {

    class iff_chunk_scanner : public chunk_scanner {
    public:
        // The 4-byte magic has already been consumed from source
        iff_chunk_scanner(byte_source& source, const scan_options& options,
                          fourcc magic, byte_order order, container_variant variant);
        ~iff_chunk_scanner() override = default;

    protected:
        std::optional<chunk_record> read_next_chunk() override;

        // Payload size of a chunk given its 32-bit size field
        virtual std::uint64_t resolve_size(const fourcc& id, std::uint32_t raw_size, std::uint64_t header_offset);

        // Read an 8-byte header; false when the data ends exactly here
        bool read_header(raw_header& out);

        void set_container_end(std::uint64_t end) { m_cursor.container_end = end; }

        scan_cursor m_cursor;

    private:
        bool enter_container(chunk_record& record, std::uint64_t padding);
        void read_group_body(chunk_record& record, std::uint64_t padding);
        void leave_finished_containers();

        [[nodiscard]] std::uint64_t innermost_end() const;
        [[nodiscard]] std::optional<fourcc> current_form() const;
        [[nodiscard]] int depth() const;
    };

} // namespace raff
