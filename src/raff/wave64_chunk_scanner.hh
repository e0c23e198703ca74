//
// Sony Wave64: GUID chunk ids, 64-bit sizes including the header, 8-byte alignment
//

#pragma once

#include <raff/chunk_scanner.hh>

namespace raff {

    class wave64_chunk_scanner : public chunk_scanner {
    public:
        // The leading "riff" bytes of the master GUID have already been consumed
        wave64_chunk_scanner(byte_source& source, const scan_options& options);
        ~wave64_chunk_scanner() override = default;

    protected:
        std::optional<chunk_record> read_next_chunk() override;

    private:
        std::uint64_t m_container_end = 0;
    };

} // namespace raff
