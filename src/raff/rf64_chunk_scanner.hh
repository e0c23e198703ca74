//
// RF64/BW64: RIFF with 64-bit sizes stored in a leading ds64 chunk
//

#pragma once

#include <unordered_map>
#include "iff_chunk_scanner.hh"

namespace raff {

    class rf64_chunk_scanner : public iff_chunk_scanner {
    public:
        rf64_chunk_scanner(byte_source& source, const scan_options& options, fourcc magic);
        ~rf64_chunk_scanner() override = default;

    protected:
        std::uint64_t resolve_size(const fourcc& id, std::uint32_t raw_size, std::uint64_t header_offset) override;

    private:
        void parse_ds64(const raw_header& header);

        // Table entries already used per chunk id
        std::unordered_map<fourcc, std::size_t> m_override_index;
    };

} // namespace raff
