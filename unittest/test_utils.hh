#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include <raff/byte_order.hh>
#include <raff/byte_source.hh>
#include <raff/chunk_record.hh>
#include <raff/chunk_scanner.hh>
#include <raff/guid.hh>
#include <raff/scan_options.hh>

using bytes = std::vector<std::byte>;

inline void put_u32(bytes& out, std::uint32_t v, raff::byte_order bo) {
    for (int i = 0; i < 4; i++) {
        int shift = bo == raff::byte_order::big ? (3 - i) * 8 : i * 8;
        out.push_back(static_cast<std::byte>((v >> shift) & 0xFF));
    }
}

inline void put_u64(bytes& out, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<std::byte>((v >> (i * 8)) & 0xFF));
    }
}

inline void put_id(bytes& out, std::string_view id) {
    for (std::size_t i = 0; i < 4; i++) {
        out.push_back(static_cast<std::byte>(i < id.size() ? id[i] : ' '));
    }
}

inline void put_bytes(bytes& out, const bytes& data) {
    out.insert(out.end(), data.begin(), data.end());
}

inline void put_guid(bytes& out, const raff::guid& g) {
    out.insert(out.end(), g.bytes.begin(), g.bytes.end());
}

// n bytes counting up from start
inline bytes filler(std::size_t n, unsigned start = 0) {
    bytes data(n);
    for (std::size_t i = 0; i < n; i++) {
        data[i] = static_cast<std::byte>((start + i) & 0xFF);
    }
    return data;
}

// id + size + payload, plus a pad byte for odd sizes when pad is set
inline void put_chunk(bytes& out, std::string_view id, const bytes& payload,
                      raff::byte_order bo, bool pad = true) {
    put_id(out, id);
    put_u32(out, static_cast<std::uint32_t>(payload.size()), bo);
    put_bytes(out, payload);
    if (pad && (payload.size() & 1)) {
        out.push_back(std::byte{0});
    }
}

// Master header with the size computed from body
inline bytes make_container(std::string_view master, std::string_view type,
                            raff::byte_order bo, const bytes& body) {
    bytes out;
    put_id(out, master);
    put_u32(out, static_cast<std::uint32_t>(4 + body.size()), bo);
    put_id(out, type);
    put_bytes(out, body);
    return out;
}

// Wave64 chunk: GUID + 64-bit size including the header, padded to 8 bytes
inline void put_w64_chunk(bytes& out, const raff::guid& g, const bytes& payload, bool pad = true) {
    put_guid(out, g);
    put_u64(out, 24 + payload.size());
    put_bytes(out, payload);
    if (pad) {
        while (out.size() % 8) {
            out.push_back(std::byte{0});
        }
    }
}

inline bytes make_wave64(const bytes& body) {
    bytes out;
    put_guid(out, raff::wave64::riff_guid());
    put_u64(out, 40 + body.size());
    put_guid(out, raff::wave64::wave_guid());
    put_bytes(out, body);
    return out;
}

inline std::unique_ptr<raff::byte_source> memory(const bytes& data) {
    return raff::byte_source::from_buffer(data);
}

inline std::vector<raff::chunk_record> scan_all(raff::byte_source& src,
                                                const raff::scan_options& opts = {}) {
    auto scanner = raff::chunk_scanner::create(src, opts);
    std::vector<raff::chunk_record> out;
    while (auto chunk = scanner->next()) {
        out.push_back(std::move(*chunk));
    }
    return out;
}

inline std::vector<raff::chunk_record> scan_all(const bytes& data, const raff::scan_options& opts = {}) {
    auto src = memory(data);
    return scan_all(*src, opts);
}

// Stream buffer that refuses to report or change its position, like a pipe
class sequential_streambuf : public std::streambuf {
public:
    explicit sequential_streambuf(const bytes& data)
        : m_data(reinterpret_cast<const char*>(data.data()), data.size()) {
        char* base = m_data.data();
        setg(base, base, base + m_data.size());
    }

protected:
    pos_type seekoff(off_type, std::ios_base::seekdir, std::ios_base::openmode) override {
        return pos_type(off_type(-1));
    }

    pos_type seekpos(pos_type, std::ios_base::openmode) override {
        return pos_type(off_type(-1));
    }

private:
    std::string m_data;
};

// Collects scan warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};
