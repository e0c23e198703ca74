//
// byte_source factories, shared helpers and the stream/memory sources
//

#include <algorithm>
#include <array>
#include <fstream>
#include <istream>
#include <system_error>

#include "byte_sources.hh"

namespace raff {
    // byte_source implementation
    std::unique_ptr<byte_source> byte_source::from_stream(std::istream& is) {
        return std::make_unique<stream_source>(is);
    }

    std::unique_ptr<byte_source> byte_source::from_buffer(std::vector<std::byte> data) {
        return std::make_unique<memory_source>(std::move(data));
    }

    std::unique_ptr<byte_source> byte_source::from_memory(const void* data, std::size_t size) {
        THROW_IO_IF(!data && size > 0, "Null buffer passed to byte_source::from_memory");
        return std::make_unique<memory_source>(data, size);
    }

    std::unique_ptr<byte_source> byte_source::open(const std::filesystem::path& path) {
        std::error_code ec;
        THROW_IO_UNLESS(std::filesystem::is_regular_file(path, ec),
                        "Cannot open '", path.string(), "': not a regular file");

        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        THROW_IO_UNLESS(file->is_open(), "Cannot open '", path.string(), "' for reading");
        return std::make_unique<stream_source>(std::move(file));
    }

    void byte_source::seek_forward(std::uint64_t n) {
        const std::uint64_t start = position();
        const std::uint64_t skipped = skip(n);
        THROW_TRUNCATED_IF(skipped != n, start,
                           "Cannot skip ", n, " bytes at offset ", start,
                           ": only ", skipped, " available");
    }

    std::vector<std::byte> byte_source::read_exact(std::size_t size) {
        const std::uint64_t start = position();
        std::vector<std::byte> buffer;
        std::size_t actual = 0;

        auto left = remaining();
        if (left && *left >= size) {
            buffer.resize(size);
            actual = size > 0 ? read(buffer.data(), size) : 0;
        } else {
            // Unknown or short length: grow with the data instead of trusting the size
            constexpr std::size_t block_size = 64 * 1024;
            while (actual < size) {
                const std::size_t want = std::min(block_size, size - actual);
                buffer.resize(actual + want);
                const std::size_t got = read(buffer.data() + actual, want);
                actual += got;
                if (got < want) {
                    break;
                }
            }
            buffer.resize(actual);
        }

        THROW_TRUNCATED_IF(actual != size, start,
                           "Unexpected end of data at offset ", start,
                           ": requested ", size, " bytes, got ", actual);
        return buffer;
    }

    fourcc byte_source::read_fourcc() {
        std::array<char, 4> data;
        const std::uint64_t start = position();
        std::size_t actual = read(data.data(), data.size());
        THROW_TRUNCATED_IF(actual != data.size(), start, "Failed to read FourCC at offset ", start);
        return fourcc::from_bytes(data.data());
    }

    guid byte_source::read_guid() {
        std::array<std::byte, 16> data;
        const std::uint64_t start = position();
        std::size_t actual = read(data.data(), data.size());
        THROW_TRUNCATED_IF(actual != data.size(), start, "Failed to read GUID at offset ", start);
        return guid::from_bytes(data.data());
    }

    std::optional<std::uint64_t> byte_source::remaining() const {
        auto len = length();
        if (!len) {
            return std::nullopt;
        }
        auto pos = position();
        return pos < *len ? *len - pos : 0;
    }

    // stream_source implementation
    stream_source::stream_source(std::istream& is)
        : m_stream(is) {
        probe_length();
    }

    stream_source::stream_source(std::unique_ptr<std::istream> owned)
        : m_owned(std::move(owned))
        , m_stream(*m_owned) {
        probe_length();
    }

    void stream_source::probe_length() {
        std::streampos origin = m_stream.tellg();
        if (origin == std::streampos(-1)) {
            // Pipes and other unseekable streams
            m_stream.clear(m_stream.rdstate() & ~std::ios::failbit);
            return;
        }

        m_stream.seekg(0, std::ios::end);
        std::streampos end = m_stream.tellg();
        m_stream.seekg(origin);

        if (end == std::streampos(-1) || m_stream.fail()) {
            m_stream.clear();
            m_stream.seekg(origin);
            m_stream.clear();
            return;
        }

        m_length = end > origin ? static_cast<std::uint64_t>(end - origin) : 0;
    }

    std::size_t stream_source::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0 || m_stream.eof()) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state at offset ", m_position);

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        auto bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed at offset ", m_position);
        m_position += bytes_read;
        return bytes_read;
    }

    std::uint64_t stream_source::skip(std::uint64_t n) {
        if (n == 0) {
            return 0;
        }

        if (!m_length) {
            return discard(n);
        }

        std::uint64_t available = *m_length > m_position ? *m_length - m_position : 0;
        std::uint64_t step = std::min(n, available);
        if (step == 0) {
            return 0;
        }

        m_stream.seekg(static_cast<std::streamoff>(step), std::ios_base::cur);
        THROW_IO_IF(m_stream.fail(), "Cannot seek ", step, " bytes forward from offset ", m_position);
        m_position += step;
        return step;
    }

    std::uint64_t stream_source::discard(std::uint64_t n) {
        std::array<char, 4096> scratch;
        std::uint64_t total = 0;

        while (total < n) {
            auto want = static_cast<std::size_t>(std::min<std::uint64_t>(n - total, scratch.size()));
            std::size_t got = read(scratch.data(), want);
            total += got;
            if (got < want) {
                break;
            }
        }
        return total;
    }

    // memory_source implementation
    memory_source::memory_source(std::vector<std::byte> data)
        : m_owned(std::move(data))
        , m_data(m_owned.data())
        , m_size(m_owned.size()) {}

    memory_source::memory_source(const void* data, std::size_t size)
        : m_data(static_cast<const std::byte*>(data))
        , m_size(size) {}

    std::size_t memory_source::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst || size == 0, "Null buffer in read");

        std::uint64_t available = m_size - m_position;
        auto to_read = static_cast<std::size_t>(std::min<std::uint64_t>(size, available));
        if (to_read > 0) {
            std::memcpy(dst, m_data + m_position, to_read);
            m_position += to_read;
        }
        return to_read;
    }

    std::uint64_t memory_source::skip(std::uint64_t n) {
        std::uint64_t step = std::min<std::uint64_t>(n, m_size - m_position);
        m_position += step;
        return step;
    }
}
