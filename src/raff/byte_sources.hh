//
// Concrete byte_source implementations (internal)
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

#include <raff/byte_source.hh>

namespace raff {

    // Reads from a std::istream. Seekable streams skip with seekg and know
    // their length; others are consumed sequentially.
    class stream_source : public byte_source {
        public:
            explicit stream_source(std::istream& is);
            explicit stream_source(std::unique_ptr<std::istream> owned);
            ~stream_source() override = default;

            stream_source(const stream_source&) = delete;
            stream_source& operator = (const stream_source&) = delete;

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t skip(std::uint64_t n) override;
            std::uint64_t position() const override { return m_position; }
            std::optional<std::uint64_t> length() const override { return m_length; }

            [[nodiscard]] bool seekable() const { return m_length.has_value(); }

        private:
            void probe_length();
            std::uint64_t discard(std::uint64_t n);

            std::unique_ptr<std::istream> m_owned;  // Set when opened from a path
            std::istream& m_stream;
            std::uint64_t m_position = 0;           // Relative to the stream position at construction
            std::optional<std::uint64_t> m_length;
    };

    // Reads from memory, either owned or borrowed from the caller
    class memory_source : public byte_source {
        public:
            explicit memory_source(std::vector<std::byte> data);
            memory_source(const void* data, std::size_t size);
            ~memory_source() override = default;

            memory_source(const memory_source&) = delete;
            memory_source& operator = (const memory_source&) = delete;

            std::size_t read(void* dst, std::size_t size) override;
            std::uint64_t skip(std::uint64_t n) override;
            std::uint64_t position() const override { return m_position; }
            std::optional<std::uint64_t> length() const override { return m_size; }

        private:
            std::vector<std::byte> m_owned;
            const std::byte* m_data;
            std::size_t m_size;
            std::uint64_t m_position = 0;
    };
}
