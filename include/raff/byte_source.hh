/**
 * @file byte_source.hh
 * @brief Uniform forward read access over files, streams and memory
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <vector>

#include <raff/export_raff.h>
#include <raff/byte_order.hh>
#include <raff/exceptions.hh>
#include <raff/fourcc.hh>
#include <raff/guid.hh>

namespace raff {

    /**
     * @class byte_source
     * @brief Forward-only byte input used by the chunk scanners
     *
     * Positions are relative to the point where the source was created, so
     * a stream already positioned at an embedded container reports offsets
     * from the start of that container.
     */
    class RAFF_EXPORT byte_source {
        public:
            /**
             * @brief Wrap an open stream; the stream must outlive the source
             *
             * Streams that cannot report a position (pipes, stdin) are read
             * sequentially and report no length.
             */
            static std::unique_ptr<byte_source> from_stream(std::istream& is);

            /// Take ownership of an in-memory buffer
            static std::unique_ptr<byte_source> from_buffer(std::vector<std::byte> data);

            /// Borrow memory owned by the caller; it must outlive the source
            static std::unique_ptr<byte_source> from_memory(const void* data, std::size_t size);

            /**
             * @brief Open a file read-only; the file is closed with the source
             * @throws io_error if the file cannot be opened
             */
            static std::unique_ptr<byte_source> open(const std::filesystem::path& path);

        public:
            virtual ~byte_source() = default;

            /// Read up to size bytes, returns fewer only at end of data
            virtual std::size_t read(void* dst, std::size_t size) = 0;

            /// Advance up to n bytes without returning them, returns bytes skipped
            virtual std::uint64_t skip(std::uint64_t n) = 0;

            [[nodiscard]] virtual std::uint64_t position() const = 0;

            /// Total size, or nullopt when the source cannot tell
            [[nodiscard]] virtual std::optional<std::uint64_t> length() const = 0;

            /**
             * @brief Advance exactly n bytes
             * @throws truncated_error if the data ends first
             */
            void seek_forward(std::uint64_t n);

            /**
             * @brief Read exactly size bytes
             * @throws truncated_error if fewer bytes remain
             */
            std::vector<std::byte> read_exact(std::size_t size);

            template<typename T>
            T read(byte_order bo) {
                std::array<std::byte, sizeof(T)> buff;
                const std::uint64_t start = position();
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_TRUNCATED_IF(actual != sizeof(T), start,
                                   "Unexpected end of data at offset ", start, ": needed ",
                                   sizeof(T), " bytes, got ", actual);

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            fourcc read_fourcc();
            guid read_guid();

            /// Bytes left, when the length is known
            [[nodiscard]] std::optional<std::uint64_t> remaining() const;
    };

} // namespace raff
