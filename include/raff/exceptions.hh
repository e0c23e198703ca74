/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for libraff
 *
 * Every fatal condition in the library is reported by one of these
 * exceptions. Recoverable conditions go through scan_options::on_warning
 * instead.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace raff {

    /**
     * @class raff_error
     * @brief Base exception class for all libraff errors
     */
    class raff_error : public std::runtime_error {
    public:
        explicit raff_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief A file could not be opened or a stream failed
     */
    class io_error : public raff_error {
    public:
        explicit io_error(const std::string& msg)
            : raff_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief The container structure is malformed
     */
    class parse_error : public raff_error {
    public:
        explicit parse_error(const std::string& msg)
            : raff_error(msg) {}
    };

    /**
     * @class truncated_error
     * @brief Fewer bytes are available than a header or payload requires
     *
     * Raised only at positions that are not a clean end of the container,
     * e.g. in the middle of a chunk header or inside a declared payload.
     */
    class truncated_error : public parse_error {
    public:
        truncated_error(std::uint64_t offset, const std::string& msg)
            : parse_error(msg), m_offset(offset) {}

        /// Source offset at which the short read started
        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

    private:
        std::uint64_t m_offset;
    };

    /**
     * @class unrecognized_format_error
     * @brief The leading bytes match no known master signature
     */
    class unrecognized_format_error : public parse_error {
    public:
        explicit unrecognized_format_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class decode_error
     * @brief Thrown by payload decoders that reject a chunk's content
     *
     * The dispatcher turns it into a per-chunk decode_failure; it never
     * ends the scan.
     */
    class decode_error : public raff_error {
    public:
        explicit decode_error(const std::string& msg)
            : raff_error(msg) {}
    };

    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::raff::io_error(::raff::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE(...) \
        throw ::raff::parse_error(::raff::build_error_msg(__VA_ARGS__))

    #define THROW_TRUNCATED(offset, ...) \
        throw ::raff::truncated_error((offset), ::raff::build_error_msg(__VA_ARGS__))

    #define THROW_UNRECOGNIZED(...) \
        throw ::raff::unrecognized_format_error(::raff::build_error_msg(__VA_ARGS__))

    #define THROW_DECODE(...) \
        throw ::raff::decode_error(::raff::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    #define THROW_TRUNCATED_IF(condition, offset, ...) \
        do { if (condition) THROW_TRUNCATED(offset, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace raff
