/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 *
 * Every failure of the library is reported as an exception derived from
 * pngchunk_error. Parse failures never leave a partially built container
 * behind.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

#include <pngchunk/chunk_tag.hh>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Stream read/write failure in the I/O helpers
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class format_error
     * @brief The buffer violates the container layout
     *
     * Thrown for a missing signature or terminator, truncated chunks,
     * oversized chunks and malformed header payloads. The chunk specific
     * errors below derive from it, so a single catch handles every
     * structural problem.
     */
    class format_error : public pngchunk_error {
    public:
        explicit format_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class chunk_error
     * @brief Structural error tied to one chunk type
     */
    class chunk_error : public format_error {
    public:
        chunk_error(const std::string& msg, chunk_tag tag)
            : format_error(msg), m_tag(tag) {}

        /// Type of the chunk the error is about
        [[nodiscard]] chunk_tag tag() const { return m_tag; }

    private:
        chunk_tag m_tag;
    };

    /// Tag outside both the critical and the ancillary set
    class unknown_chunk_error : public chunk_error {
    public:
        using chunk_error::chunk_error;
    };

    /// Second occurrence of a critical type that may appear only once
    class duplicate_chunk_error : public chunk_error {
    public:
        using chunk_error::chunk_error;
    };

    /// A mandatory chunk (IHDR, IDAT, IEND, or PLTE for indexed color) is absent
    class missing_chunk_error : public chunk_error {
    public:
        using chunk_error::chunk_error;
    };

    /**
     * @class unsupported_feature_error
     * @brief Recognized but unimplemented encoding (grayscale color types)
     */
    class unsupported_feature_error : public pngchunk_error {
    public:
        explicit unsupported_feature_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class bounds_error
     * @brief Index or byte window outside the addressed chunk or payload
     *
     * The container is left untouched when this is thrown.
     */
    class bounds_error : public pngchunk_error {
    public:
        explicit bounds_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
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
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_FORMAT(...) \
        throw ::pngchunk::format_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_BOUNDS(...) \
        throw ::pngchunk::bounds_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_UNSUPPORTED(...) \
        throw ::pngchunk::unsupported_feature_error(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK
     * @brief Throw one of the chunk_error subclasses for a given tag
     * @param type Exception class (unknown_chunk_error, ...)
     * @param tag Offending chunk tag
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK(type, tag, ...) \
        throw ::pngchunk::type(::pngchunk::build_error_msg(__VA_ARGS__), (tag))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_FORMAT_IF(condition, ...) \
        do { if (condition) THROW_FORMAT(__VA_ARGS__); } while(0)

    #define THROW_BOUNDS_IF(condition, ...) \
        do { if (condition) THROW_BOUNDS(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_FORMAT_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_FORMAT(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
