/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the pngme library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngme-specific error with a single catch block.
     */
    class pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when file access, reading, writing, or seeking operations fail.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class chunk_type_error
     * @brief Exception for invalid chunk type tags
     *
     * Thrown when four candidate bytes are not all ASCII letters, or when
     * a textual label is shorter than four bytes.
     */
    class chunk_type_error : public pngme_error {
    public:
        explicit chunk_type_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class chunk_error
     * @brief Exception for malformed chunk records
     *
     * Thrown when a buffer is too short for the declared layout, the
     * embedded type tag is invalid, the CRC does not match, or the
     * payload is requested as text but is not valid UTF-8.
     */
    class chunk_error : public pngme_error {
    public:
        explicit chunk_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class png_error
     * @brief Exception for container level errors
     *
     * Thrown on a bad file signature, a missing chunk on removal, or
     * structural violations detected in strict mode.
     */
    class png_error : public pngme_error {
    public:
        explicit png_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
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
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_CHUNK_TYPE(...) \
        throw ::pngme::chunk_type_error(::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_CHUNK(...) \
        throw ::pngme::chunk_error(::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_PNG(...) \
        throw ::pngme::png_error(::pngme::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_CHUNK_TYPE_IF(condition, ...) \
        do { if (condition) THROW_CHUNK_TYPE(__VA_ARGS__); } while(0)

    #define THROW_CHUNK_IF(condition, ...) \
        do { if (condition) THROW_CHUNK(__VA_ARGS__); } while(0)

    #define THROW_PNG_IF(condition, ...) \
        do { if (condition) THROW_PNG(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_CHUNK_TYPE_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_CHUNK_TYPE(__VA_ARGS__); } while(0)

    #define THROW_CHUNK_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_CHUNK(__VA_ARGS__); } while(0)

    #define THROW_PNG_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_PNG(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
