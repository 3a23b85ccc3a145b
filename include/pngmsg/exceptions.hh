/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngmsg library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace pngmsg {

    /**
     * @class pngmsg_error
     * @brief Base exception class for all library errors
     *
     * All pngmsg exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class pngmsg_error : public std::runtime_error {
    public:
        explicit pngmsg_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a file cannot be opened, read or written.
     */
    class io_error : public pngmsg_error {
    public:
        explicit io_error(const std::string& msg)
            : pngmsg_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for format errors
     *
     * Thrown when the data is not a well formed PNG chunk stream.
     * More specific failures derive from this class.
     */
    class parse_error : public pngmsg_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngmsg_error(msg) {}
    };

    /**
     * @class bad_signature_error
     * @brief The buffer does not start with the PNG signature
     */
    class bad_signature_error : public parse_error {
    public:
        explicit bad_signature_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class too_short_error
     * @brief The buffer ends inside a chunk record
     */
    class too_short_error : public parse_error {
    public:
        explicit too_short_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class checksum_mismatch_error
     * @brief Stored CRC does not match the CRC computed over type and payload
     */
    class checksum_mismatch_error : public parse_error {
    public:
        checksum_mismatch_error(const std::string& msg, std::uint32_t expected, std::uint32_t actual)
            : parse_error(msg), m_expected(expected), m_actual(actual) {}

        /// CRC stored in the chunk
        [[nodiscard]] std::uint32_t expected() const noexcept { return m_expected; }
        /// CRC computed from the chunk contents
        [[nodiscard]] std::uint32_t actual() const noexcept { return m_actual; }

    private:
        std::uint32_t m_expected;
        std::uint32_t m_actual;
    };

    /**
     * @class invalid_type_code_error
     * @brief Chunk type code is not four ASCII letters
     */
    class invalid_type_code_error : public parse_error {
    public:
        enum class reason_t {
            invalid_length,
            non_alphabetic
        };

        invalid_type_code_error(const std::string& msg, reason_t reason)
            : parse_error(msg), m_reason(reason) {}

        [[nodiscard]] reason_t reason() const noexcept { return m_reason; }

    private:
        reason_t m_reason;
    };

    /**
     * @class not_found_error
     * @brief Requested chunk type is not present in the file
     */
    class not_found_error : public pngmsg_error {
    public:
        explicit not_found_error(const std::string& msg)
            : pngmsg_error(msg) {}
    };

    /**
     * @class encoding_error
     * @brief Chunk payload is not valid UTF-8 text
     */
    class encoding_error : public pngmsg_error {
    public:
        explicit encoding_error(const std::string& msg)
            : pngmsg_error(msg) {}
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

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngmsg::io_error(::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with formatted message
     */
    #define THROW_PARSE(...) \
        throw ::pngmsg::parse_error(::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_TOO_SHORT
     * @brief Throw a too_short_error with formatted message
     */
    #define THROW_TOO_SHORT(...) \
        throw ::pngmsg::too_short_error(::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_NOT_FOUND
     * @brief Throw a not_found_error with formatted message
     */
    #define THROW_NOT_FOUND(...) \
        throw ::pngmsg::not_found_error(::pngmsg::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_TOO_SHORT_IF
     * @brief Conditionally throw a too_short_error
     */
    #define THROW_TOO_SHORT_IF(condition, ...) \
        do { if (condition) THROW_TOO_SHORT(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngmsg
