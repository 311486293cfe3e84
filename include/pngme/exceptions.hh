/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 *
 * Every failure of the library is reported as an exception derived from
 * pngme_error. Each component owns one closed enumeration of failure
 * reasons so callers can react to the exact cause without parsing messages.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all library errors
     *
     * Catching pngme_error catches every error the library throws.
     */
    class PNGME_EXPORT pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when a file cannot be opened, read or written.
     */
    class PNGME_EXPORT io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class chunk_type_error
     * @brief A chunk type code could not be constructed
     */
    class PNGME_EXPORT chunk_type_error : public pngme_error {
    public:
        enum class reason {
            invalid_type_code, ///< A byte is not an ASCII letter
            invalid_length     ///< Textual type code is not exactly 4 bytes
        };

        chunk_type_error(reason r, const std::string& msg,
                         std::size_t expected = 0, std::size_t actual = 0)
            : pngme_error(msg), m_reason(r), m_expected(expected), m_actual(actual) {}

        [[nodiscard]] reason why() const noexcept { return m_reason; }
        [[nodiscard]] std::size_t expected() const noexcept { return m_expected; }
        [[nodiscard]] std::size_t actual() const noexcept { return m_actual; }

    private:
        reason m_reason;
        std::size_t m_expected;
        std::size_t m_actual;
    };

    /**
     * @class chunk_error
     * @brief A single chunk frame could not be decoded or interpreted
     *
     * For length_mismatch, expected() is the payload size implied by the
     * frame and found() is the declared length field. For checksum_mismatch,
     * expected() is the computed crc and found() the stored one.
     */
    class PNGME_EXPORT chunk_error : public pngme_error {
    public:
        enum class reason {
            incomplete,        ///< Frame shorter than the 12 byte minimum
            length_mismatch,   ///< Length field disagrees with the frame size
            invalid_type_code, ///< Type bytes are not ASCII letters
            checksum_mismatch, ///< Stored crc differs from the computed one
            invalid_encoding   ///< Payload is not valid UTF-8 text
        };

        chunk_error(reason r, const std::string& msg,
                    std::uint64_t expected = 0, std::uint64_t found = 0)
            : pngme_error(msg), m_reason(r), m_expected(expected), m_found(found) {}

        [[nodiscard]] reason why() const noexcept { return m_reason; }
        [[nodiscard]] std::uint64_t expected() const noexcept { return m_expected; }
        [[nodiscard]] std::uint64_t found() const noexcept { return m_found; }

    private:
        reason m_reason;
        std::uint64_t m_expected;
        std::uint64_t m_found;
    };

    /**
     * @class png_error
     * @brief Container level failure
     *
     * chunk_parse_failed wraps a chunk_error with the position of the chunk
     * that failed; index() and offset() are meaningful only for that reason.
     */
    class PNGME_EXPORT png_error : public pngme_error {
    public:
        enum class reason {
            bad_signature,      ///< Stream does not start with the PNG signature
            chunk_parse_failed, ///< A chunk of the sequence failed to decode
            chunk_not_found     ///< No chunk of the requested type
        };

        png_error(reason r, const std::string& msg)
            : pngme_error(msg), m_reason(r), m_index(0), m_offset(0), m_cause(chunk_error::reason::incomplete) {}

        png_error(const std::string& msg, std::size_t index, std::uint64_t offset, chunk_error::reason cause)
            : pngme_error(msg), m_reason(reason::chunk_parse_failed), m_index(index), m_offset(offset), m_cause(cause) {}

        [[nodiscard]] reason why() const noexcept { return m_reason; }
        [[nodiscard]] std::size_t index() const noexcept { return m_index; }
        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }
        [[nodiscard]] chunk_error::reason cause() const noexcept { return m_cause; }

    private:
        reason m_reason;
        std::size_t m_index;
        std::uint64_t m_offset;
        chunk_error::reason m_cause;
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
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
