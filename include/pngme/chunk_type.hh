/**
 * @file chunk_type.hh
 * @brief Four letter PNG chunk type code
 *
 * The letter case of each of the four bytes encodes one property of the
 * chunk (bit 5 of the byte, mask 0x20):
 *
 * | byte | bit clear              | bit set                |
 * |------|------------------------|------------------------|
 * | 0    | critical               | ancillary              |
 * | 1    | public                 | private                |
 * | 2    | reserved bit valid     | reserved bit invalid   |
 * | 3    | unsafe to copy         | safe to copy           |
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <string_view>

#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class chunk_type
     * @brief Immutable, validated chunk type code
     *
     * All four bytes are guaranteed to be ASCII letters. Instances are only
     * produced by the from_bytes() / from_string() factories which throw
     * chunk_type_error on invalid input.
     */
    class PNGME_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        /**
         * @brief Construct from 4 raw bytes
         * @throws chunk_type_error (invalid_type_code) if a byte is not an ASCII letter
         */
        static chunk_type from_bytes(const bytes_type& bytes);

        /**
         * @brief Construct from 4 raw bytes at @p data
         * @throws chunk_type_error (invalid_type_code) if a byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data);

        /**
         * @brief Construct from the textual form, e.g. "IHDR"
         * @throws chunk_type_error (invalid_length) if @p text is not exactly 4 bytes,
         *         (invalid_type_code) if a byte is not an ASCII letter
         */
        static chunk_type from_string(std::string_view text);

        [[nodiscard]] const bytes_type& bytes() const { return m_bytes; }

        // Property predicates, one per byte position
        [[nodiscard]] bool is_critical() const;
        [[nodiscard]] bool is_public() const;
        [[nodiscard]] bool is_reserved_bit_valid() const;
        [[nodiscard]] bool is_safe_to_copy() const;

        // Advisory only: true iff the reserved bit is clear
        [[nodiscard]] bool is_valid() const;

        // Convert to string, letter case preserved
        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {reinterpret_cast<const char*>(m_bytes.data()), 4};
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }

        // Stream output as quoted string: 'IHDR'
        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os << '\'' << t.to_string_view() << '\'';
        }

    private:
        explicit chunk_type(const bytes_type& bytes) : m_bytes(bytes) {}

        bytes_type m_bytes;
    };

    /// Well known chunk types
    namespace chunk_id {
        inline constexpr std::string_view IHDR = "IHDR";
        inline constexpr std::string_view IEND = "IEND";
    }

} // namespace pngme
