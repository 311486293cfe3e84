/**
 * @file chunk.hh
 * @brief A single length prefixed, checksummed PNG chunk
 *
 * Wire layout, all integers big-endian:
 *
 * | length | type    | data         | crc     |
 * |--------|---------|--------------|---------|
 * | 4      | 4       | length bytes | 4       |
 *
 * The crc covers type ++ data.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngme/chunk_type.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class chunk
     * @brief Chunk type, owned payload and the crc computed over both
     *
     * The crc is always derived from the type and data at construction;
     * it cannot be set independently.
     */
    class PNGME_EXPORT chunk {
    public:
        /// length (4) + type (4) + data (0) + crc (4)
        static constexpr std::size_t min_size = 12;

        /**
         * @brief Create a chunk, computing its crc
         * @param type Chunk type code
         * @param data Payload, may be empty
         */
        chunk(chunk_type type, std::vector<std::uint8_t> data);

        /**
         * @brief Decode exactly one chunk frame
         *
         * The whole range is taken to be a single frame: the declared length
         * must equal @p size - 12.
         *
         * @throws chunk_error with reason incomplete, length_mismatch,
         *         invalid_type_code or checksum_mismatch
         */
        static chunk parse(const std::uint8_t* data, std::size_t size);

        static chunk parse(const std::vector<std::uint8_t>& bytes) {
            return parse(bytes.data(), bytes.size());
        }

        /// Payload size in bytes
        [[nodiscard]] std::uint32_t length() const;

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::uint8_t>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Payload interpreted as UTF-8 text
         * @throws chunk_error (invalid_encoding) if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /// Full wire encoding, the exact inverse of parse()
        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_data == o.m_data && m_crc == o.m_crc;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::uint8_t> m_data;
        std::uint32_t m_crc;
    };

    /// Diagnostic form: { length:   42 type: RuSt, data: ..., crc 2882656334 }
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngme
