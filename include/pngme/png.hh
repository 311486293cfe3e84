/**
 * @file png.hh
 * @brief PNG container: the 8 byte signature followed by a chunk sequence
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>
#include <pngme/export_pngme.h>

namespace pngme {

    /**
     * @class png
     * @brief Ordered, exclusively owned sequence of chunks behind the PNG signature
     *
     * Order is significant: lookups and removals act on the first match and
     * serialization preserves the sequence. Pixel data is never decoded and
     * chunk ordering rules (IHDR first, IEND last) are not enforced.
     */
    class PNGME_EXPORT png {
    public:
        using signature_type = std::array<std::uint8_t, 8>;

        static constexpr signature_type standard_header = {
            0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
        };

        /// Signature and no chunks
        png() = default;

        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete in-memory PNG stream
         *
         * @param data Stream bytes
         * @param size Number of bytes
         * @param options Parse options for size limits and warning handling
         * @throws png_error with reason bad_signature, or chunk_parse_failed
         *         naming the index of the chunk that failed
         */
        static png parse(const std::uint8_t* data, std::size_t size, const parse_options& options);

        static png parse(const std::uint8_t* data, std::size_t size) {
            return parse(data, size, parse_options{});
        }

        static png parse(const std::vector<std::uint8_t>& bytes, const parse_options& options) {
            return parse(bytes.data(), bytes.size(), options);
        }

        static png parse(const std::vector<std::uint8_t>& bytes) {
            return parse(bytes.data(), bytes.size(), parse_options{});
        }

        /// Insert at the end of the sequence
        void append_chunk(chunk c);

        /**
         * @brief First chunk whose type text equals @p type
         * @return Pointer into the sequence, nullptr if there is no match.
         *         Invalidated by append_chunk() and remove_first_chunk().
         */
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        /**
         * @brief Remove and return the first chunk whose type text equals @p type
         * @throws png_error (chunk_not_found) if there is no match
         */
        chunk remove_first_chunk(std::string_view type);

        [[nodiscard]] const signature_type& header() const { return m_header; }
        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }

        /// Signature followed by every chunk's encoding, the exact inverse of parse()
        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        bool operator==(const png& o) const {
            return m_header == o.m_header && m_chunks == o.m_chunks;
        }
        bool operator!=(const png& o) const { return !(*this == o); }

    private:
        signature_type m_header = standard_header;
        std::vector<chunk> m_chunks;
    };

    /// Diagnostic listing of the signature and every chunk
    PNGME_EXPORT std::ostream& operator<<(std::ostream& os, const png& p);

} // namespace pngme
