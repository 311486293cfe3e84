//
// PNG container parsing, editing and serialization
//

#include <algorithm>
#include <ostream>
#include <utility>

#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include "input.hh"

namespace pngme {

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        // Declared lengths above the configured limit
        void check_size_limit(std::uint32_t declared, std::uint64_t offset, std::size_t index,
                              const parse_options& options) {
            if (declared <= options.max_chunk_size) {
                return;
            }
            if (options.strict) {
                throw png_error(
                    build_error_msg("Chunk ", index, " at offset ", offset, " declares ", declared,
                                    " bytes, which exceeds maximum allowed size of ",
                                    options.max_chunk_size, " bytes"),
                    index, offset, chunk_error::reason::length_mismatch);
            }
            warn(options, offset, "size_limit",
                 build_error_msg("Chunk ", index, " size ", declared, " exceeds maximum ",
                                 options.max_chunk_size));
        }
    }

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const std::uint8_t* data, std::size_t size, const parse_options& options) {
        if (size < standard_header.size() || !std::equal(standard_header.begin(), standard_header.end(), data)) {
            throw png_error(png_error::reason::bad_signature,
                            "Stream does not start with the PNG signature");
        }

        reader in(data, size);
        in.seek(standard_header.size(), reader::set);

        png result;
        bool seen_iend = false;

        while (in.remaining() > 0) {
            const std::size_t index = result.m_chunks.size();
            const std::uint64_t offset = in.tell();

            // A frame spans 12 + length bytes; anything shorter than a length
            // field is handed over as is and reported as incomplete
            std::size_t span = in.remaining();
            if (span >= 4) {
                auto declared = in.peek<std::uint32_t>(byte_order::big);
                check_size_limit(declared, offset, index, options);
                span = static_cast<std::size_t>(
                    std::min<std::uint64_t>(span, std::uint64_t(declared) + chunk::min_size));
            }

            try {
                result.m_chunks.push_back(chunk::parse(in.current(), span));
            } catch (const chunk_error& e) {
                throw png_error(
                    build_error_msg("Failed to parse chunk ", index, " at offset ", offset, ": ", e.what()),
                    index, offset, e.why());
            }
            in.seek(span, reader::cur);

            const chunk& c = result.m_chunks.back();
            if (!c.type().is_reserved_bit_valid()) {
                warn(options, offset, "reserved_bit",
                     build_error_msg("Chunk type ", c.type(), " has the reserved bit set"));
            }
            if (seen_iend) {
                warn(options, offset, "after_iend",
                     build_error_msg("Chunk ", c.type(), " follows IEND"));
            }
            if (c.type().to_string_view() == chunk_id::IEND) {
                seen_iend = true;
            }
        }

        if (!seen_iend) {
            warn(options, size, "missing_iend", "Stream has no IEND chunk");
        }
        return result;
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string_view() == type;
        });
        return it != m_chunks.end() ? &*it : nullptr;
    }

    chunk png::remove_first_chunk(std::string_view type) {
        auto it = std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string_view() == type;
        });
        if (it == m_chunks.end()) {
            throw png_error(png_error::reason::chunk_not_found,
                            build_error_msg("Chunk type ", type, " not found"));
        }
        chunk removed = std::move(*it);
        m_chunks.erase(it);
        return removed;
    }

    std::vector<std::uint8_t> png::to_bytes() const {
        std::size_t total = m_header.size();
        for (const auto& c : m_chunks) {
            total += chunk::min_size + c.data().size();
        }

        writer out(total);
        out.write(m_header.data(), m_header.size());
        for (const auto& c : m_chunks) {
            auto bytes = c.to_bytes();
            out.write(bytes.data(), bytes.size());
        }
        return out.finish();
    }

    std::ostream& operator<<(std::ostream& os, const png& p) {
        os << "PNG {\n  header: [";
        const auto& header = p.header();
        for (std::size_t i = 0; i < header.size(); i++) {
            os << (i ? ", " : "") << static_cast<unsigned>(header[i]);
        }
        os << "]\n  chunks: " << p.chunks().size() << "\n";
        for (const auto& c : p.chunks()) {
            os << "    " << c << "\n";
        }
        os << "}";
        return os;
    }

} // namespace pngme
