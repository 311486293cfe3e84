//
// Chunk frame encoding and decoding
//

#include <iomanip>
#include <ostream>
#include <utility>

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>

#include "checksum.hh"
#include "input.hh"

namespace pngme {

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
        : m_type(type)
        , m_data(std::move(data))
        , m_crc(chunk_crc(m_type, m_data)) {
    }

    chunk chunk::parse(const std::uint8_t* data, std::size_t size) {
        // Checking the minimum size first means every read below succeeds
        if (size < min_size) {
            throw chunk_error(chunk_error::reason::incomplete,
                build_error_msg("Chunk did not contain all the required data: ", size,
                                " bytes, at least ", min_size, " needed"));
        }

        reader in(data, size);

        auto declared = in.read<std::uint32_t>(byte_order::big);
        std::uint64_t expected = size - min_size;
        if (declared != expected) {
            throw chunk_error(chunk_error::reason::length_mismatch,
                build_error_msg("Invalid length field (expected ", expected, ", found ", declared, ")"),
                expected, declared);
        }

        std::uint8_t type_bytes[4];
        THROW_IO_IF(in.read(type_bytes, 4) != 4, "Failed to read chunk type");
        chunk_type type = [&]() {
            try {
                return chunk_type::from_bytes(type_bytes);
            } catch (const chunk_type_error& e) {
                throw chunk_error(chunk_error::reason::invalid_type_code, e.what());
            }
        }();

        auto payload = in.read_exact(declared);
        auto stored_crc = in.read<std::uint32_t>(byte_order::big);

        chunk result(type, std::move(payload));
        if (result.crc() != stored_crc) {
            throw chunk_error(chunk_error::reason::checksum_mismatch,
                build_error_msg("Chunk ", type, " checksum mismatch (computed ", result.crc(),
                                ", stored ", stored_crc, ")"),
                result.crc(), stored_crc);
        }
        return result;
    }

    std::uint32_t chunk::length() const {
        return static_cast<std::uint32_t>(m_data.size());
    }

    std::string chunk::data_as_string() const {
        if (!is_valid_utf8(m_data.data(), m_data.size())) {
            throw chunk_error(chunk_error::reason::invalid_encoding,
                build_error_msg("Chunk ", m_type, " data is not valid UTF-8"));
        }
        return std::string(m_data.begin(), m_data.end());
    }

    std::vector<std::uint8_t> chunk::to_bytes() const {
        writer out(min_size + m_data.size());
        out.write(length(), byte_order::big);
        out.write(m_type.bytes().data(), 4);
        out.write(m_data.data(), m_data.size());
        out.write(m_crc, byte_order::big);
        return out.finish();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        std::string text;
        try {
            text = c.data_as_string();
        } catch (const chunk_error&) {
            text = "<Invalid UTF-8>";
        }
        os << "{ length: " << std::setw(4) << c.length()
           << " type: " << c.type().to_string_view()
           << ", data: " << text
           << ", crc " << std::setw(10) << c.crc() << " }";
        return os;
    }

} // namespace pngme
