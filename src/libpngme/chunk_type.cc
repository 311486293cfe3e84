//
// Chunk type code validation and property bits
//

#include <algorithm>

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

namespace pngme {

    namespace {
        // Bit 5 of each byte carries the property of that position
        constexpr std::uint8_t property_bit = 1u << 5;

        enum property_byte : std::size_t {
            ancillary_byte = 0,
            private_byte = 1,
            reserved_byte = 2,
            safe_to_copy_byte = 3
        };

        bool is_ascii_letter(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        bool property_set(const chunk_type::bytes_type& bytes, property_byte pos) {
            return (bytes[pos] & property_bit) != 0;
        }
    }

    chunk_type chunk_type::from_bytes(const bytes_type& bytes) {
        auto bad = std::find_if_not(bytes.begin(), bytes.end(), is_ascii_letter);
        if (bad != bytes.end()) {
            throw chunk_type_error(chunk_type_error::reason::invalid_type_code,
                build_error_msg("Chunk type byte ", bad - bytes.begin(), " (0x", std::hex,
                                static_cast<unsigned>(*bad), ") is not an ASCII letter"));
        }
        return chunk_type(bytes);
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        bytes_type bytes;
        std::memcpy(bytes.data(), data, 4);
        return from_bytes(bytes);
    }

    chunk_type chunk_type::from_string(std::string_view text) {
        if (text.size() != 4) {
            throw chunk_type_error(chunk_type_error::reason::invalid_length,
                build_error_msg("Chunk type '", text, "' has invalid length (expected 4 bytes, got ",
                                text.size(), ")"),
                4, text.size());
        }
        return from_bytes(text.data());
    }

    bool chunk_type::is_critical() const {
        return !property_set(m_bytes, ancillary_byte);
    }

    bool chunk_type::is_public() const {
        return !property_set(m_bytes, private_byte);
    }

    bool chunk_type::is_reserved_bit_valid() const {
        return !property_set(m_bytes, reserved_byte);
    }

    bool chunk_type::is_safe_to_copy() const {
        return property_set(m_bytes, safe_to_copy_byte);
    }

    bool chunk_type::is_valid() const {
        return is_reserved_bit_valid();
    }

} // namespace pngme
