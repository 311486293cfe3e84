//
// CRC-32 and text helpers used by chunk encoding
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include <pngme/chunk_type.hh>

namespace pngme {

    // CRC-32 (ISO-HDLC, as used by PNG) of type ++ data
    std::uint32_t chunk_crc(const chunk_type& type, const std::uint8_t* data, std::size_t size);

    inline std::uint32_t chunk_crc(const chunk_type& type, const std::vector<std::uint8_t>& data) {
        return chunk_crc(type, data.data(), data.size());
    }

    // Strict UTF-8: rejects overlong forms, surrogates and code points above U+10FFFF
    bool is_valid_utf8(const std::uint8_t* data, std::size_t size);
}
