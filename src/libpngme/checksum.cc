//
// CRC-32 and text helpers used by chunk encoding
//

#include <algorithm>
#include <limits>
#include <zlib.h>

#include "checksum.hh"

namespace pngme {

    std::uint32_t chunk_crc(const chunk_type& type, const std::uint8_t* data, std::size_t size) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, type.bytes().data(), 4);

        // zlib takes uInt lengths
        while (size > 0) {
            auto block = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = crc32(crc, data, block);
            data += block;
            size -= block;
        }
        return static_cast<std::uint32_t>(crc);
    }

    bool is_valid_utf8(const std::uint8_t* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            std::uint8_t first_byte = data[i];
            std::size_t length;
            std::uint32_t cp;

            if (first_byte < 0x80) {
                i++;
                continue;
            } else if ((first_byte & 0xE0) == 0xC0) {
                length = 2;
                cp = first_byte & 0x1F;
            } else if ((first_byte & 0xF0) == 0xE0) {
                length = 3;
                cp = first_byte & 0x0F;
            } else if ((first_byte & 0xF8) == 0xF0) {
                length = 4;
                cp = first_byte & 0x07;
            } else {
                return false;
            }

            if (size - i < length) {
                return false;
            }
            for (std::size_t k = 1; k < length; k++) {
                if ((data[i + k] & 0xC0) != 0x80) {
                    return false;
                }
                cp = (cp << 6) | (data[i + k] & 0x3F);
            }

            // Overlong encodings
            if ((length == 2 && cp < 0x80) || (length == 3 && cp < 0x800) || (length == 4 && cp < 0x10000)) {
                return false;
            }
            if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }
            i += length;
        }
        return true;
    }
}
