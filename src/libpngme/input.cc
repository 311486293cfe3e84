//
// Bounded memory reader
//

#include <algorithm>
#include <string>

#include "input.hh"

namespace pngme {

    reader::reader(const std::uint8_t* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        THROW_IO_IF(!data && size != 0, "Null buffer with non-zero size ", size);
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(dst, "Null buffer in read");

        // Never read past the end of our region
        std::size_t available = remaining();
        if (available == 0) {
            return 0;
        }
        size = std::min(size, available);

        std::memcpy(dst, m_data + m_position, size);
        m_position += size;
        return size;
    }

    void reader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            case end:
                THROW_IO_IF(offset > m_size, "Cannot seek ", offset, " bytes before start of buffer");
                new_pos = m_size - offset;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        if (new_pos > m_size) {
            std::string error = "Cannot seek to offset " + std::to_string(new_pos);
            error += " - buffer size is only " + std::to_string(m_size) + " bytes";
            THROW_IO(error);
        }

        m_position = static_cast<std::size_t>(new_pos);
    }
}
