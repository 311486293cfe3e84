//
// Bounded readers and growable writers over in-memory byte buffers
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>
#include <utility>

#include <pngme/exceptions.hh>
#include <pngme/byte_order.hh>

namespace pngme {

    // Reads from a caller owned byte range; never reads past its end
    class reader {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            reader(const std::uint8_t* data, std::size_t size);

            std::size_t read(void* dst, std::size_t size);
            void seek(std::uint64_t offset, whence_t whence);
            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }

            // Pointer to the current position, valid while the source buffer lives
            [[nodiscard]] const std::uint8_t* current() const { return m_data + m_position; }

            std::vector<std::uint8_t> read_exact(std::size_t size) {
                std::vector<std::uint8_t> buffer(size);
                std::size_t actual = read(buffer.data(), size);
                THROW_IO_IF(actual != size, "Unexpected end of buffer: requested ", size, " got ", actual);
                return buffer;
            }

            template<typename T>
            T read(byte_order bo) {
                std::array<std::uint8_t, sizeof(T)> buff;
                std::size_t actual = read(buff.data(), sizeof(T));
                THROW_IO_IF(actual != sizeof(T), "Failed to read ", sizeof(T), " bytes");

                T value;
                std::memcpy(&value, buff.data(), sizeof(T));
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                return value;
            }

            // Read a value without advancing
            template<typename T>
            T peek(byte_order bo) {
                auto pos = m_position;
                T value = read<T>(bo);
                m_position = pos;
                return value;
            }

        private:
            const std::uint8_t* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };

    // Appends to an owned buffer, handed out by finish()
    class writer {
        public:
            writer() = default;
            explicit writer(std::size_t reserve) { m_data.reserve(reserve); }

            void write(const void* src, std::size_t size) {
                auto p = static_cast<const std::uint8_t*>(src);
                m_data.insert(m_data.end(), p, p + size);
            }

            template<typename T>
            void write(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                write(&value, sizeof(T));
            }

            [[nodiscard]] std::size_t size() const { return m_data.size(); }

            std::vector<std::uint8_t> finish() { return std::move(m_data); }

        private:
            std::vector<std::uint8_t> m_data;
    };
}
