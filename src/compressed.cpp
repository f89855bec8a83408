/**
 * @file compressed.cpp
 * @brief Variable-length ("compressed") integer encoding.
 *
 * @par Layout for an integer of `size` bytes
 * @code
 *   for k = size-1 .. 1:
 *       '1'                       byte k and everything above it is zero
 *       '0' byte[0] .. byte[k]    first non-zero byte found, stop
 *   '1' nibble(4)                 low byte below 0x10
 *   '0' byte[0](8)                otherwise
 * @endcode
 *
 * Zero costs size bits of flags plus 4 data bits; a full-width value costs
 * size-1 flag bits plus all of its bytes.
 */

#include <bitcodec/bitbuffer.hpp>

namespace bitcodec {

namespace {

void check_compressed_size(std::size_t size) {
    if (size == 0 || size > MAX_COMPRESSED_SIZE) [[unlikely]] {
        throw InvalidArgumentException("compressed integer size must be 1-8 bytes");
    }
}

inline std::uint8_t byte_at(std::uint64_t value, std::size_t index) noexcept {
    return static_cast<std::uint8_t>((value >> (index * 8)) & 0xFFU);
}

} // namespace

void BitBuffer::write_compressed(std::uint64_t value, std::size_t size) {
    check_compressed_size(size);

    for (std::size_t current = size - 1; current > 0; --current) {
        bool zero = byte_at(value, current) == 0U;
        write_bit(zero);
        if (!zero) {
            for (std::size_t i = 0; i <= current; ++i) {
                write_byte(byte_at(value, i));
            }
            return;
        }
    }

    bool small = (value & 0xF0U) == 0U;
    write_bit(small);
    if (small) {
        write_bits(static_cast<std::uint32_t>(value & 0x0FU), 4);
    } else {
        write_byte(byte_at(value, 0));
    }
}

BitBuffer BitBuffer::read_compressed(std::size_t size) {
    check_compressed_size(size);

    BitBuffer out;
    for (std::size_t current = size - 1; current > 0; --current) {
        if (read_bit() == 0) {
            for (std::size_t i = 0; i <= current; ++i) {
                out.write_byte(read_byte());
            }
            for (std::size_t i = current + 1; i < size; ++i) {
                out.write_byte(0U);
            }
            return out;
        }
    }

    if (read_bit() != 0) {
        out.write_byte(static_cast<std::uint8_t>(read_bits(4)));
    } else {
        out.write_byte(read_byte());
    }
    for (std::size_t i = 1; i < size; ++i) {
        out.write_byte(0U);
    }
    return out;
}

std::uint16_t BitBuffer::read_compressed_short() {
    return read_compressed(2).read_short();
}

std::uint32_t BitBuffer::read_compressed_long() {
    return read_compressed(4).read_long();
}

} // namespace bitcodec
