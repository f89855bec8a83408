/**
 * @file bitbuffer.hpp
 * @brief Growable byte buffer with independent bit-level read and write cursors.
 *
 * A BitBuffer owns one byte vector and two cursors over it. Values of any
 * bit width are written at the write cursor and read back at the read
 * cursor, so fields do not need to be byte-aligned.
 *
 * @par Bit Ordering
 * Bits are written MSB-first within each byte:
 * - First bit written goes to bit position 7
 * - Second bit goes to position 6, etc.
 *
 * Multi-byte integers are composed little-endian from whole bytes, each
 * byte itself written MSB-first.
 *
 * @par Growth
 * The buffer grows by one zeroed byte when the write cursor starts a byte
 * past the end. Reading past the end never fails: the missing byte is
 * written as zero first and then read.
 */

#ifndef BITCODEC_BITBUFFER_HPP
#define BITCODEC_BITBUFFER_HPP

#include "config.hpp"
#include "error.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace bitcodec {

class ByteSink;

namespace detail {
/// Single-bit masks indexed by bit position (0 = LSB, 7 = MSB)
inline constexpr std::uint8_t BIT_MASK[8] = {0x01U, 0x02U, 0x04U, 0x08U,
                                             0x10U, 0x20U, 0x40U, 0x80U};
} // namespace detail

/**
 * @brief Position of the next bit to read or write.
 *
 * `bit` counts down from 7 (MSB) to 0 (LSB); after bit 0 the cursor moves
 * to bit 7 of the next byte.
 */
struct Cursor {
    std::size_t byte = 0;
    int bit = 7;

    bool operator==(const Cursor&) const = default;
};

/**
 * @brief Bit-addressable byte buffer with separate read and write cursors.
 *
 * Reading and writing are independent viewports onto the same storage:
 * a buffer constructed from existing bytes starts with both cursors at the
 * first bit, so writes overwrite from the start rather than append.
 */
class BitBuffer {
public:
    /**
     * @brief Construct an empty buffer.
     */
    BitBuffer() = default;

    /**
     * @brief Construct a buffer pre-loaded with bytes.
     * @param bytes Initial contents
     */
    explicit BitBuffer(std::vector<std::uint8_t> bytes) noexcept : data_(std::move(bytes)) {}

    /**
     * @brief Construct a buffer pre-loaded with a copy of a byte array.
     * @param bytes Source bytes
     * @param size Number of bytes
     */
    BitBuffer(const std::uint8_t* bytes, std::size_t size) : data_(bytes, bytes + size) {}

    /**
     * @brief Underlying bytes.
     */
    [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept { return data_; }

    /**
     * @brief Number of bytes in the buffer.
     */
    [[nodiscard]] std::size_t length() const noexcept { return data_.size(); }

    /**
     * @brief Number of bits committed by the write cursor.
     */
    [[nodiscard]] std::size_t bits() const noexcept {
        return write_.byte * 8 + static_cast<std::size_t>(7 - write_.bit);
    }

    /**
     * @brief Check whether the read cursor has reached the end of the data.
     */
    [[nodiscard]] bool all_read() const noexcept {
        return read_.byte * 8 + static_cast<std::size_t>(read_.bit) + 1 >= data_.size() * 8;
    }

    [[nodiscard]] Cursor read_cursor() const noexcept { return read_; }
    [[nodiscard]] Cursor write_cursor() const noexcept { return write_; }

    // ------------------------------------------------------------------
    // Bit primitives
    // ------------------------------------------------------------------

    /**
     * @brief Write a single bit at the write cursor.
     *
     * Only `bool` is accepted; any other argument type selects the deleted
     * overload below and fails to compile.
     *
     * @param bit Bit value
     */
    inline void write_bit(bool bit) {
        if (write_.bit == 7) {
            start_byte(write_.byte);
        }
        if (bit) {
            data_[write_.byte] |= detail::BIT_MASK[write_.bit];
        }
        advance(write_);
    }

    template <typename T>
    void write_bit(T) = delete;

    /**
     * @brief Read a single bit at the read cursor.
     *
     * Reading past the end first appends a zero byte.
     *
     * @return Bit value (0 or 1)
     */
    inline int read_bit() {
        if (read_.byte >= data_.size()) [[unlikely]] {
            zero_fill(read_.byte);
        }
        int bit = (data_[read_.byte] & detail::BIT_MASK[read_.bit]) >> read_.bit;
        advance(read_);
        return bit;
    }

    /**
     * @brief Write the low bits of a value, MSB-first.
     *
     * @param value Value containing bits (right-justified)
     * @param num_bits Number of bits to write (0-32)
     * @throws InvalidArgumentException if num_bits exceeds 32
     */
    void write_bits(std::uint32_t value, std::size_t num_bits);

    /**
     * @brief Read bits MSB-first into an unsigned value.
     *
     * @param num_bits Number of bits to read (0-32)
     * @throws InvalidArgumentException if num_bits exceeds 32
     */
    std::uint32_t read_bits(std::size_t num_bits);

    /**
     * @brief Read bits, placing the first bit read at bit 0 of the result.
     *
     * Gives the bit-reversed interpretation of what read_bits() would
     * return for the same stream position.
     *
     * @param num_bits Number of bits to read (0-32)
     * @throws InvalidArgumentException if num_bits exceeds 32
     */
    std::uint32_t read_bits_reversed(std::size_t num_bits);

    /**
     * @brief Skip the rest of the current read byte.
     */
    void align_read() noexcept;

    /**
     * @brief Skip the rest of the current write byte.
     */
    void align_write() noexcept;

    // ------------------------------------------------------------------
    // Bytes, booleans and characters
    // ------------------------------------------------------------------

    void write_byte(std::uint8_t value) { write_bits(value, 8); }
    std::uint8_t read_byte() { return static_cast<std::uint8_t>(read_bits(8)); }

    /**
     * @brief Byte at an absolute offset, ignoring both cursors.
     * @return The byte, or 0 if the offset lies past the end
     */
    [[nodiscard]] std::uint8_t read_byte_offset(std::size_t offset) const noexcept;

    /**
     * @brief Store a byte at an absolute offset, ignoring both cursors.
     *
     * Grows the buffer with zero bytes when the offset lies past the end.
     */
    void write_byte_offset(std::uint8_t value, std::size_t offset);

    /// Booleans take a whole byte: 0x01 or 0x00.
    void write_boolean(bool value) { write_byte(value ? 1U : 0U); }
    bool read_boolean() { return read_byte() != 0; }

    void write_char(char value) { write_byte(static_cast<std::uint8_t>(value)); }
    char read_char() { return static_cast<char>(read_byte()); }

    /**
     * @brief Write a sign bit followed by a 7-bit magnitude.
     *
     * -128 has no 7-bit magnitude and is written as zero.
     */
    void write_signed_byte(std::int8_t value);
    std::int8_t read_signed_char();

    // ------------------------------------------------------------------
    // 16/32/64-bit integers (little-endian byte order)
    // ------------------------------------------------------------------

    void write_short(std::uint16_t value);
    std::uint16_t read_short();

    /**
     * @brief Write the magnitude's low byte, then a sign bit and its
     *        7-bit high part.
     *
     * Magnitudes up to 0x7FFF are representable; -32768 loses its top bit.
     */
    void write_signed_short(std::int16_t value);
    std::int16_t read_signed_short();

    void write_long(std::uint32_t value);
    std::uint32_t read_long();

    /**
     * @brief Write the magnitude's low short, then its high short in the
     *        signed-short layout carrying the sign of `value`.
     */
    void write_signed_long(std::int32_t value);

    /**
     * @brief Not provided by this codec.
     * @throws UnsupportedOperationException always
     */
    std::int32_t read_signed_long();

    /**
     * @brief Write a 64-bit value as its low 32-bit half, then its high half.
     */
    void write_long_long(std::uint64_t value);
    void write_long_long(std::uint32_t top, std::uint32_t bottom);
    std::uint64_t read_long_long();

    // ------------------------------------------------------------------
    // Compressed integers (compressed.cpp)
    // ------------------------------------------------------------------

    /**
     * @brief Write an integer of `size` bytes, skipping leading zero bytes.
     *
     * For each byte position from size-1 down to 1 a flag bit is written:
     * 1 while that byte is zero, 0 at the first non-zero byte, which is
     * followed by bytes 0..k little-endian. If all high bytes are zero a
     * final flag selects a 4-bit (top nibble zero) or an 8-bit low byte.
     *
     * @param value Value to write
     * @param size Integer width in bytes (1-8)
     * @throws InvalidArgumentException if size is out of range
     */
    void write_compressed(std::uint64_t value, std::size_t size);

    /**
     * @brief Read an integer written by write_compressed().
     *
     * @param size Integer width in bytes (1-8)
     * @return New buffer holding the `size` bytes of the value, little-endian
     * @throws InvalidArgumentException if size is out of range
     */
    BitBuffer read_compressed(std::size_t size);

    void write_compressed_short(std::uint16_t value) { write_compressed(value, 2); }
    std::uint16_t read_compressed_short();

    void write_compressed_long(std::uint32_t value) { write_compressed(value, 4); }
    std::uint32_t read_compressed_long();

    // ------------------------------------------------------------------
    // Custom float (float_codec.cpp)
    // ------------------------------------------------------------------

    /**
     * @brief Write a number in the 32-bit custom float layout.
     *
     * Emission order: mantissa bits 0-15 (as a little-endian short),
     * exponent bit 0, mantissa bits 16-22, sign, exponent bits 1-7.
     * The exponent is biased by 127 and the mantissa is rounded up.
     */
    void write_float(double value);

    /**
     * @brief Read a number written by write_float().
     */
    double read_float();

    // ------------------------------------------------------------------
    // Strings
    // ------------------------------------------------------------------

    /**
     * @brief Write one byte per character, NUL-padded to `size`.
     *
     * Longer strings are written in full.
     */
    void write_string(const std::string& text, std::size_t size = DEFAULT_STRING_SIZE);

    /**
     * @brief Read exactly `size` bytes as characters, padding included.
     */
    std::string read_string(std::size_t size = DEFAULT_STRING_SIZE);

    /**
     * @brief Write exactly `size` 16-bit units: each character's low byte
     *        followed by a zero byte.
     */
    void write_wstring(const std::u16string& text, std::size_t size = DEFAULT_STRING_SIZE);

    /**
     * @brief Read `size` 16-bit units, keeping characters up to the first
     *        zero unit.
     *
     * The whole field is always consumed. At most `size - 1` characters are
     * returned.
     */
    std::u16string read_wstring(std::size_t size = DEFAULT_STRING_SIZE);

    // ------------------------------------------------------------------
    // Buffer composition
    // ------------------------------------------------------------------

    /**
     * @brief Append another buffer's bytes after this buffer's bytes.
     *
     * Neither cursor moves.
     */
    void concat(const BitBuffer& other);

    /**
     * @brief Copy every bit written to `other` through its read cursor.
     */
    void write_bit_stream(BitBuffer& other);

    /**
     * @brief Read up to `count` bytes into a new buffer.
     *
     * Stops early at the end of the data instead of zero-filling.
     */
    BitBuffer read_bytes(std::size_t count);

    /**
     * @brief Copy `num_bits` bits into `target`, a whole byte at a time.
     *
     * Whole bytes are stored at offsets 0, 1, ... of `target`. A trailing
     * group of n < 8 bits is not copied: with `shift` set the target byte at
     * that offset is shifted right by 8 - n and n bits are skipped here,
     * otherwise a whole byte is skipped.
     *
     * @return The filled target, or nothing if num_bits is 0 or fewer than
     *         num_bits / 8 bytes remain
     */
    std::optional<BitBuffer> read_bits_stream(BitBuffer target, std::size_t num_bits,
                                              bool shift = true);

    // ------------------------------------------------------------------
    // Diagnostics and output
    // ------------------------------------------------------------------

    /**
     * @brief Bytes as 8-bit groups, with " -> " before the next bit to read
     *        and " <- " before the next bit to write.
     */
    [[nodiscard]] std::string to_binary_string() const;

    /**
     * @brief Bytes as upper-case hex pairs separated by spaces.
     */
    [[nodiscard]] std::string to_hex_string() const;

    /**
     * @brief Hand the whole byte buffer to a sink.
     * @return Error reported by the sink
     */
    Error to_sink(ByteSink& sink) const;

private:
    std::vector<std::uint8_t> data_;
    Cursor read_;
    Cursor write_;

    static void advance(Cursor& cursor) noexcept {
        if (--cursor.bit < 0) {
            cursor.bit = 7;
            ++cursor.byte;
        }
    }

    /**
     * @brief Prepare byte `index` for writing: append it if missing,
     *        otherwise clear it.
     */
    void start_byte(std::size_t index);

    /**
     * @brief Write a zero byte at `index` without moving the write cursor.
     */
    void zero_fill(std::size_t index);

    void skip_read_bits(std::size_t num_bits) noexcept;

    void write_sign_magnitude_short(bool negative, std::uint16_t magnitude);
};

} // namespace bitcodec

#endif // BITCODEC_BITBUFFER_HPP
