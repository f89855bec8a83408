/**
 * @file bitbuffer.cpp
 * @brief BitBuffer cursor primitives, fixed-width values, strings and
 *        buffer composition.
 *
 * The compressed integer and custom float encodings live in
 * compressed.cpp and float_codec.cpp.
 */

#include <bitcodec/bitbuffer.hpp>
#include <bitcodec/sink.hpp>

namespace bitcodec {

// ============================================================================
// Bit primitives
// ============================================================================

void BitBuffer::write_bits(std::uint32_t value, std::size_t num_bits) {
    if (num_bits > MAX_BITS_PER_CALL) [[unlikely]] {
        throw InvalidArgumentException("write_bits: at most 32 bits per call");
    }

    for (std::size_t i = num_bits; i > 0; --i) {
        write_bit(((value >> (i - 1)) & 1U) != 0U);
    }
}

std::uint32_t BitBuffer::read_bits(std::size_t num_bits) {
    if (num_bits > MAX_BITS_PER_CALL) [[unlikely]] {
        throw InvalidArgumentException("read_bits: at most 32 bits per call");
    }

    std::uint32_t value = 0;
    for (std::size_t i = 0; i < num_bits; ++i) {
        value = (value << 1) | static_cast<std::uint32_t>(read_bit());
    }
    return value;
}

std::uint32_t BitBuffer::read_bits_reversed(std::size_t num_bits) {
    if (num_bits > MAX_BITS_PER_CALL) [[unlikely]] {
        throw InvalidArgumentException("read_bits_reversed: at most 32 bits per call");
    }

    std::uint32_t value = 0;
    for (std::size_t i = 0; i < num_bits; ++i) {
        value |= static_cast<std::uint32_t>(read_bit()) << i;
    }
    return value;
}

void BitBuffer::align_read() noexcept {
    if (read_.bit != 7) {
        read_.bit = 7;
        ++read_.byte;
    }
}

void BitBuffer::align_write() noexcept {
    if (write_.bit != 7) {
        write_.bit = 7;
        ++write_.byte;
    }
}

void BitBuffer::start_byte(std::size_t index) {
    if (index >= data_.size()) {
        data_.resize(index + 1, 0U);
    } else {
        data_[index] = 0U;
    }
}

void BitBuffer::zero_fill(std::size_t index) {
    // Borrow the write cursor so the byte is created the same way a write would.
    const Cursor saved = write_;
    write_ = Cursor{index, 7};
    write_byte(0U);
    write_ = saved;
}

void BitBuffer::skip_read_bits(std::size_t num_bits) noexcept {
    std::size_t position = read_.byte * 8 + static_cast<std::size_t>(7 - read_.bit) + num_bits;
    read_.byte = position / 8;
    read_.bit = 7 - static_cast<int>(position % 8);
}

// ============================================================================
// Bytes and small signed values
// ============================================================================

std::uint8_t BitBuffer::read_byte_offset(std::size_t offset) const noexcept {
    return (offset < data_.size()) ? data_[offset] : 0U;
}

void BitBuffer::write_byte_offset(std::uint8_t value, std::size_t offset) {
    if (offset >= data_.size()) {
        data_.resize(offset + 1, 0U);
    }
    data_[offset] = value;
}

void BitBuffer::write_signed_byte(std::int8_t value) {
    int magnitude = (value < 0) ? -static_cast<int>(value) : static_cast<int>(value);
    write_bit(value < 0);
    write_bits(static_cast<std::uint32_t>(magnitude) & 0x7FU, 7);
}

std::int8_t BitBuffer::read_signed_char() {
    bool negative = read_bit() != 0;
    auto magnitude = static_cast<int>(read_bits(7));
    return static_cast<std::int8_t>(negative ? -magnitude : magnitude);
}

// ============================================================================
// Multi-byte integers
// ============================================================================

void BitBuffer::write_short(std::uint16_t value) {
    write_byte(static_cast<std::uint8_t>(value & 0xFFU));
    write_byte(static_cast<std::uint8_t>(value >> 8));
}

std::uint16_t BitBuffer::read_short() {
    std::uint16_t low = read_byte();
    std::uint16_t high = read_byte();
    return static_cast<std::uint16_t>(low | (high << 8));
}

void BitBuffer::write_sign_magnitude_short(bool negative, std::uint16_t magnitude) {
    write_byte(static_cast<std::uint8_t>(magnitude & 0xFFU));
    write_bit(negative);
    write_bits((static_cast<std::uint32_t>(magnitude) >> 8) & 0x7FU, 7);
}

void BitBuffer::write_signed_short(std::int16_t value) {
    int magnitude = (value < 0) ? -static_cast<int>(value) : static_cast<int>(value);
    write_sign_magnitude_short(value < 0, static_cast<std::uint16_t>(magnitude));
}

std::int16_t BitBuffer::read_signed_short() {
    int low = read_byte();
    bool negative = read_bit() != 0;
    int high = static_cast<int>(read_bits(7));
    int magnitude = low | (high << 8);
    return static_cast<std::int16_t>(negative ? -magnitude : magnitude);
}

void BitBuffer::write_long(std::uint32_t value) {
    write_short(static_cast<std::uint16_t>(value & 0xFFFFU));
    write_short(static_cast<std::uint16_t>(value >> 16));
}

std::uint32_t BitBuffer::read_long() {
    std::uint32_t low = read_short();
    std::uint32_t high = read_short();
    return low | (high << 16);
}

void BitBuffer::write_signed_long(std::int32_t value) {
    std::uint32_t magnitude = (value < 0) ? 0U - static_cast<std::uint32_t>(value)
                                          : static_cast<std::uint32_t>(value);
    write_short(static_cast<std::uint16_t>(magnitude & 0xFFFFU));
    write_sign_magnitude_short(value < 0, static_cast<std::uint16_t>(magnitude >> 16));
}

std::int32_t BitBuffer::read_signed_long() {
    throw UnsupportedOperationException("read_signed_long is not supported");
}

void BitBuffer::write_long_long(std::uint64_t value) {
    write_long_long(static_cast<std::uint32_t>(value >> 32),
                    static_cast<std::uint32_t>(value & 0xFFFFFFFFU));
}

void BitBuffer::write_long_long(std::uint32_t top, std::uint32_t bottom) {
    write_long(bottom);
    write_long(top);
}

std::uint64_t BitBuffer::read_long_long() {
    std::uint64_t bottom = read_long();
    std::uint64_t top = read_long();
    return bottom | (top << 32);
}

// ============================================================================
// Strings
// ============================================================================

void BitBuffer::write_string(const std::string& text, std::size_t size) {
    for (char c : text) {
        write_char(c);
    }
    for (std::size_t i = text.size(); i < size; ++i) {
        write_byte(0U);
    }
}

std::string BitBuffer::read_string(std::size_t size) {
    std::string text;
    text.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        text.push_back(read_char());
    }
    return text;
}

void BitBuffer::write_wstring(const std::u16string& text, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        char16_t unit = (i < text.size()) ? text[i] : u'\0';
        write_byte(static_cast<std::uint8_t>(unit & 0xFFU));
        write_byte(0U);
    }
}

std::u16string BitBuffer::read_wstring(std::size_t size) {
    std::u16string text;
    if (size == 0) {
        return text;
    }

    std::uint16_t unit = read_short();
    bool keep = unit != 0U;
    for (std::size_t i = 1; i < size; ++i) {
        if (keep) {
            text.push_back(static_cast<char16_t>(unit));
        }
        unit = read_short();
        keep = keep && unit != 0U;
    }
    return text;
}

// ============================================================================
// Buffer composition
// ============================================================================

void BitBuffer::concat(const BitBuffer& other) {
    if (&other == this) {
        const std::vector<std::uint8_t> copy = data_;
        data_.insert(data_.end(), copy.begin(), copy.end());
        return;
    }
    data_.insert(data_.end(), other.data_.begin(), other.data_.end());
}

void BitBuffer::write_bit_stream(BitBuffer& other) {
    const std::size_t count = other.bits();
    for (std::size_t i = 0; i < count; ++i) {
        write_bit(other.read_bit() != 0);
    }
}

BitBuffer BitBuffer::read_bytes(std::size_t count) {
    BitBuffer out;
    for (; count > 0 && read_.byte < data_.size(); --count) {
        out.write_byte(read_byte());
    }
    return out;
}

std::optional<BitBuffer> BitBuffer::read_bits_stream(BitBuffer target, std::size_t num_bits,
                                                     bool shift) {
    if (num_bits == 0 || read_.byte + num_bits / 8 > data_.size()) {
        return std::nullopt;
    }

    std::size_t offset = 0;
    while (num_bits >= 8) {
        target.write_byte_offset(read_byte(), offset);
        num_bits -= 8;
        ++offset;
    }

    // Trailing partial byte
    if (num_bits > 0) {
        if (shift) {
            auto shifted =
                static_cast<std::uint8_t>(target.read_byte_offset(offset) >> (8 - num_bits));
            target.write_byte_offset(shifted, offset);
            skip_read_bits(num_bits);
        } else {
            skip_read_bits(8);
        }
    }

    return target;
}

// ============================================================================
// Diagnostics and output
// ============================================================================

std::string BitBuffer::to_binary_string() const {
    std::string out;
    out.reserve(data_.size() * 9 + 8);

    for (std::size_t i = 0; i < data_.size(); ++i) {
        const std::uint8_t byte = data_[i];
        const bool has_read = (i == read_.byte);
        const bool has_write = (i == write_.byte);

        for (int j = 7; j >= 0; --j) {
            if (has_read && j == read_.bit) {
                out += " -> ";
            }
            if (has_write && j == write_.bit) {
                out += " <- ";
            }
            out += (byte & detail::BIT_MASK[j]) ? '1' : '0';
        }
        out += ' ';
    }
    return out;
}

std::string BitBuffer::to_hex_string() const {
    static constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(data_.size() * 3);
    for (std::uint8_t byte : data_) {
        out += HEX_DIGITS[byte >> 4];
        out += HEX_DIGITS[byte & 0x0FU];
        out += ' ';
    }
    return out;
}

Error BitBuffer::to_sink(ByteSink& sink) const {
    return sink.write(data_.data(), data_.size());
}

} // namespace bitcodec
