/**
 * @file float_codec.cpp
 * @brief Custom 32-bit floating point encoding.
 *
 * Not IEEE-754 arithmetic: the mantissa is derived with log2/ceil and the
 * fields are emitted in this order:
 *
 * | Field            | Bits |
 * |------------------|------|
 * | mantissa[0:15]   | 16 (little-endian short) |
 * | exponent[0]      | 1    |
 * | mantissa[16:22]  | 7    |
 * | sign             | 1    |
 * | exponent[1:7]    | 7    |
 *
 * value = 2^(exponent - 127) * (1 + mantissa * 2^-23) * (sign ? -1 : 1)
 */

#include <bitcodec/bitbuffer.hpp>

#include <cmath>

namespace bitcodec {

namespace {

constexpr std::uint32_t MANTISSA_LIMIT = 1U << FLOAT_MANTISSA_BITS;

} // namespace

void BitBuffer::write_float(double value) {
    const bool negative = value < 0.0;
    const double magnitude = std::fabs(value);

    std::uint32_t mantissa = 0;
    std::uint32_t exponent = 0;

    // Zero, infinities and NaN keep exponent and mantissa at zero.
    if (magnitude != 0.0 && std::isfinite(magnitude)) {
        int e = static_cast<int>(std::floor(std::log2(magnitude)));
        double m = std::ceil((magnitude / std::ldexp(1.0, e) - 1.0) *
                             static_cast<double>(MANTISSA_LIMIT));
        if (m < 0.0) {
            m = 0.0;
        }
        if (m >= static_cast<double>(MANTISSA_LIMIT)) {
            m = 0.0;
            ++e;
        }
        mantissa = static_cast<std::uint32_t>(m);
        exponent = static_cast<std::uint32_t>(e + FLOAT_EXPONENT_BIAS);
    }

    write_short(static_cast<std::uint16_t>(mantissa & 0xFFFFU));
    write_bit((exponent & 0x01U) != 0U);
    write_bits((mantissa >> 16) & 0x7FU, 7);
    write_bit(negative);
    write_bits((exponent >> 1) & 0x7FU, 7);
}

double BitBuffer::read_float() {
    std::uint32_t mantissa = read_short();
    std::uint32_t exponent = static_cast<std::uint32_t>(read_bit());
    mantissa |= read_bits(7) << 16;
    const bool negative = read_bit() != 0;
    exponent |= read_bits(7) << 1;

    if (exponent == 0U && mantissa == 0U) {
        return negative ? -0.0 : 0.0;
    }

    double value = std::ldexp(1.0 + static_cast<double>(mantissa) / MANTISSA_LIMIT,
                              static_cast<int>(exponent) - FLOAT_EXPONENT_BIAS);
    return negative ? -value : value;
}

} // namespace bitcodec
