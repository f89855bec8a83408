/**
 * @file config.hpp
 * @brief bitcodec compile-time configuration.
 *
 * Field widths and numeric constants shared by the bit buffer and its
 * encoders. Every constant with a macro counterpart can be overridden on
 * the compiler command line.
 */

#ifndef BITCODEC_CONFIG_HPP
#define BITCODEC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace bitcodec {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Default width of fixed-size string fields (bytes or 16-bit units)
#ifndef BITCODEC_DEFAULT_STRING_SIZE
#define BITCODEC_DEFAULT_STRING_SIZE 33U
#endif

inline constexpr std::size_t DEFAULT_STRING_SIZE = BITCODEC_DEFAULT_STRING_SIZE;

/// Widest value accepted by write_bits()/read_bits()
inline constexpr std::size_t MAX_BITS_PER_CALL = 32U;

/// Widest integer accepted by the compressed integer encoding (bytes)
inline constexpr std::size_t MAX_COMPRESSED_SIZE = 8U;

/// Custom float layout: 8-bit exponent biased by 127, 23 explicit mantissa bits
inline constexpr int FLOAT_EXPONENT_BIAS = 127;
inline constexpr int FLOAT_MANTISSA_BITS = 23;

/** @} */

} // namespace bitcodec

#endif // BITCODEC_CONFIG_HPP
