/**
 * @file bitcodec.hpp
 * @brief bitcodec public API.
 *
 * Bit-addressable buffer codec: primitive values of arbitrary bit width
 * written to and read from a growable byte buffer, plus the compressed
 * integer and custom float encodings built on it.
 */

#ifndef BITCODEC_HPP
#define BITCODEC_HPP

#include "bitbuffer.hpp"
#include "config.hpp"
#include "error.hpp"
#include "sink.hpp"

namespace bitcodec {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bitcodec

#endif // BITCODEC_HPP
