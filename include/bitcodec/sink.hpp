/**
 * @file sink.hpp
 * @brief Byte sinks used to persist a bit buffer.
 *
 * The codec itself never touches storage. A BitBuffer hands its bytes to
 * a ByteSink, which decides where they go.
 */

#ifndef BITCODEC_SINK_HPP
#define BITCODEC_SINK_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>
#include <utility>
#include <vector>

namespace bitcodec {

/**
 * @brief Destination for a block of bytes.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * @brief Consume a block of bytes.
     *
     * @param data Source bytes (may be null when size is 0)
     * @param size Number of bytes
     * @return Error::Ok on success, Error::IoError if the sink rejected them
     */
    virtual Error write(const std::uint8_t* data, std::size_t size) = 0;
};

/**
 * @brief Writes bytes to a file, replacing its previous contents.
 */
class FileSink : public ByteSink {
public:
    explicit FileSink(std::string path) : path_(std::move(path)) {}

    Error write(const std::uint8_t* data, std::size_t size) override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Appends bytes to an in-memory vector.
 */
class MemorySink : public ByteSink {
public:
    Error write(const std::uint8_t* data, std::size_t size) override;

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }

private:
    std::vector<std::uint8_t> bytes_;
};

} // namespace bitcodec

#endif // BITCODEC_SINK_HPP
