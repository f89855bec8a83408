/**
 * @file sink.cpp
 * @brief File and memory byte sinks.
 */

#include <bitcodec/sink.hpp>

#include <fstream>

namespace bitcodec {

Error FileSink::write(const std::uint8_t* data, std::size_t size) {
    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::IoError;
    }
    if (size > 0) {
        file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    }
    return file.good() ? Error::Ok : Error::IoError;
}

Error MemorySink::write(const std::uint8_t* data, std::size_t size) {
    if (size > 0) {
        bytes_.insert(bytes_.end(), data, data + size);
    }
    return Error::Ok;
}

} // namespace bitcodec
