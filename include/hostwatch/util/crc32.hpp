#ifndef HOSTWATCH_UTIL_CRC32_HPP
#define HOSTWATCH_UTIL_CRC32_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hostwatch::util {

// CRC-32/ISO-HDLC (the zlib/ethernet one): reflected, poly 0xEDB88320, init and xorout ~0
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t len);

[[nodiscard]] inline uint32_t crc32(const std::vector<uint8_t>& data) {
    return crc32(data.data(), data.size());
}

}  // namespace hostwatch::util

#endif
