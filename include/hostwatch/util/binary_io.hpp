#ifndef HOSTWATCH_UTIL_BINARY_IO_HPP
#define HOSTWATCH_UTIL_BINARY_IO_HPP

#include <cstdint>
#include <cstring>
#include <vector>

namespace hostwatch::util {
/*
    two byte orders live on the wire:
    - big-endian (network order) for the frame header and crc trailer
    - little-endian for the payload fields, which keeps payloads byte-compatible with agents
      already deployed in the field

    readers take a raw pointer and assume the caller already checked the bounds
*/

// ============================================================================
// Big-endian
// ============================================================================

inline void write_uint16_be(std::vector<uint8_t>& buf, uint16_t value) {
    buf.push_back((value >> 8) & 0xFF);
    buf.push_back(value & 0xFF);
}

inline void write_uint32_be(std::vector<uint8_t>& buf, uint32_t value) {
    buf.push_back((value >> 24) & 0xFF);  // most significant byte
    buf.push_back((value >> 16) & 0xFF);
    buf.push_back((value >> 8) & 0xFF);
    buf.push_back(value & 0xFF);  // least significant byte
    /*
        example: value = 0x12345678
        buf: [0x12, 0x34, 0x56, 0x78]
    */
}

inline uint16_t read_uint16_be(const uint8_t* data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

inline uint32_t read_uint32_be(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) | (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) | static_cast<uint32_t>(data[3]);
}

// ============================================================================
// Little-endian
// ============================================================================

inline void write_uint32_le(std::vector<uint8_t>& buf, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buf.push_back((value >> (i * 8)) & 0xFF);
    }
}

inline void write_uint64_le(std::vector<uint8_t>& buf, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back((value >> (i * 8)) & 0xFF);
    }
}

// floats travel as their IEEE-754 bit pattern. memcpy is the defined way to reinterpret
inline void write_float32_le(std::vector<uint8_t>& buf, float value) {
    static_assert(sizeof(float) == sizeof(uint32_t), "float must be 32 bits");
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    write_uint32_le(buf, bits);
}

inline uint32_t read_uint32_le(const uint8_t* data) {
    uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

inline uint64_t read_uint64_le(const uint8_t* data) {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data[i];
    }
    return value;
}

inline float read_float32_le(const uint8_t* data) {
    uint32_t bits = read_uint32_le(data);
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

}  // namespace hostwatch::util

#endif
