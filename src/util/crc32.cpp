#include "hostwatch/util/crc32.hpp"

#include <array>

namespace hostwatch::util {

namespace {

std::array<uint32_t, 256> make_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int j = 0; j < 8; ++j) {
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

}  // namespace

uint32_t crc32(const uint8_t* data, std::size_t len) {
    // function-local static: built once, thread safe initialization
    static const std::array<uint32_t, 256> table = make_table();

    uint32_t c = ~0u;
    for (std::size_t i = 0; i < len; ++i) {
        c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
    }
    return ~c;
}

}  // namespace hostwatch::util
