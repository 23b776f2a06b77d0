#include "hostwatch/proto/collector_id.hpp"

#include <array>
#include <cctype>
#include <random>

namespace hostwatch::proto {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<CollectorId> parse_uuid(std::string_view text) {
    // 8-4-4-4-12
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' ||
        text[23] != '-') {
        return std::nullopt;
    }

    CollectorId id;
    int nibbles = 0;
    for (char c : text) {
        if (c == '-') {
            continue;
        }
        int v = hex_value(c);
        if (v < 0) {
            return std::nullopt;
        }
        // first 16 nibbles fill hi, the rest fill lo
        if (nibbles < 16) {
            id.hi = (id.hi << 4) | static_cast<uint64_t>(v);
        } else {
            id.lo = (id.lo << 4) | static_cast<uint64_t>(v);
        }
        ++nibbles;
    }
    return id;
}

// decimal u128, the format older agents wrote to their identity file.
// four 32-bit limbs, most significant first, so the multiply never needs 128-bit types
std::optional<CollectorId> parse_decimal(std::string_view text) {
    if (text.empty() || text.size() > 39) {
        return std::nullopt;
    }

    std::array<uint64_t, 4> limbs{0, 0, 0, 0};
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        uint64_t carry = static_cast<uint64_t>(c - '0');
        for (int i = 3; i >= 0; --i) {
            uint64_t v = limbs[i] * 10 + carry;
            limbs[i] = v & 0xFFFFFFFFull;
            carry = v >> 32;
        }
        if (carry != 0) {
            return std::nullopt;  // overflow
        }
    }

    return CollectorId{(limbs[0] << 32) | limbs[1], (limbs[2] << 32) | limbs[3]};
}

}  // namespace

CollectorId CollectorId::generate() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    CollectorId id{rng(), rng()};
    // version 4, variant 10xx
    id.hi = (id.hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    id.lo = (id.lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    return id;
}

std::optional<CollectorId> CollectorId::parse(std::string_view text) {
    if (text.find('-') != std::string_view::npos) {
        return parse_uuid(text);
    }
    return parse_decimal(text);
}

std::string CollectorId::to_string() const {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);

    auto append = [&out](uint64_t half, int first_nibble) {
        for (int i = 15; i >= 0; --i) {
            int nibble = first_nibble + (15 - i);
            if (nibble == 8 || nibble == 12 || nibble == 16 || nibble == 20) {
                out.push_back('-');
            }
            out.push_back(kDigits[(half >> (i * 4)) & 0xF]);
        }
    };
    append(hi, 0);
    append(lo, 16);
    return out;
}

}  // namespace hostwatch::proto
