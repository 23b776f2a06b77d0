#ifndef HOSTWATCH_PROTO_COLLECTOR_ID_HPP
#define HOSTWATCH_PROTO_COLLECTOR_ID_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace hostwatch::proto {

// 128-bit agent identity. hi holds the most significant 64 bits.
struct CollectorId {
    uint64_t hi = 0;
    uint64_t lo = 0;

    static constexpr CollectorId from_u64(uint64_t value) {
        return CollectorId{0, value};
    }

    // random RFC 4122 version 4 identity
    static CollectorId generate();

    // accepts canonical uuid text ("0000002a-0000-...") or a decimal u128 ("42")
    static std::optional<CollectorId> parse(std::string_view text);

    // canonical lowercase uuid text; this is also the form stored in the database
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const CollectorId& a, const CollectorId& b) {
        return a.hi == b.hi && a.lo == b.lo;
    }
    friend bool operator!=(const CollectorId& a, const CollectorId& b) {
        return !(a == b);
    }
};

struct CollectorIdHash {
    std::size_t operator()(const CollectorId& id) const noexcept {
        return std::hash<uint64_t>{}(id.hi) ^ (std::hash<uint64_t>{}(id.lo) * 0x9E3779B97F4A7C15ull);
    }
};

}  // namespace hostwatch::proto

#endif
