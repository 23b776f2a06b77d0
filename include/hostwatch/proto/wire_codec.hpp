#ifndef HOSTWATCH_PROTO_WIRE_CODEC_HPP
#define HOSTWATCH_PROTO_WIRE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "hostwatch/proto/types.hpp"

namespace hostwatch::proto {

enum class FrameErrorKind {
    Truncated,    // buffer ends before the frame does
    BadMagic,
    BadVersion,
    BadChecksum,
    Oversized,    // payload_size above kMaxPayloadSize
    Malformed,    // checksum fine but the payload is not a valid message
};

[[nodiscard]] const char* to_string(FrameErrorKind kind);

class FrameError : public std::runtime_error {
public:
    FrameError(FrameErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    [[nodiscard]] FrameErrorKind kind() const noexcept {
        return kind_;
    }

    // the frame arrived but was damaged or speaks another protocol
    [[nodiscard]] bool corrupt() const noexcept {
        return kind_ == FrameErrorKind::BadMagic || kind_ == FrameErrorKind::BadVersion ||
               kind_ == FrameErrorKind::BadChecksum;
    }

private:
    FrameErrorKind kind_;
};

struct DecodedFrame {
    uint32_t timestamp = 0;
    Command command;
};

/*
    command frame (agent -> server), header and trailer big-endian:
        [2 magic][2 version][4 timestamp][4 payload_size][payload_size bytes][4 crc32]
    crc32 covers the payload only.

    payload, little-endian:
        [4 variant tag] then the variant's fields at fixed width
        SubmitData  (tag 0): [16 collector_id][8 total_memory][8 used_memory][4 f32 cpu]
        RequestWork (tag 1): [16 collector_id]
    collector ids go low 64 bits first.

    responses (server -> agent) are sent bare, with no header or crc:
        Ack (tag 0) | NoWork (tag 1) | Task (tag 2) [4 task type]
*/
class WireCodec {
public:
    static constexpr uint16_t kMagic = 1234;
    static constexpr uint16_t kVersion = 1;
    static constexpr std::size_t kHeaderSize = 12;
    static constexpr std::size_t kTrailerSize = 4;
    static constexpr uint32_t kMaxPayloadSize = 64 * 1024;

    // stamps the current unix time
    static std::vector<uint8_t> encode(const Command& command);
    static std::vector<uint8_t> encode(const Command& command, uint32_t timestamp);

    // throws FrameError. bytes past the end of the frame are ignored
    static DecodedFrame decode(const uint8_t* data, std::size_t len);
    static DecodedFrame decode(const std::vector<uint8_t>& data);

    // total frame length once the header is buffered, nullopt before that.
    // validates magic/version/size early so garbage is rejected without buffering it
    static std::optional<std::size_t> frame_size(const std::vector<uint8_t>& buffer);

    static std::vector<uint8_t> encode_payload(const Command& command);
    static Command decode_payload(const uint8_t* data, std::size_t len);

    static std::vector<uint8_t> encode_response(const Response& response);

    // nullopt if the buffer does not hold a whole response yet; throws FrameError on bad tags
    static std::optional<Response> decode_response(const std::vector<uint8_t>& data,
                                                   std::size_t& bytes_consumed);
};

[[nodiscard]] uint32_t unix_now();

}  // namespace hostwatch::proto

#endif
