#include "hostwatch/proto/wire_codec.hpp"

#include <chrono>
#include <type_traits>

#include "hostwatch/util/binary_io.hpp"
#include "hostwatch/util/crc32.hpp"

namespace hostwatch::proto {

namespace util = hostwatch::util;

namespace {

constexpr uint32_t kTagSubmitData = 0;
constexpr uint32_t kTagRequestWork = 1;

constexpr std::size_t kIdSize = 16;
constexpr std::size_t kSubmitDataSize = 4 + kIdSize + 8 + 8 + 4;
constexpr std::size_t kRequestWorkSize = 4 + kIdSize;

void write_collector_id(std::vector<uint8_t>& buf, const CollectorId& id) {
    // a u128 in little-endian: low half first
    util::write_uint64_le(buf, id.lo);
    util::write_uint64_le(buf, id.hi);
}

CollectorId read_collector_id(const uint8_t* data) {
    CollectorId id;
    id.lo = util::read_uint64_le(data);
    id.hi = util::read_uint64_le(data + 8);
    return id;
}

void check_header(const uint8_t* data) {
    uint16_t magic = util::read_uint16_be(data);
    if (magic != WireCodec::kMagic) {
        throw FrameError(FrameErrorKind::BadMagic, "bad magic number " + std::to_string(magic));
    }
    uint16_t version = util::read_uint16_be(data + 2);
    if (version != WireCodec::kVersion) {
        throw FrameError(FrameErrorKind::BadVersion,
                         "unsupported version " + std::to_string(version));
    }
    uint32_t payload_size = util::read_uint32_be(data + 8);
    if (payload_size > WireCodec::kMaxPayloadSize) {
        throw FrameError(FrameErrorKind::Oversized,
                         "payload of " + std::to_string(payload_size) + " bytes exceeds limit");
    }
}

}  // namespace

const char* to_string(FrameErrorKind kind) {
    switch (kind) {
        case FrameErrorKind::Truncated:
            return "truncated";
        case FrameErrorKind::BadMagic:
            return "bad magic";
        case FrameErrorKind::BadVersion:
            return "bad version";
        case FrameErrorKind::BadChecksum:
            return "bad checksum";
        case FrameErrorKind::Oversized:
            return "oversized";
        case FrameErrorKind::Malformed:
            return "malformed";
    }
    return "unknown";
}

uint32_t unix_now() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

std::vector<uint8_t> WireCodec::encode_payload(const Command& command) {
    std::vector<uint8_t> payload;

    // std::visit calls the lambda with whichever alternative the variant holds
    std::visit(
        [&payload](const auto& cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, SubmitData>) {
                payload.reserve(kSubmitDataSize);
                util::write_uint32_le(payload, kTagSubmitData);
                write_collector_id(payload, cmd.collector_id);
                util::write_uint64_le(payload, cmd.total_memory);
                util::write_uint64_le(payload, cmd.used_memory);
                util::write_float32_le(payload, cmd.average_cpu_usage);
            } else {
                payload.reserve(kRequestWorkSize);
                util::write_uint32_le(payload, kTagRequestWork);
                write_collector_id(payload, cmd.collector_id);
            }
        },
        command);

    return payload;
}

Command WireCodec::decode_payload(const uint8_t* data, std::size_t len) {
    if (len < 4) {
        throw FrameError(FrameErrorKind::Malformed, "payload too short for a tag");
    }

    uint32_t tag = util::read_uint32_le(data);
    switch (tag) {
        case kTagSubmitData: {
            if (len != kSubmitDataSize) {
                throw FrameError(FrameErrorKind::Malformed, "bad SubmitData length");
            }
            SubmitData submit;
            submit.collector_id = read_collector_id(data + 4);
            submit.total_memory = util::read_uint64_le(data + 4 + kIdSize);
            submit.used_memory = util::read_uint64_le(data + 4 + kIdSize + 8);
            submit.average_cpu_usage = util::read_float32_le(data + 4 + kIdSize + 16);
            return submit;
        }
        case kTagRequestWork: {
            if (len != kRequestWorkSize) {
                throw FrameError(FrameErrorKind::Malformed, "bad RequestWork length");
            }
            return RequestWork{read_collector_id(data + 4)};
        }
        default:
            throw FrameError(FrameErrorKind::Malformed, "unknown command tag " + std::to_string(tag));
    }
}

std::vector<uint8_t> WireCodec::encode(const Command& command) {
    return encode(command, unix_now());
}

std::vector<uint8_t> WireCodec::encode(const Command& command, uint32_t timestamp) {
    std::vector<uint8_t> payload = encode_payload(command);
    uint32_t crc = util::crc32(payload);

    std::vector<uint8_t> result;
    result.reserve(kHeaderSize + payload.size() + kTrailerSize);
    util::write_uint16_be(result, kMagic);
    util::write_uint16_be(result, kVersion);
    util::write_uint32_be(result, timestamp);
    util::write_uint32_be(result, static_cast<uint32_t>(payload.size()));
    result.insert(result.end(), payload.begin(), payload.end());
    util::write_uint32_be(result, crc);
    return result;
}

DecodedFrame WireCodec::decode(const uint8_t* data, std::size_t len) {
    if (len < kHeaderSize) {
        throw FrameError(FrameErrorKind::Truncated, "incomplete frame header");
    }
    check_header(data);

    uint32_t timestamp = util::read_uint32_be(data + 4);
    uint32_t payload_size = util::read_uint32_be(data + 8);

    if (len < kHeaderSize + payload_size + kTrailerSize) {
        throw FrameError(FrameErrorKind::Truncated, "incomplete frame body");
    }

    const uint8_t* payload = data + kHeaderSize;
    uint32_t expected_crc = util::read_uint32_be(payload + payload_size);
    uint32_t actual_crc = util::crc32(payload, payload_size);
    if (expected_crc != actual_crc) {
        throw FrameError(FrameErrorKind::BadChecksum, "crc mismatch");
    }

    return DecodedFrame{timestamp, decode_payload(payload, payload_size)};
}

DecodedFrame WireCodec::decode(const std::vector<uint8_t>& data) {
    return decode(data.data(), data.size());
}

std::optional<std::size_t> WireCodec::frame_size(const std::vector<uint8_t>& buffer) {
    if (buffer.size() < kHeaderSize) {
        return std::nullopt;
    }
    check_header(buffer.data());
    return kHeaderSize + util::read_uint32_be(buffer.data() + 8) + kTrailerSize;
}

std::vector<uint8_t> WireCodec::encode_response(const Response& response) {
    std::vector<uint8_t> result;
    util::write_uint32_le(result, static_cast<uint32_t>(response.kind));
    if (response.kind == ResponseKind::Task) {
        util::write_uint32_le(result, static_cast<uint32_t>(response.task));
    }
    return result;
}

std::optional<Response> WireCodec::decode_response(const std::vector<uint8_t>& data,
                                                   std::size_t& bytes_consumed) {
    if (data.size() < 4) {
        return std::nullopt;
    }

    uint32_t tag = util::read_uint32_le(data.data());
    switch (tag) {
        case static_cast<uint32_t>(ResponseKind::Ack):
            bytes_consumed = 4;
            return Response::ack();

        case static_cast<uint32_t>(ResponseKind::NoWork):
            bytes_consumed = 4;
            return Response::no_work();

        case static_cast<uint32_t>(ResponseKind::Task): {
            if (data.size() < 8) {
                return std::nullopt;
            }
            uint32_t task = util::read_uint32_le(data.data() + 4);
            if (task != static_cast<uint32_t>(TaskType::Shutdown)) {
                throw FrameError(FrameErrorKind::Malformed,
                                 "unknown task type " + std::to_string(task));
            }
            bytes_consumed = 8;
            return Response::make_task(TaskType::Shutdown);
        }

        default:
            throw FrameError(FrameErrorKind::Malformed,
                             "unknown response tag " + std::to_string(tag));
    }
}

}  // namespace hostwatch::proto
