#ifndef HOSTWATCH_PROTO_TYPES_HPP
#define HOSTWATCH_PROTO_TYPES_HPP

#include <cstdint>
#include <string>
#include <variant>

#include "hostwatch/proto/collector_id.hpp"

namespace hostwatch::proto {

// control commands the server can push to an agent
enum class TaskType : uint32_t {
    Shutdown = 0,
};

// ----- agent -> server ------------------------------------------------------

struct SubmitData {
    CollectorId collector_id;
    uint64_t total_memory = 0;
    uint64_t used_memory = 0;
    float average_cpu_usage = 0.0f;

    friend bool operator==(const SubmitData& a, const SubmitData& b) {
        return a.collector_id == b.collector_id && a.total_memory == b.total_memory &&
               a.used_memory == b.used_memory && a.average_cpu_usage == b.average_cpu_usage;
    }
};

struct RequestWork {
    CollectorId collector_id;

    friend bool operator==(const RequestWork& a, const RequestWork& b) {
        return a.collector_id == b.collector_id;
    }
};

// exactly one of these occupies the payload of a frame
using Command = std::variant<SubmitData, RequestWork>;

// ----- server -> agent ------------------------------------------------------

enum class ResponseKind : uint32_t {
    Ack = 0,
    NoWork = 1,
    Task = 2,
};

struct Response {
    ResponseKind kind = ResponseKind::Ack;
    TaskType task = TaskType::Shutdown;  // meaningful only when kind == Task

    static Response ack() {
        return {ResponseKind::Ack, TaskType::Shutdown};
    }

    static Response no_work() {
        return {ResponseKind::NoWork, TaskType::Shutdown};
    }

    static Response make_task(TaskType task) {
        return {ResponseKind::Task, task};
    }

    friend bool operator==(const Response& a, const Response& b) {
        if (a.kind != b.kind) {
            return false;
        }
        return a.kind != ResponseKind::Task || a.task == b.task;
    }
    friend bool operator!=(const Response& a, const Response& b) {
        return !(a == b);
    }
};

[[nodiscard]] std::string to_string(TaskType task);
[[nodiscard]] std::string to_string(const Response& response);

}  // namespace hostwatch::proto

#endif
