#include "hostwatch/proto/types.hpp"

namespace hostwatch::proto {

std::string to_string(TaskType task) {
    switch (task) {
        case TaskType::Shutdown:
            return "Shutdown";
    }
    return "Unknown";
}

std::string to_string(const Response& response) {
    switch (response.kind) {
        case ResponseKind::Ack:
            return "Ack";
        case ResponseKind::NoWork:
            return "NoWork";
        case ResponseKind::Task:
            return "Task(" + to_string(response.task) + ")";
    }
    return "Unknown";
}

}  // namespace hostwatch::proto
