#include "hostwatch/server/admin_session.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <vector>

#include "hostwatch/util/logger.hpp"
#include "hostwatch/util/socket_io.hpp"

namespace hostwatch::server {

namespace {

// lines longer than this are not something an operator typed
constexpr std::size_t kMaxLineLength = 4096;

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

AdminReply error(const std::string& msg) {
    return {"ERROR " + msg + "\n", false};
}

// false on disconnect, error or an overlong line
bool read_line(int fd, std::string& buffer, std::string& line) {
    char chunk[512];
    while (true) {
        size_t pos = buffer.find('\n');
        if (pos != std::string::npos) {
            line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }
        if (buffer.size() > kMaxLineLength) {
            return false;
        }
        ssize_t n = util::recv_some(fd, chunk, sizeof(chunk));
        if (n <= 0) {
            return false;
        }
        buffer.append(chunk, static_cast<size_t>(n));
    }
}

}  // namespace

AdminReply AdminSession::execute(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    if (!(iss >> cmd)) {
        return error("empty command");
    }
    cmd = to_upper(cmd);

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) {
        args.push_back(arg);
    }

    if (cmd == "PING") {
        return {"OK PONG\n", false};
    }

    if (cmd == "QUIT" || cmd == "EXIT") {
        return {"BYE\n", true};
    }

    if (cmd == "SHUTDOWN") {
        if (args.size() != 1) {
            return error("usage: SHUTDOWN <collector-id>");
        }
        auto id = proto::CollectorId::parse(args[0]);
        if (!id) {
            return error("invalid collector id: " + args[0]);
        }
        commands_.set(*id, proto::TaskType::Shutdown);
        LOG_INFO("queued Shutdown for " + id->to_string());
        return {"OK\n", false};
    }

    if (cmd == "COLLECTORS") {
        auto collectors = store_.collectors();
        std::ostringstream out;
        out << "OK " << collectors.size() << "\n";
        for (const auto& c : collectors) {
            out << c.collector_id.to_string() << " " << c.last_seen << "\n";
        }
        return {out.str(), false};
    }

    if (cmd == "DATA") {
        if (args.size() != 1) {
            return error("usage: DATA <collector-id>");
        }
        auto id = proto::CollectorId::parse(args[0]);
        if (!id) {
            return error("invalid collector id: " + args[0]);
        }
        auto rows = store_.for_collector(*id);
        std::ostringstream out;
        out << "OK " << rows.size() << "\n";
        for (const auto& r : rows) {
            out << r.received << " " << r.total_memory << " " << r.used_memory << " "
                << r.average_cpu << "\n";
        }
        return {out.str(), false};
    }

    if (cmd == "ALL") {
        if (!args.empty()) {
            return error("usage: ALL");
        }
        auto rows = store_.all();
        std::ostringstream out;
        out << "OK " << rows.size() << "\n";
        for (const auto& r : rows) {
            out << r.collector_id.to_string() << " " << r.received << " " << r.total_memory
                << " " << r.used_memory << " " << r.average_cpu << "\n";
        }
        return {out.str(), false};
    }

    return error("unknown command: " + cmd);
}

void AdminSession::serve(int fd, const std::atomic<bool>& running) {
    std::string buffer;
    std::string line;

    while (running && read_line(fd, buffer, line)) {
        AdminReply reply;
        // storage errors go back to the operator instead of killing the session
        try {
            reply = execute(line);
        } catch (const std::exception& e) {
            reply = error(std::string("internal error: ") + e.what());
        }

        if (!util::send_all(fd, reply.text.data(), reply.text.size()) || reply.close_connection) {
            return;
        }
    }
}

}  // namespace hostwatch::server
