#include "hostwatch/agent/identity.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include "hostwatch/util/logger.hpp"

namespace hostwatch::agent {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // namespace

proto::CollectorId load_or_create_identity(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        std::ifstream in(path);
        if (!in.is_open()) {
            throw std::runtime_error("failed to open identity file: " + path.string());
        }
        std::string contents;
        std::getline(in, contents);

        auto id = proto::CollectorId::parse(trim(contents));
        if (!id) {
            throw std::runtime_error("identity file " + path.string() +
                                     " does not hold a collector id");
        }
        LOG_INFO("collector id " + id->to_string());
        return *id;
    }

    proto::CollectorId id = proto::CollectorId::generate();

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream out(path, std::ios::trunc);
    out << id.to_string() << "\n";
    out.flush();
    if (!out.good()) {
        throw std::runtime_error("failed to write identity file: " + path.string());
    }

    LOG_INFO("generated collector id " + id.to_string() + " -> " + path.string());
    return id;
}

}  // namespace hostwatch::agent
