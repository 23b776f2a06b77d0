#ifndef HOSTWATCH_AGENT_IDENTITY_HPP
#define HOSTWATCH_AGENT_IDENTITY_HPP

#include <filesystem>

#include "hostwatch/proto/collector_id.hpp"

namespace hostwatch::agent {

/*
    the collector id survives restarts: read it from path, or generate one and write it there
    if the file does not exist. a file that exists but can't be parsed is an error rather than a
    reason to mint a new identity, which would orphan the collector's history.
    throws std::runtime_error.
*/
[[nodiscard]] proto::CollectorId load_or_create_identity(const std::filesystem::path& path);

}  // namespace hostwatch::agent

#endif
