#pragma once

#include "core/errors/error.hpp"

#include <cstdint>
#include <string>

namespace tracr::remote {
class ConnectionManager;
class Session;
} // namespace tracr::remote

namespace tracr::deploy {

struct CollectionTarget {
  std::string run_id;
  std::string device_id;
  std::string role;
  // Telemetry log on the device, as written by the monitoring wrapper.
  std::string remote_log_path;
};

struct CollectionStats {
  std::uint64_t accepted = 0;
  std::uint64_t malformed = 0;
  std::uint64_t foreign = 0;
};

// Pulls run artifacts off a device over the worker's exclusive session.
//
// `CollectLive` is called between status polls while a container runs;
// `CollectFinal` once after it exits. Implementations must not count a
// line twice across the two.
class IRunArtifactCollector {
public:
  virtual ~IRunArtifactCollector() = default;

  virtual bool CollectLive(remote::ConnectionManager& connections, remote::Session& session,
                           const CollectionTarget& target, CollectionStats& stats,
                           core::errors::Error& error) = 0;

  virtual bool CollectFinal(remote::ConnectionManager& connections, remote::Session& session,
                            const CollectionTarget& target, CollectionStats& stats,
                            core::errors::Error& error) = 0;
};

} // namespace tracr::deploy
