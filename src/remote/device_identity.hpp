#pragma once

#include "core/errors/error.hpp"
#include "remote/connection_manager.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace tracr::remote {

// File on each board naming the registry entry it was first connected as.
constexpr std::string_view kRemoteIdentityPath = "~/.config/tracr/my_uuid.txt";

enum class IdentityOutcome {
  kMatched,
  kStamped,
};

// Reads the board's identity file and compares it with `session.device().id`.
// A board without the file is stamped with that id (verified push).
//
// Errors:
// - kInvalidState when the file names a different device: another board is
//   answering at the registered address.
// - Whatever Execute/Transfer report when the file cannot be read or written.
bool VerifyOrStampIdentity(ConnectionManager& manager, Session& session,
                           std::chrono::milliseconds timeout, IdentityOutcome& outcome,
                           core::errors::Error& error);

} // namespace tracr::remote
