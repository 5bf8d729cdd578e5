#pragma once

namespace tracr::network {
class IHostProber;
}

namespace tracr::remote {
class IRemoteShellFactory;
}

namespace tracr::cli {

// Collaborators `Dispatch` would otherwise build itself. Null members fall
// back to the production OpenSSH factory and TCP prober.
struct DispatchEnvironment {
  remote::IRemoteShellFactory* shell_factory = nullptr;
  network::IHostProber* prober = nullptr;
};

// Routes `tracr` subcommands and returns process exit codes with a stable
// contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args / bad config)
//   10 => descriptor or binding validation failed
//   20 => a device could not be reached
//   30 => a run finished with failed bindings
//   40 => registry contract violation (duplicate, unknown, immutable field)
int Dispatch(int argc, char** argv);
int Dispatch(int argc, char** argv, const DispatchEnvironment& environment);

} // namespace tracr::cli
