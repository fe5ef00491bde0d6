#include <signal.h>

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "hostcall/context.hpp"
#include "hostcall/dispatcher.hpp"
#include "hostcall/program_loader.hpp"
#include "hostcall/version.hpp"

#ifndef HOSTCALL_VERSION
#define HOSTCALL_VERSION "0.0.0"
#endif

extern char** environ;

int main(int argc, char** argv) {
  if (argc >= 2 && std::string(argv[1]) == "--version") {
    std::cout << hostcall::version::manifest_to_json(
                     hostcall::version::current_manifest(HOSTCALL_VERSION))
              << "\n";
    return 0;
  }
  if (argc < 2) {
    std::cout << "Run as 'hostcall Program [arguments]'\n";
    return 1;
  }

  // A guest that dies mid-write must surface as a send error, not kill us.
  ::signal(SIGPIPE, SIG_IGN);

  hostcall::ExecutionContext ctx(hostcall::BridgeConfig::from_env(), std::cout);

  const auto platform = hostcall::detect_platform();
  if (!platform) {
    ctx.diagnostic("Unsupported platform");
    return ctx.controlled_exit(1, "unsupported_platform");
  }

  std::vector<std::string> arguments(argv + 2, argv + argc);
  const hostcall::LaunchFlags flags =
      hostcall::make_launch_flags(std::move(arguments), *platform, environ);

  hostcall::ExecutableLoader loader(ctx.config().js_runner);
  hostcall::LaunchResult launched;
  std::unique_ptr<hostcall::GuestProcess> guest = loader.launch(argv[1], flags, &launched);
  if (!guest) {
    ctx.diagnostic(launched.message);
    return ctx.controlled_exit(1, "launch_failed");
  }

  hostcall::Dispatcher dispatcher(guest->channel(), ctx);
  const int status = dispatcher.run();
  guest.reset();
  return status;
}
