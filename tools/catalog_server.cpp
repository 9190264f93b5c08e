#include <catalog/server/config.hpp>
#include <catalog/server/server.hpp>

#include <trantor/utils/Logger.h>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace {

// Faults outside request handling have no supervisor: log and exit.
[[noreturn]] void OnTerminate() {
  if (auto ep = std::current_exception()) {
    try {
      std::rethrow_exception(ep);
    } catch (const std::exception& e) {
      std::cerr << "UNCAUGHT EXCEPTION! Shutting down...\n" << e.what() << std::endl;
    } catch (...) {
      std::cerr << "UNCAUGHT EXCEPTION! Shutting down..." << std::endl;
    }
  } else {
    std::cerr << "Terminated without an active exception. Shutting down..." << std::endl;
  }
  std::_Exit(EXIT_FAILURE);
}

}  // namespace

int main(int argc, char** argv) {
  std::set_terminate(OnTerminate);

  try {
    // Parse configuration from command line (and optionally config file)
    auto config = catalog::server::Config::LoadFromArgs(argc, argv);

    // Create and run server
    catalog::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    LOG_ERROR << "Startup failed: " << e.what();
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
