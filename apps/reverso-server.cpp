#include "reverso/server.hpp"
#include "reverso/util.hpp"

#include <iostream>
#include <string>

using namespace reverso;

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Usage: reverso-server <port>\n";
    std::cerr << "  port: 1024-65535\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  reverso-server 12345\n";
    return 1;
  }

  int port = 0;
  try {
    std::size_t used = 0;
    port = std::stoi(argv[1], &used);
    ensure(used == std::string(argv[1]).size(), "trailing characters");
  } catch (const std::exception&) {
    std::cerr << "error: port must be an integer\n";
    return 1;
  }
  if (port < 1024 || port > 65535) {
    std::cerr << "error: port must be in the range 1024-65535\n";
    return 1;
  }

  try {
    ServerOptions opts;
    opts.port = (std::uint16_t)port;

    Server server(opts);
    server.start();

    {
      StopOnSignal stop(server);
      server.serve();
    }
    log_line("server", "server stopped");
    return 0;
  } catch (const std::exception& e) {
    log_line("server", std::string("error: ") + e.what());
    return 1;
  }
}
