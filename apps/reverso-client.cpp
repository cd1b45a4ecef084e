#include "reverso/client.hpp"
#include "reverso/text.hpp"
#include "reverso/transport.hpp"
#include "reverso/util.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace reverso;

static void usage() {
  std::cerr << "Usage:\n";
  std::cerr << "  reverso-client <server_ip> <server_port> <input_file> <Lmin> <Lmax>\n\n";
  std::cerr << "  server_port: 1024-65535\n";
  std::cerr << "  Lmin, Lmax : chunk length bounds, 0 < Lmin <= Lmax\n\n";
  std::cerr << "Example:\n";
  std::cerr << "  reverso-client 127.0.0.1 12345 notes.txt 5 20\n";
}

static void on_interrupt(int) {
  static const char msg[] = "\nInterrupted, client exiting without output\n";
  ssize_t n = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
  (void)n;
  std::_Exit(1);
}

int main(int argc, char** argv) {
  ClientArgs args;
  std::string text;
  try {
    args = parse_client_args(std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    usage();
    return 1;
  }

  std::signal(SIGINT, on_interrupt);

  try {
    text = load_input(args.input_path);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }

  try {
    log_line("client", "file size: " + std::to_string(text.size()) + " characters");
    log_line("client", "chunk range: " + std::to_string(args.lmin) + "-" +
                       std::to_string(args.lmax) + " characters per block");

    ClientRun run(split_chunks(text, args.lmin, args.lmax));
    log_line("client", "file split into " + std::to_string(run.block_count()) + " block(s)");

    TcpTransport t;
    run.execute(t, args.host, args.port);
    t.close();

    const std::string out_path = derive_output_path(args.input_path);
    ensure(write_file(out_path, run.assemble()), "failed to write output file");
    log_line("client", "reversal complete, result saved to " + out_path);
    return 0;
  } catch (const TransportError& e) {
    log_line("client", std::string("network error: ") + e.what() + "; no output written");
  } catch (const ProtocolError& e) {
    log_line("client", std::string("protocol error: ") + e.what() + "; no output written");
  } catch (const std::exception& e) {
    log_line("client", std::string("error: ") + e.what());
  }
  return 1;
}
