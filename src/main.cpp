#include "h1stream/cli/commands.hpp"

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("h1stream-dump - Incremental HTTP/1.x request parser");
  std::println("Usage: {} [OPTIONS] [FILE]", prog);
  std::println("");
  std::println("Reads a raw request capture from FILE (or stdin) and prints");
  std::println("one JSON object per parser event.");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Parser config file (YAML)");
  std::println("  --fragment <n>        Feed the input in n-byte fragments");
  std::println(
      "  --log-level <level>   trace, debug, info, warn, error or off");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} request.txt                   # whole capture", prog);
  std::println("  {} --fragment 1 request.txt      # byte by byte", prog);
  std::println("  cat pipeline.txt | {} -c h1stream.yaml", prog);
}

void print_version() {
  std::println("h1stream-dump v0.1.0");
}

auto parse_size(std::string_view text) -> std::size_t {
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    std::println(stderr, "Error: invalid number: {}", text);
    std::exit(1);
  }
  return value;
}

auto parse_args(int argc, char* argv[]) -> h1stream::cli::DumpOptions {
  h1stream::cli::DumpOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "--fragment") {
      if (++i >= argc) {
        std::println(stderr, "Error: --fragment requires an argument");
        std::exit(1);
      }
      opts.fragment_size = parse_size(argv[i]);
    } else if (arg == "--log-level") {
      if (++i >= argc) {
        std::println(stderr, "Error: --log-level requires an argument");
        std::exit(1);
      }
      opts.log_level = argv[i];
    } else if (arg == "-" || !arg.starts_with('-')) {
      if (!opts.input_file.empty()) {
        std::println(stderr, "Error: only one input file is supported");
        std::exit(1);
      }
      opts.input_file = argv[i];
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);
  return h1stream::cli::cmd_dump(opts);
}
