#include <logscan/common/config.h>
#include <logscan/fetch/http_transport.h>
#include <logscan/fetch/progressive_fetcher.h>
#include <logscan/reader/byte_source.h>
#include <logscan/reader/line_decoder.h>
#include <logscan/reader/line_processor.h>
#include <logscan/search/log_window.h>
#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>

#include "cli_common.h"

using namespace logscan;

// Writes each line to stdout as it is decoded
class PrintLineProcessor : public LineProcessor {
 public:
  bool process(const Line &line) override {
    std::fwrite(line.text.data(), 1, line.text.size(), stdout);
    std::fputc('\n', stdout);
    return true;
  }

  void end() override { std::fflush(stdout); }
};

static void write_window(const LogWindow &window, bool json) {
  std::string out;
  if (json) {
    out = format_json(window);
    out.append(1, '\n');
  } else if (!window.lines.empty()) {
    out = window.content();
    out.append(1, '\n');
  }
  std::fwrite(out.data(), 1, out.size(), stdout);
  std::fflush(stdout);
}

int main(int argc, char **argv) {
  argparse::ArgumentParser program("logscan_tail", LOGSCAN_PACKAGE_VERSION);
  program.add_description(
      "Print a local log (plain or gzip) or a progressive-text endpoint, "
      "optionally as a head/tail/offset window or following new output");
  program.add_argument("source")
      .help("Log file path or http(s):// URL of a progressive-text endpoint")
      .required();
  program.add_argument("--head").help("Print the first -n lines").flag();
  program.add_argument("--tail").help("Print the last -n lines").flag();
  program.add_argument("--offset")
      .help("Print -n lines starting at this 0-based line index")
      .default_value<std::int64_t>(-1)
      .scan<'d', std::int64_t>();
  program.add_argument("-n", "--lines")
      .help("Window size in lines (default: 200)")
      .default_value<std::size_t>(constants::search::DEFAULT_WINDOW_LINES)
      .scan<'d', std::size_t>();
  program.add_argument("--json")
      .help("Print the window as JSON with line counts")
      .flag();
  program.add_argument("--follow")
      .help("Keep polling the endpoint and print new lines as they arrive")
      .flag();
  program.add_argument("--interval")
      .help("Poll interval in milliseconds for --follow")
      .default_value<int>(
          static_cast<int>(constants::fetch::DEFAULT_POLL_INTERVAL.count()))
      .scan<'d', int>();
  program.add_argument("--start")
      .help("Initial byte offset into the remote log")
      .default_value<std::uint64_t>(0)
      .scan<'d', std::uint64_t>();
  program.add_argument("--timeout")
      .help("HTTP read timeout in seconds")
      .default_value<int>(constants::fetch::DEFAULT_READ_TIMEOUT_SEC)
      .scan<'d', int>();
  program.add_argument("--log-level")
      .help(
          "Set logging level (trace, debug, info, warn, error, critical, off)")
      .default_value<std::string>("warn");

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception &err) {
    spdlog::error("Error occurred: {}", err.what());
    std::cerr << program;
    return cli::EXIT_USAGE;
  }

  std::string source = program.get<std::string>("source");
  bool head = program.get<bool>("--head");
  bool tail = program.get<bool>("--tail");
  std::int64_t offset = program.get<std::int64_t>("--offset");
  std::size_t lines = program.get<std::size_t>("--lines");
  bool json = program.get<bool>("--json");
  bool follow = program.get<bool>("--follow");
  int interval_ms = program.get<int>("--interval");
  std::uint64_t start = program.get<std::uint64_t>("--start");
  int timeout_sec = program.get<int>("--timeout");

  if (!cli::init_logging("stderr",
                         program.get<std::string>("--log-level"))) {
    return cli::EXIT_USAGE;
  }

  int positions = (head ? 1 : 0) + (tail ? 1 : 0) + (offset >= 0 ? 1 : 0);
  if (positions > 1) {
    spdlog::error("--head, --tail and --offset are mutually exclusive");
    return cli::EXIT_USAGE;
  }
  std::optional<WindowOptions> window_options;
  if (head) {
    window_options = WindowOptions::head(lines);
  } else if (tail) {
    window_options = WindowOptions::tail(lines);
  } else if (offset >= 0) {
    window_options = WindowOptions::at(static_cast<std::size_t>(offset), lines);
  }

  if (window_options && follow) {
    spdlog::error("--follow cannot be combined with a window option");
    return cli::EXIT_USAGE;
  }
  if (json && !window_options) {
    spdlog::error("--json requires --head, --tail or --offset");
    return cli::EXIT_USAGE;
  }
  if (lines == 0) {
    spdlog::error("--lines must be positive");
    return cli::EXIT_USAGE;
  }
  if (interval_ms < 0 || timeout_sec <= 0) {
    spdlog::error("--interval must be >= 0 and --timeout must be positive");
    return cli::EXIT_USAGE;
  }

  CancellationToken cancel;
  cli::install_sigint_handler(cancel);

  try {
    if (!is_url(source)) {
      if (follow) {
        spdlog::error("--follow requires an http(s):// source");
        return cli::EXIT_USAGE;
      }
      LineDecoder decoder(open_file_source(source));
      if (window_options) {
        write_window(read_window(decoder, *window_options, &cancel), json);
      } else {
        PrintLineProcessor printer;
        std::size_t count = process_lines(decoder, printer, &cancel);
        spdlog::debug("Printed {} lines", count);
      }
      return cli::EXIT_OK;
    }

    UrlParts url = split_url(source);
    HttpTransport transport(
        HttpTransportConfig(url.base).set_read_timeout_sec(timeout_sec));
    ProgressiveFetcher fetcher(transport);

    if (window_options) {
      write_window(fetcher.window(url.path, *window_options, start, &cancel),
                   json);
      return cli::EXIT_OK;
    }

    PrintLineProcessor printer;
    auto print_increment = [&](const Increment &increment,
                               LineSource &increment_lines) {
      std::size_t count = process_lines(increment_lines, printer, &cancel);
      spdlog::debug("Increment {} at offset {}: {} lines", increment.sequence,
                    increment.start_offset, count);
    };

    if (follow) {
      FollowOptions follow_options{std::chrono::milliseconds(interval_ms)};
      follow_options.set_cancel(&cancel);
      std::uint64_t size =
          fetcher.follow(url.path, start, print_increment, follow_options);
      spdlog::info("Log complete at {} bytes", size);
    } else {
      auto next = fetcher.fetch(url.path, start, print_increment);
      if (next) {
        spdlog::info("More output pending; resume with --start {}", *next);
      }
    }
  } catch (const Error &e) {
    int code = cli::exit_code_for(e);
    if (code == cli::EXIT_CANCELLED) {
      spdlog::warn("Interrupted: {}", e.what());
    } else {
      spdlog::error("{}", e.what());
    }
    return code;
  }

  return cli::EXIT_OK;
}
