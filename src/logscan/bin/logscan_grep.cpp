#include <logscan/common/config.h>
#include <logscan/fetch/http_transport.h>
#include <logscan/fetch/progressive_fetcher.h>
#include <logscan/reader/byte_source.h>
#include <logscan/reader/line_decoder.h>
#include <logscan/search/grep.h>
#include <logscan/search/render.h>
#include <spdlog/spdlog.h>

#include <argparse/argparse.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iostream>
#include <string>

#include "cli_common.h"

using namespace logscan;

static void write_results(const SearchResults &results, bool json,
                          std::size_t line_base, std::size_t *previous_line) {
  std::string out;
  if (json) {
    out = format_json(results, line_base);
    out.append(1, '\n');
  } else {
    out = format_text(results, line_base, previous_line);
  }
  std::fwrite(out.data(), 1, out.size(), stdout);
  std::fflush(stdout);
}

int main(int argc, char **argv) {
  argparse::ArgumentParser program("logscan_grep", LOGSCAN_PACKAGE_VERSION);
  program.add_description(
      "Search a local log (plain or gzip) or a progressive-text endpoint "
      "with bounded context");
  program.add_argument("source")
      .help("Log file path or http(s):// URL of a progressive-text endpoint")
      .required();
  program.add_argument("pattern")
      .help("Regular expression (ECMAScript syntax)")
      .required();
  program.add_argument("-C", "--context")
      .help("Lines of context before and after each match")
      .default_value<std::size_t>(0)
      .scan<'d', std::size_t>();
  program.add_argument("--offset")
      .help("Number of leading lines never treated as matches")
      .default_value<std::size_t>(0)
      .scan<'d', std::size_t>();
  program.add_argument("-m", "--max-count")
      .help("Stop after this many matches (default: 200)")
      .default_value<std::size_t>(constants::search::DEFAULT_MAX_COUNT)
      .scan<'d', std::size_t>();
  program.add_argument("--json").help("Print results as JSON").flag();
  program.add_argument("--follow")
      .help("Keep polling the endpoint and search every new increment")
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
  std::string pattern = program.get<std::string>("pattern");
  bool json = program.get<bool>("--json");
  bool follow = program.get<bool>("--follow");
  int interval_ms = program.get<int>("--interval");
  std::uint64_t start = program.get<std::uint64_t>("--start");
  int timeout_sec = program.get<int>("--timeout");

  if (!cli::init_logging("stderr",
                         program.get<std::string>("--log-level"))) {
    return cli::EXIT_USAGE;
  }

  SearchOptions options(pattern);
  options.set_context(program.get<std::size_t>("--context"))
      .set_offset(program.get<std::size_t>("--offset"))
      .set_max_count(program.get<std::size_t>("--max-count"));

  spdlog::debug("Source: {}", source);
  spdlog::debug("Pattern: {}", pattern);
  spdlog::debug("Context: {}, offset: {}, max count: {}", options.context,
                options.offset, options.max_count);

  if (options.max_count == 0) {
    spdlog::error("--max-count must be positive");
    return cli::EXIT_USAGE;
  }
  if (interval_ms < 0 || timeout_sec <= 0) {
    spdlog::error("--interval must be >= 0 and --timeout must be positive");
    return cli::EXIT_USAGE;
  }

  CancellationToken cancel;
  cli::install_sigint_handler(cancel);

  try {
    check_pattern(pattern);

    if (!is_url(source)) {
      if (follow) {
        spdlog::error("--follow requires an http(s):// source");
        return cli::EXIT_USAGE;
      }
      LineDecoder decoder(open_file_source(source));
      SearchResults results = grep(decoder, options, &cancel);
      spdlog::debug("Found {} matches in {} entries", count_matches(results),
                    results.size());
      write_results(results, json, 0, nullptr);
      return cli::EXIT_OK;
    }

    UrlParts url = split_url(source);
    HttpTransport transport(
        HttpTransportConfig(url.base).set_read_timeout_sec(timeout_sec));
    ProgressiveFetcher fetcher(transport);

    if (!follow) {
      write_results(fetcher.grep(url.path, options, start, &cancel), json, 0,
                    nullptr);
      return cli::EXIT_OK;
    }

    std::size_t previous_line = 0;
    FollowOptions follow_options{std::chrono::milliseconds(interval_ms)};
    follow_options.set_cancel(&cancel);
    std::uint64_t size = fetcher.follow(
        url.path, start,
        [&](const Increment &increment, LineSource &lines) {
          SearchResults results = grep(lines, options, &cancel);
          spdlog::debug("Increment {} at offset {}: {} matches",
                        increment.sequence, increment.start_offset,
                        count_matches(results));
          if (json && results.empty()) {
            return;
          }
          write_results(results, json, increment.lines_before,
                        &previous_line);
        },
        follow_options);
    spdlog::info("Log complete at {} bytes", size);
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
