#include "corpus.hpp"
#include "corpus_loader.hpp"
#include "crackbank.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "notify.hpp"
#include "report.hpp"
#include "srv/payload.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <fmt/chrono.h> // IWYU pragma: keep
#include <fmt/format.h>
#include <iostream>
#include <optional>
#include <string>

struct cli_config_t {
  std::string                corpus_filename;
  std::string                identifier;
  std::optional<std::string> notify;
  bool                       hash  = false;
  bool                       scan  = false;
  bool                       json  = false;
  bool                       debug = false;
};

void define_options(CLI::App& app, cli_config_t& cli) {

  app.add_option("corpus_filename", cli.corpus_filename, "The breaches json file")->required();

  app.add_option("identifier", cli.identifier,
                 "The plain text identifier to look for in the breaches file")
      ->required();

  app.add_flag("--hash", cli.hash,
               "Provide a sha1 hash on command line, instead of a plain text identifier.");

  app.add_flag("--scan", cli.scan,
               "Hash every leaked detail for the query, instead of using the digest index.");

  app.add_flag("--json", cli.json, "Output the json response the server would give.");

  app.add_option("--notify", cli.notify,
                 "Print the notification email that would be sent to this address.");

  app.add_flag("--debug", cli.debug, "Report corpus loading details on stderr.");
}

void run_check(const cli_config_t& cli) {
  const crackbank::corpus breaches = crackbank::load_corpus(cli.corpus_filename);

  const crackbank::digest needle =
      cli.hash ? crackbank::normalize(cli.identifier) : crackbank::digest_of(cli.identifier);

  using clk       = std::chrono::high_resolution_clock;
  using fmilli    = std::chrono::duration<double, std::milli>;
  auto start_time = clk::now();

  const auto found = crackbank::match(
      needle, breaches, cli.scan ? crackbank::match_mode::scan : crackbank::match_mode::indexed);

  auto elapsed = duration_cast<fmilli>(clk::now() - start_time);

  crackbank::console_notifier notifier{std::cout};
  const auto                  result = crackbank::build_report(found, cli.notify, notifier);

  if (cli.json) {
    std::cout << crackbank::srv::to_json(result) << "\n";
    return;
  }

  std::cerr << fmt::format("search of {} breaches took {:.2}\n", breaches.size(), elapsed);
  std::cout << "needle = " << needle << "\n";
  if (!result.breached) {
    std::cout << "not found\n";
    return;
  }
  for (const auto& m: result.matches) {
    std::cout << fmt::format("found  = {} | {} | {} | {}\n", m.source, crackbank::or_na(m.date),
                             crackbank::to_string(m.risk), crackbank::or_na(m.description));
  }
}

int main(int argc, char* argv[]) {
  cli_config_t cli;

  CLI::App app("Check an identifier against a breaches file");
  define_options(app, cli);
  CLI11_PARSE(app, argc, argv);

  try {
    crackbank::logger.debug = cli.debug;
    run_check(cli);
  } catch (const std::exception& e) {
    std::cerr << "something went wrong: " << e.what() << "\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
