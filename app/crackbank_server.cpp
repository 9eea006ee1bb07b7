#include "corpus.hpp"
#include "corpus_loader.hpp"
#include "gemini.hpp"
#include "log.hpp"
#include "matcher.hpp"
#include "notify.hpp"
#include "service.hpp"
#include "srv/server.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <iostream>

void define_options(CLI::App& app, crackbank::srv::cli_config_t& cli) {

  app.add_option("--corpus", cli.corpus_filename,
                 fmt::format("The breaches json file. A missing or broken file means no known "
                             "breaches. (default: {})",
                             cli.corpus_filename));

  app.add_option(
      "--bind-address", cli.bind_address,
      fmt::format("The IP4 address the server will bind to. (default: {})", cli.bind_address));

  app.add_option("--port", cli.port,
                 fmt::format("The port the server will bind to (default: {})", cli.port))
      ->envname("PORT");

  app.add_option("--threads", cli.threads,
                 fmt::format("The number of threads to use (default: {})", cli.threads))
      ->check(CLI::Range(1U, cli.threads));

  app.add_option("--latency-ms", cli.latency_ms,
                 fmt::format("Fixed pause added to every check, 0 to disable (default: {})",
                             cli.latency_ms));

  app.add_flag("--scan", cli.scan,
               "Hash the whole corpus for every query instead of using the digest index.");

  app.add_flag("--debug", cli.debug, "Log every request to stderr.");

  app.add_option("--google-api-key", cli.google_api_key,
                 "Key for the generative language api. Needed for /summarize-breach only.")
      ->envname("GOOGLE_API_KEY");

  app.add_option("--gemini-endpoint", cli.gemini_endpoint,
                 fmt::format("Base url of the generative language api (default: {})",
                             cli.gemini_endpoint));

  app.add_option("--gemini-model", cli.gemini_model,
                 fmt::format("Model used for summaries (default: {})", cli.gemini_model));

  app.add_option("--gemini-timeout", cli.gemini_timeout,
                 fmt::format("Seconds before a summary request is abandoned (default: {})",
                             cli.gemini_timeout))
      ->check(CLI::Range(1U, 600U));

  app.add_option("--allow-origin", cli.allowed_origins,
                 "Origins allowed to make cross site requests. Repeat for more than one.");
}

namespace crackbank::srv {
cli_config_t cli;
} // namespace crackbank::srv

int main(int argc, char* argv[]) {
  using crackbank::srv::cli;

  CLI::App app("Crack Bank breach check server");
  define_options(app, cli);
  CLI11_PARSE(app, argc, argv);

  try {
    crackbank::logger.debug = cli.debug;
    crackbank::init_curl();

    if (cli.google_api_key.empty()) {
      crackbank::logger.warn("GOOGLE_API_KEY not set. /summarize-breach will fail.");
    }

    // loaded before the server starts any threads and never changed afterwards
    const crackbank::corpus breaches = crackbank::load_corpus(cli.corpus_filename);

    crackbank::console_notifier  notifier{std::cout};
    crackbank::gemini_summarizer summarizer{{
        .api_key  = cli.google_api_key,
        .endpoint = cli.gemini_endpoint,
        .model    = cli.gemini_model,
        .timeout  = std::chrono::seconds{cli.gemini_timeout},
    }};

    const crackbank::breach_service service{
        breaches, notifier, summarizer,
        crackbank::delay_policy::fixed(std::chrono::milliseconds{cli.latency_ms}),
        cli.scan ? crackbank::match_mode::scan : crackbank::match_mode::indexed};

    crackbank::srv::run_server(service);
    crackbank::shutdown_curl();
  } catch (const std::exception& e) {
    std::cerr << "something went wrong: " << e.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
