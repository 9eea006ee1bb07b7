#pragma once

#include "service.hpp"
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace crackbank::srv {

struct cli_config_t {
  std::string              corpus_filename = "breaches.json";
  std::string              bind_address    = "0.0.0.0";
  std::uint16_t            port            = 8000;
  unsigned int             threads         = std::thread::hardware_concurrency();
  unsigned int             latency_ms      = 1200;
  bool                     scan            = false;
  bool                     debug           = false;
  std::string              google_api_key;
  std::string              gemini_endpoint = "https://generativelanguage.googleapis.com/v1beta";
  std::string              gemini_model    = "gemini-2.5-flash-preview-05-20";
  unsigned int             gemini_timeout  = 30; // seconds
  std::vector<std::string> allowed_origins = {"https://crackbank-frontend.vercel.app",
                                              "http://localhost:5173"};
};

extern cli_config_t cli;

// blocks until the server is stopped (SIGINT)
void run_server(const breach_service& service);

} // namespace crackbank::srv
