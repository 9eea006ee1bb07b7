#pragma once

#include "corpus.hpp"
#include <filesystem>
#include <string>

namespace crackbank {

// Load a breaches.json style file:
//
//   { "<source>": { "date": "...", "risk_level": "...", "description": "...",
//                   "leaked_details": ["...", ...] }, ... }
//
// Never throws. A missing or malformed file gives an empty corpus (with a warning), because the
// check endpoint must stay up even without breach data. Bad individual entries are skipped.
corpus load_corpus(const std::filesystem::path& path);

// same rules, from an in-memory document
corpus parse_corpus(const std::string& json_text);

} // namespace crackbank
