#pragma once
#include "cli.hpp"
#include <string>

// JSON config, all keys optional:
//   {"chunk_size": 500, "chunk_overlap": 50, "min_chunk_chars": 50,
//    "extensions": [".txt"], "output": "out.jsonl",
//    "patterns": [{"name": "PHONE", "regex": "...", "placeholder": "[REDACTED_PHONE]"}]}
// Throws ConfigError on malformed json, unknown keys or wrong types.
void apply_config(const std::string& json_text, Args& a);
void load_config(const std::string& path, Args& a);
