#pragma once
#include "patterns.hpp"
#include <string>
#include <vector>

struct Args {
  std::string mode;          // "chunk", "scrub" or "verify"
  std::string input_path;    // folder for chunk, file (or "-") for scrub, jsonl for verify
  std::string output_path = "./dataset/02_sanitized/chunks_sanitized.jsonl";
  std::string config_path;
  int chunk_size = 500;
  int chunk_overlap = 50;
  int min_chunk_chars = 50;
  std::vector<std::string> extensions = {".txt", ".log", ".md", ".json"};
  std::vector<PatternRule> extra_patterns;  // appended after the defaults
};

extern const char* USAGE;

// Throws CliError on bad arguments, ConfigError if --config cannot be loaded.
// A --config file is applied before the other flags, so flags win.
Args parse_cli(int argc, char** argv);

// Lower-case, leading dot, from a comma list like "txt,.LOG".
std::vector<std::string> parse_extensions(const std::string& list);
