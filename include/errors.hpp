#pragma once
#include <stdexcept>
#include <string>

// Bad chunker parameters, pattern rules or config file. Raised at setup time.
struct ConfigError : std::invalid_argument {
  explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// A JSONL line that is not a {"source", "text"} object.
struct RecordError : std::runtime_error {
  explicit RecordError(const std::string& what) : std::runtime_error(what) {}
};

struct CliError : std::invalid_argument {
  explicit CliError(const std::string& what) : std::invalid_argument(what) {}
};
