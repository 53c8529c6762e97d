#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

const char* USAGE =
"scrubchunk chunk <input_dir> [--out path] [--config path] [--chunk-size N] [--chunk-overlap N]\n"
"                 [--min-chunk-chars N] [--ext .txt,.log,...]\n"
"scrubchunk scrub <file|-> [--config path]\n"
"scrubchunk verify <jsonl> [--config path]\n";

namespace {
int to_int(const std::string& flag, const std::string& v) {
  size_t used = 0;
  int n = 0;
  try {
    n = std::stoi(v, &used);
  } catch (const std::exception&) {
    throw CliError("Bad number for " + flag + ": " + v);
  }
  if (used != v.size()) throw CliError("Bad number for " + flag + ": " + v);
  return n;
}
}

std::vector<std::string> parse_extensions(const std::string& list) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= list.size()) {
    size_t comma = list.find(',', pos);
    if (comma == std::string::npos) comma = list.size();
    std::string e = list.substr(pos, comma - pos);
    pos = comma + 1;
    if (e.empty()) continue;
    for (auto& c : e) c = (char)std::tolower((unsigned char)c);
    if (e[0] != '.') e.insert(e.begin(), '.');
    if (std::find(out.begin(), out.end(), e) == out.end()) out.push_back(e);
  }
  return out;
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) throw CliError("Missing mode");
  a.mode = argv[1];
  if (a.mode != "chunk" && a.mode != "scrub" && a.mode != "verify")
    throw CliError("Unknown mode: " + a.mode);
  if (argc < 3) throw CliError("Missing input path for " + a.mode);
  a.input_path = argv[2];

  // config first so that explicit flags override it
  for (int i = 3; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") a.config_path = argv[i + 1];
  }
  if (!a.config_path.empty()) load_config(a.config_path, a);

  int i = 3;
  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) throw CliError("Missing value after " + f);
      dst = argv[i++];
    };
    std::string v;
    if (f == "--config") next(v);
    else if (f == "--out") next(a.output_path);
    else if (f == "--chunk-size") { next(v); a.chunk_size = to_int(f, v); }
    else if (f == "--chunk-overlap") { next(v); a.chunk_overlap = to_int(f, v); }
    else if (f == "--min-chunk-chars") { next(v); a.min_chunk_chars = to_int(f, v); }
    else if (f == "--ext") { next(v); a.extensions = parse_extensions(v); }
    else throw CliError("Unknown flag: " + f);
  }
  if (a.extensions.empty()) throw CliError("No file extensions selected");
  return a;
}
