#include "cli.hpp"
#include "errors.hpp"
#include "ingest.hpp"
#include "pipeline.hpp"
#include "record.hpp"
#include "text.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

static PatternRegistry make_registry(const Args& args) {
  auto rules = PatternRegistry::default_rules();
  rules.insert(rules.end(), args.extra_patterns.begin(), args.extra_patterns.end());
  return PatternRegistry(rules);
}

static int run_chunk(const Args& args) {
  // validate everything before touching the output file
  Pipeline pipeline(Sanitizer(make_registry(args)),
                    Chunker(args.chunk_size, args.chunk_overlap, args.min_chunk_chars));

  std::cerr << "[:] Starting: clean & chunk\n";
  std::cerr << "[:] Input directory: " << args.input_path << "\n";

  auto parent = std::filesystem::path(args.output_path).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  std::ofstream out(args.output_path, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot open output " + args.output_path);

  RecordWriter writer(out);
  auto sum = ingest_folder(args.input_path, args.extensions, pipeline, writer, std::cerr);
  out.flush();
  if (!out) throw std::runtime_error("write failed: " + args.output_path);

  std::cerr << "[:] Processed " << sum.files << " files into " << sum.chunks << " chunks";
  if (sum.skipped) std::cerr << ", " << sum.skipped << " blank";
  if (sum.failed) std::cerr << ", " << sum.failed << " failed";
  std::cerr << ".\n";
  std::cerr << "[:] " << sum.stats.to_string() << "\n";
  std::cerr << "[:] Output saved to: " << args.output_path << "\n";
  return 0;
}

static int run_scrub(const Args& args) {
  Sanitizer sanitizer(make_registry(args));

  std::string raw;
  if (args.input_path == "-") {
    std::ostringstream ss; ss << std::cin.rdbuf();
    raw = drop_invalid_utf8(ss.str());
  } else {
    raw = read_text_file(args.input_path);
  }

  ScrubStats st;
  std::cout << sanitizer.clean(raw, &st);
  std::cerr << "[:] " << st.to_string() << "\n";
  return 0;
}

static int run_verify(const Args& args) {
  Sanitizer sanitizer(make_registry(args));

  std::ifstream in(args.input_path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + args.input_path);

  size_t leaks = audit_records(in, sanitizer, std::cout);
  if (leaks) {
    std::cerr << "[!] " << leaks << " record(s) still contain sensitive data.\n";
    return 2;
  }
  std::cerr << "[V] No leaks detected.\n";
  return 0;
}

int main(int argc, char** argv) {
  Args args;
  try {
    args = parse_cli(argc, argv);
  } catch (const CliError& e) {
    std::cerr << e.what() << "\n" << USAGE;
    return 1;
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  try {
    if (args.mode == "chunk") return run_chunk(args);
    if (args.mode == "scrub") return run_scrub(args);
    if (args.mode == "verify") return run_verify(args);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[!] " << e.what() << "\n";
    return 1;
  }
  return 1;
}
