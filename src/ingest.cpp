#include "ingest.hpp"
#include "text.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

using std::string;
namespace fs = std::filesystem;

// Suffix match on the lower-cased file name, so a dotfile named ".log" counts.
static bool is_text_ext(const string& filename, const std::vector<string>& exts) {
  for (auto& e : exts) {
    if (filename.size() >= e.size() &&
        filename.compare(filename.size() - e.size(), e.size(), e) == 0) return true;
  }
  return false;
}

std::vector<string> list_text_files(const string& root, const std::vector<string>& exts) {
  std::error_code ec;
  if (!fs::is_directory(root, ec))
    throw std::runtime_error("ingest: not a directory: " + root);

  std::vector<string> out;
  for (auto& p : fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied)) {
    if (!p.is_regular_file()) continue;
    auto name = p.path().filename().string();
    for (auto& c : name) c = (char)tolower((unsigned char)c);
    if (!is_text_ext(name, exts)) continue;
    out.push_back(p.path().string());
  }
  // directory iteration order is unspecified; output must be reproducible
  std::sort(out.begin(), out.end());
  return out;
}

string read_text_file(const string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("read failed: " + path);
  return drop_invalid_utf8(ss.str());
}

IngestSummary ingest_folder(const string& root,
                            const std::vector<string>& exts,
                            const Pipeline& pipeline,
                            RecordWriter& out,
                            std::ostream& log) {
  IngestSummary sum;
  for (auto& path : list_text_files(root, exts)) {
    auto name = fs::path(path).filename().string();

    string raw;
    try {
      raw = read_text_file(path);
    } catch (const std::exception& e) {
      log << "    [!] Error processing " << name << ": " << e.what() << "\n";
      ++sum.failed;
      continue;
    }
    if (is_blank(raw)) { ++sum.skipped; continue; }

    ScrubStats st;
    auto records = pipeline.process(name, raw, &st);
    for (auto& r : records) out.write(r);

    sum.chunks += records.size();
    sum.stats.merge(st);
    ++sum.files;
    log << "    [+] Processed: " << name << " (" << records.size() << " chunks)\n";
  }
  return sum;
}

size_t audit_records(std::istream& in, const Sanitizer& sanitizer, std::ostream& report) {
  auto records = read_records(in);
  size_t leaks = 0;
  for (size_t i = 0; i < records.size(); ++i) {
    auto st = sanitizer.scan(records[i].text);
    if (st.total == 0) continue;
    ++leaks;
    report << "record " << (i + 1) << " (" << records[i].source << "): " << st.to_string() << "\n";
  }
  return leaks;
}
