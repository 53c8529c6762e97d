#include "record.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <ostream>
#include <stdexcept>

using json = nlohmann::json;

namespace {
std::string quote(const std::string& s) {
  return json(s).dump(-1, ' ', /*ensure_ascii=*/true, json::error_handler_t::ignore);
}
}

std::string to_jsonl(const PipelineRecord& r) {
  // Key order and ", " / ": " separators are part of the file format.
  std::string line;
  line.reserve(r.source.size() + r.text.size() + 32);
  line.append("{\"source\": ");
  line.append(quote(r.source));
  line.append(", \"text\": ");
  line.append(quote(r.text));
  line.append("}\n");
  return line;
}

PipelineRecord parse_record(const std::string& line) {
  json j;
  try {
    j = json::parse(line);
  } catch (const json::parse_error& e) {
    throw RecordError(std::string("record: invalid json: ") + e.what());
  }
  if (!j.is_object()) throw RecordError("record: not a json object");

  auto field = [&](const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
      throw RecordError(std::string("record: missing string field \"") + key + "\"");
    return it->get<std::string>();
  };
  return PipelineRecord{ field("source"), field("text") };
}

std::vector<PipelineRecord> read_records(std::istream& in) {
  std::vector<PipelineRecord> out;
  std::string line;
  size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    if (is_blank(line)) continue;
    try {
      out.push_back(parse_record(line));
    } catch (const RecordError& e) {
      throw RecordError("line " + std::to_string(lineno) + ": " + e.what());
    }
  }
  return out;
}

RecordWriter::RecordWriter(std::ostream& out) : out_(out) {}

void RecordWriter::write(const PipelineRecord& r) {
  auto line = to_jsonl(r);
  out_.write(line.data(), (std::streamsize)line.size());
  if (!out_) throw std::runtime_error("record: write failed");
  ++count_;
}
