#include "config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace {
int get_int(const json& j, const char* key) {
  if (!j.is_number_integer()) throw ConfigError(std::string("config: \"") + key + "\" must be an integer");
  bool in_range = j.is_number_unsigned()
    ? j.get<unsigned long long>() <= (unsigned long long)std::numeric_limits<int>::max()
    : (j.get<long long>() >= std::numeric_limits<int>::min() &&
       j.get<long long>() <= std::numeric_limits<int>::max());
  if (!in_range) throw ConfigError(std::string("config: \"") + key + "\" out of range: " + j.dump());
  return j.get<int>();
}

std::string get_string(const json& j, const std::string& key) {
  if (!j.is_string()) throw ConfigError("config: \"" + key + "\" must be a string");
  return j.get<std::string>();
}
}

void apply_config(const std::string& json_text, Args& a) {
  json j;
  try {
    j = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("config: ") + e.what());
  }
  if (!j.is_object()) throw ConfigError("config: top level must be an object");

  for (auto it = j.begin(); it != j.end(); ++it) {
    const auto& key = it.key();
    const auto& v = it.value();
    if (key == "chunk_size") a.chunk_size = get_int(v, "chunk_size");
    else if (key == "chunk_overlap") a.chunk_overlap = get_int(v, "chunk_overlap");
    else if (key == "min_chunk_chars") a.min_chunk_chars = get_int(v, "min_chunk_chars");
    else if (key == "output") a.output_path = get_string(v, key);
    else if (key == "extensions") {
      if (!v.is_array()) throw ConfigError("config: \"extensions\" must be an array");
      std::string list;
      for (auto& e : v) list += get_string(e, "extensions[]") + ",";
      a.extensions = parse_extensions(list);
    } else if (key == "patterns") {
      if (!v.is_array()) throw ConfigError("config: \"patterns\" must be an array");
      for (auto& p : v) {
        if (!p.is_object()) throw ConfigError("config: pattern entries must be objects");
        if (!p.contains("name") || !p.contains("regex") || !p.contains("placeholder"))
          throw ConfigError("config: pattern needs \"name\", \"regex\" and \"placeholder\"");
        a.extra_patterns.push_back(PatternRule{ Category::CUSTOM,
                                                get_string(p["name"], "name"),
                                                get_string(p["regex"], "regex"),
                                                get_string(p["placeholder"], "placeholder") });
      }
    } else {
      throw ConfigError("config: unknown key \"" + key + "\"");
    }
  }
}

void load_config(const std::string& path, Args& a) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw ConfigError("config: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  apply_config(ss.str(), a);
}
