#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace toolrelay::util::json {

using json = nlohmann::json;

// Parse without throwing; malformed input yields a value where is_discarded() is true
inline json try_parse(const std::string& s) {
  return json::parse(s, nullptr, /*allow_exceptions=*/false);
}

// Scalars render as plain text, containers as compact JSON.
inline std::string to_text(const json& j) {
  if (j.is_string()) return j.get<std::string>();
  if (j.is_null()) return "";
  return j.dump();
}

// Tool-call arguments arrive either as an object or as JSON text.
inline json arguments_object(const json& args) {
  if (args.is_object()) return args;
  if (args.is_string()) {
    json parsed = try_parse(args.get<std::string>());
    if (parsed.is_object()) return parsed;
  }
  return json::object();
}

} // namespace toolrelay::util::json
