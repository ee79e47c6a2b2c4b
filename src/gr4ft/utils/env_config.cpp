#include "env_config.hpp"
#include "string_utils.hpp"
#include <cstdlib>
#include <exception>
#include <redlog.hpp>

namespace gr4ft::utils {

env_config::env_config(const std::string& prefix) : prefix_(prefix) {
  if (!prefix_.empty() && prefix_.back() != '_') {
    prefix_ += "_";
  }
}

std::string env_config::build_env_name(const std::string& name) const { return prefix_ + name; }

std::optional<std::string> env_config::find(const std::string& name) const {
  const char* value = std::getenv(build_env_name(name).c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const {
  auto value = find(name);
  return value ? *value : default_value;
}

template <> bool env_config::get<bool>(const std::string& name, bool default_value) const {
  auto value = find(name);
  if (!value) {
    return default_value;
  }

  std::string lower = to_lower(trim_view(*value));
  return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const {
  auto value = find(name);
  if (!value) {
    return default_value;
  }

  std::string problem = "trailing characters";
  try {
    size_t consumed = 0;
    unsigned long long parsed = std::stoull(*value, &consumed);
    if (consumed == value->size()) {
      return static_cast<size_t>(parsed);
    }
  } catch (const std::exception& e) {
    problem = e.what();
  }

  auto log = redlog::get_logger("gr4ft.env");
  log.wrn(
      "ignoring non-numeric value", redlog::field("variable", build_env_name(name)), redlog::field("value", *value),
      redlog::field("error", problem)
  );
  return default_value;
}

} // namespace gr4ft::utils
