#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace gr4ft::utils {

// reads PREFIX_NAME environment variables with typed defaults
class env_config {
public:
  explicit env_config(const std::string& prefix = "");

  template <typename T> T get(const std::string& name, T default_value) const;

  // raw value when the variable is set and non-empty
  std::optional<std::string> find(const std::string& name) const;

  std::string build_env_name(const std::string& name) const;

private:
  std::string prefix_;
};

template <> std::string env_config::get<std::string>(const std::string& name, std::string default_value) const;
template <> bool env_config::get<bool>(const std::string& name, bool default_value) const;
template <> size_t env_config::get<size_t>(const std::string& name, size_t default_value) const;

} // namespace gr4ft::utils
