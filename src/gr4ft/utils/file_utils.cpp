#include "file_utils.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace gr4ft::utils {

std::optional<std::string> read_file_string(const std::filesystem::path& file_path) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }

  std::string content;
  content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  if (file.bad()) {
    return std::nullopt;
  }
  return content;
}

bool file_exists(const std::filesystem::path& file_path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(file_path, ec);
}

std::string canonical_key(const std::filesystem::path& file_path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(file_path, ec);
  if (ec) {
    return file_path.lexically_normal().generic_string();
  }
  auto canonical = std::filesystem::weakly_canonical(absolute, ec);
  if (ec) {
    return absolute.lexically_normal().generic_string();
  }
  return canonical.generic_string();
}

} // namespace gr4ft::utils
