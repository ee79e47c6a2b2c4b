#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace gr4ft::utils {

// binary mode so line endings survive untouched
std::optional<std::string> read_file_string(const std::filesystem::path& file_path);

// file system utilities
bool file_exists(const std::filesystem::path& file_path);

// absolute, lexically normalized form used to identify a file across runs
std::string canonical_key(const std::filesystem::path& file_path);

} // namespace gr4ft::utils
