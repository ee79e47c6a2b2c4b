#pragma once

#include "result.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace gr4ft::engine {

// how a failed snapshot affects a step that only adds content.
// destructive steps always require a snapshot.
enum class backup_policy { strict, best_effort };

const char* backup_policy_name(backup_policy policy);

struct backup_record {
  std::filesystem::path path;
  std::filesystem::path source;
  // utc stamp with a tie-break suffix, sorts chronologically as text
  std::string stamp;
};

// timestamped copies of a file in a dedicated directory with bounded retention per source file
class backup_manager {
public:
  static constexpr size_t default_retention = 5;

  explicit backup_manager(std::filesystem::path directory, size_t retention = default_retention);

  const std::filesystem::path& directory() const noexcept { return directory_; }
  size_t retention() const noexcept { return retention_; }

  // copies the source into the backup directory, then evicts beyond the retention count
  result<backup_record> snapshot(const std::filesystem::path& source);

  // backups of this source, newest first
  result<std::vector<backup_record>> list(const std::filesystem::path& source) const;

  // deletes the oldest backups of this source beyond the retention count; returns how many were removed
  result<size_t> enforce_retention(const std::filesystem::path& source);

  // common file name prefix for every backup of the source
  static std::string backup_prefix(const std::filesystem::path& source);

private:
  std::filesystem::path directory_;
  size_t retention_;
};

} // namespace gr4ft::engine
