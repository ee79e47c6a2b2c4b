#include "backup_manager.hpp"
#include "utils/file_utils.hpp"
#include "utils/string_utils.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cstdio>
#include <redlog.hpp>
#include <system_error>

namespace gr4ft::engine {

namespace {

constexpr const char* backup_extension = ".bak";
constexpr int max_same_stamp = 100;

std::string two_digits(int value) {
  char buffer[8];
  std::snprintf(buffer, sizeof(buffer), "%02d", value);
  return std::string(buffer);
}

} // namespace

const char* backup_policy_name(backup_policy policy) {
  switch (policy) {
  case backup_policy::strict:
    return "strict";
  case backup_policy::best_effort:
    return "best_effort";
  }
  return "unknown";
}

backup_manager::backup_manager(std::filesystem::path directory, size_t retention)
    : directory_(std::move(directory)), retention_(retention) {}

std::string backup_manager::backup_prefix(const std::filesystem::path& source) {
  return source.filename().string() + "." + utils::to_hex_u64(utils::fnv1a_64(utils::canonical_key(source))) + ".";
}

result<backup_record> backup_manager::snapshot(const std::filesystem::path& source) {
  auto log = redlog::get_logger("gr4ft.backup");

  if (!utils::file_exists(source)) {
    return error_result<backup_record>(error_code::backup_failed, "nothing to back up: " + source.string() + " is missing");
  }

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    log.err(
        "failed to create backup directory", redlog::field("dir", directory_.string()),
        redlog::field("error", ec.message())
    );
    return error_result<backup_record>(
        error_code::backup_failed, "cannot create backup directory " + directory_.string() + ": " + ec.message()
    );
  }

  std::string prefix = backup_prefix(source);
  std::string stamp_base = utils::format_timestamp_utc_compact_us();

  backup_record record;
  record.source = source;
  bool reserved = false;
  for (int seq = 0; seq < max_same_stamp; ++seq) {
    record.stamp = stamp_base + "-" + two_digits(seq);
    record.path = directory_ / (prefix + record.stamp + backup_extension);
    if (!std::filesystem::exists(record.path, ec)) {
      reserved = true;
      break;
    }
  }
  if (!reserved) {
    return error_result<backup_record>(error_code::backup_failed, "too many backups within one timestamp");
  }

  std::filesystem::copy_file(source, record.path, std::filesystem::copy_options::none, ec);
  if (ec) {
    log.err(
        "failed to copy backup", redlog::field("source", source.string()), redlog::field("target", record.path.string()),
        redlog::field("error", ec.message())
    );
    std::error_code cleanup_ec;
    std::filesystem::remove(record.path, cleanup_ec);
    return error_result<backup_record>(
        error_code::backup_failed, "cannot write backup " + record.path.string() + ": " + ec.message()
    );
  }

  log.inf("created backup", redlog::field("source", source.string()), redlog::field("backup", record.path.string()));

  auto evicted = enforce_retention(source);
  if (!evicted.ok()) {
    // the snapshot itself exists; a failed eviction only leaves extra history behind
    log.wrn("backup retention not enforced", redlog::field("error", evicted.status_info.message));
  }

  return ok_result(record);
}

result<std::vector<backup_record>> backup_manager::list(const std::filesystem::path& source) const {
  std::vector<backup_record> records;

  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    return ok_result(records);
  }

  const std::string prefix = backup_prefix(source);
  const std::string extension = backup_extension;

  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    return error_result<std::vector<backup_record>>(
        error_code::io_error, "cannot read backup directory " + directory_.string() + ": " + ec.message()
    );
  }

  for (const auto& entry : it) {
    std::string name = entry.path().filename().string();
    if (name.size() <= prefix.size() + extension.size()) {
      continue;
    }
    if (name.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    if (name.compare(name.size() - extension.size(), extension.size(), extension) != 0) {
      continue;
    }

    backup_record record;
    record.path = entry.path();
    record.source = source;
    record.stamp = name.substr(prefix.size(), name.size() - prefix.size() - extension.size());
    records.push_back(std::move(record));
  }

  std::sort(records.begin(), records.end(), [](const backup_record& left, const backup_record& right) {
    return left.stamp > right.stamp;
  });
  return ok_result(records);
}

result<size_t> backup_manager::enforce_retention(const std::filesystem::path& source) {
  auto log = redlog::get_logger("gr4ft.backup");

  auto records = list(source);
  if (!records.ok()) {
    return error_result<size_t>(records.status_info);
  }

  size_t removed = 0;
  for (size_t i = retention_; i < records.value.size(); ++i) {
    std::error_code ec;
    std::filesystem::remove(records.value[i].path, ec);
    if (ec) {
      return error_result<size_t>(
          error_code::io_error, "cannot evict backup " + records.value[i].path.string() + ": " + ec.message()
      );
    }
    log.dbg("evicted backup", redlog::field("backup", records.value[i].path.string()));
    removed++;
  }
  return ok_result(removed);
}

} // namespace gr4ft::engine
