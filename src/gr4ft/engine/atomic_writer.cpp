#include "atomic_writer.hpp"
#include <atomic>
#include <fstream>
#include <redlog.hpp>
#include <string>
#include <system_error>

#if defined(_WIN32)
#include <process.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace gr4ft::engine {

namespace {

long current_process_id() {
#if defined(_WIN32)
  return static_cast<long>(_getpid());
#else
  return static_cast<long>(::getpid());
#endif
}

// removes the temporary file unless released
class temp_file_guard {
public:
  explicit temp_file_guard(std::filesystem::path path) : path_(std::move(path)) {}
  ~temp_file_guard() {
    if (!released_) {
      std::error_code ec;
      std::filesystem::remove(path_, ec);
    }
  }

  temp_file_guard(const temp_file_guard&) = delete;
  temp_file_guard& operator=(const temp_file_guard&) = delete;

  void release() noexcept { released_ = true; }

private:
  std::filesystem::path path_;
  bool released_ = false;
};

bool sync_to_disk(const std::filesystem::path& path) {
#if defined(_WIN32)
  (void) path;
  return true;
#else
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return false;
  }
  bool ok = ::fsync(fd) == 0;
  ::close(fd);
  return ok;
#endif
}

} // namespace

std::filesystem::path atomic_writer::temporary_path_for(const std::filesystem::path& target) {
  static std::atomic<unsigned> counter{0};
  std::string name = "." + target.filename().string() + ".gr4ft-tmp-" + std::to_string(current_process_id()) + "-" +
                     std::to_string(counter.fetch_add(1));
  return target.parent_path() / name;
}

status atomic_writer::commit(const std::filesystem::path& target, std::string_view content) const {
  auto log = redlog::get_logger("gr4ft.atomic_writer");

  auto temp_path = temporary_path_for(target);
  temp_file_guard guard(temp_path);

  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      log.err("failed to create temporary file", redlog::field("path", temp_path.string()));
      return make_status(error_code::io_error, "cannot create temporary file " + temp_path.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
      log.err("failed to write temporary file", redlog::field("path", temp_path.string()));
      return make_status(error_code::io_error, "cannot write temporary file " + temp_path.string());
    }
  }

  if (!sync_to_disk(temp_path)) {
    log.err("failed to sync temporary file", redlog::field("path", temp_path.string()));
    return make_status(error_code::io_error, "cannot sync temporary file " + temp_path.string());
  }

  std::error_code ec;
  auto target_status = std::filesystem::status(target, ec);
  if (!ec && std::filesystem::exists(target_status)) {
    std::filesystem::permissions(temp_path, target_status.permissions(), std::filesystem::perm_options::replace, ec);
    if (ec) {
      log.wrn("could not carry file permissions over", redlog::field("error", ec.message()));
      ec.clear();
    }
  }

  std::filesystem::rename(temp_path, target, ec);
  if (ec == std::errc::file_exists) {
    // no atomic replace on this filesystem: delete, then rename
    log.wrn("atomic replace unavailable, falling back to delete and rename", redlog::field("path", target.string()));
    ec.clear();
    std::filesystem::remove(target, ec);
    if (!ec) {
      std::filesystem::rename(temp_path, target, ec);
    }
  }
  if (ec) {
    log.err(
        "failed to replace target", redlog::field("path", target.string()), redlog::field("error", ec.message())
    );
    return make_status(error_code::io_error, "cannot replace " + target.string() + ": " + ec.message());
  }

  guard.release();
  log.dbg("committed file", redlog::field("path", target.string()), redlog::field("bytes", content.size()));
  return ok_status();
}

} // namespace gr4ft::engine
