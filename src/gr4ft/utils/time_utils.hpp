#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace gr4ft::utils {

// fixed-width utc stamp that sorts lexicographically: 20261018T232501.123456
inline std::string format_timestamp_utc_compact_us(
    std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()
) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) % 1000000;
  if (us.count() < 0) {
    us += std::chrono::microseconds(1000000);
  }

  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &time_t);
#else
  gmtime_r(&time_t, &utc);
#endif

  std::stringstream ss;
  ss << std::put_time(&utc, "%Y%m%dT%H%M%S");
  ss << '.' << std::setfill('0') << std::setw(6) << us.count();
  return ss.str();
}

} // namespace gr4ft::utils
