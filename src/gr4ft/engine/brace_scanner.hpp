#pragma once

#include "result.hpp"
#include <cstddef>
#include <string_view>

namespace gr4ft::engine {

struct delimiter_pair {
  char open = '{';
  char close = '}';
};

struct balance_report {
  int final_depth = 0;
  size_t max_depth = 0;
  // offset of the first close delimiter that drove the depth below zero
  size_t first_negative = std::string_view::npos;

  bool balanced() const noexcept { return final_depth == 0 && first_negative == std::string_view::npos; }
};

// depth counter over raw text; content between delimiters is not interpreted
class brace_scanner {
public:
  explicit brace_scanner(delimiter_pair delimiters = {}) : delimiters_(delimiters) {}

  // index of the delimiter closing the one at open_index
  result<size_t> find_matching_close(std::string_view text, size_t open_index) const;

  balance_report scan(std::string_view text) const;

  // ok when depth returns to exactly zero with no negative excursion
  status check_balance(std::string_view text) const;

private:
  delimiter_pair delimiters_;
};

} // namespace gr4ft::engine
