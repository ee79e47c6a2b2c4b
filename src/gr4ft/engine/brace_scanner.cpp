#include "brace_scanner.hpp"
#include <string>

namespace gr4ft::engine {

result<size_t> brace_scanner::find_matching_close(std::string_view text, size_t open_index) const {
  if (open_index >= text.size() || text[open_index] != delimiters_.open) {
    return error_result<size_t>(error_code::invalid_argument, "scan must start at an opening delimiter");
  }

  size_t depth = 0;
  for (size_t i = open_index; i < text.size(); ++i) {
    char ch = text[i];
    if (ch == delimiters_.open) {
      depth++;
    } else if (ch == delimiters_.close) {
      depth--;
      if (depth == 0) {
        return ok_result(i);
      }
    }
  }

  return error_result<size_t>(
      error_code::unbalanced_structure,
      "no matching '" + std::string(1, delimiters_.close) + "' for offset " + std::to_string(open_index)
  );
}

balance_report brace_scanner::scan(std::string_view text) const {
  balance_report report;
  int depth = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char ch = text[i];
    if (ch == delimiters_.open) {
      depth++;
      if (static_cast<size_t>(depth) > report.max_depth) {
        report.max_depth = static_cast<size_t>(depth);
      }
    } else if (ch == delimiters_.close) {
      depth--;
      if (depth < 0 && report.first_negative == std::string_view::npos) {
        report.first_negative = i;
      }
    }
  }
  report.final_depth = depth;
  return report;
}

status brace_scanner::check_balance(std::string_view text) const {
  auto report = scan(text);
  if (report.first_negative != std::string_view::npos) {
    return make_status(
        error_code::unbalanced_structure,
        "unexpected '" + std::string(1, delimiters_.close) + "' at offset " + std::to_string(report.first_negative)
    );
  }
  if (report.final_depth != 0) {
    return make_status(
        error_code::unbalanced_structure, std::to_string(report.final_depth) + " unclosed '" +
                                              std::string(1, delimiters_.open) + "' at end of text"
    );
  }
  return ok_status();
}

} // namespace gr4ft::engine
