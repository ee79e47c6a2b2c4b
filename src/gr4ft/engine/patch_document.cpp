#include "patch_document.hpp"

namespace gr4ft::engine {

namespace {

constexpr std::string_view utf8_bom = "\xEF\xBB\xBF";

// crlf is only normalized when every line feed is part of a crlf pair
bool is_pure_crlf(std::string_view text) {
  bool saw_newline = false;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      if (i == 0 || text[i - 1] != '\r') {
        return false;
      }
      saw_newline = true;
    }
  }
  return saw_newline;
}

std::string strip_cr(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
      continue;
    }
    out.push_back(text[i]);
  }
  return out;
}

} // namespace

patch_document::patch_document(std::string raw_bytes) : original_(std::move(raw_bytes)) {
  std::string_view view(original_);
  if (view.substr(0, utf8_bom.size()) == utf8_bom) {
    bom_ = true;
    view.remove_prefix(utf8_bom.size());
  }

  crlf_ = is_pure_crlf(view);
  loaded_text_ = crlf_ ? strip_cr(view) : std::string(view);
  text_ = loaded_text_;
}

std::string patch_document::serialize() const {
  std::string out;
  out.reserve(text_.size() + text_.size() / 16 + utf8_bom.size());
  if (bom_) {
    out.append(utf8_bom);
  }
  if (!crlf_) {
    out.append(text_);
    return out;
  }
  for (char ch : text_) {
    if (ch == '\n') {
      out.push_back('\r');
    }
    out.push_back(ch);
  }
  return out;
}

size_t patch_document::line_start(size_t pos) const {
  if (pos > text_.size()) {
    pos = text_.size();
  }
  while (pos > 0 && text_[pos - 1] != '\n') {
    pos--;
  }
  return pos;
}

size_t patch_document::line_end(size_t pos) const {
  size_t end = text_.find('\n', pos);
  return end == std::string::npos ? text_.size() : end;
}

size_t patch_document::next_line_start(size_t pos) const {
  size_t end = line_end(pos);
  return end < text_.size() ? end + 1 : end;
}

std::string_view patch_document::line_at(size_t pos) const {
  size_t start = line_start(pos);
  return std::string_view(text_).substr(start, line_end(start) - start);
}

} // namespace gr4ft::engine
