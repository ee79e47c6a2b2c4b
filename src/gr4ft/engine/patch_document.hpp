#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace gr4ft::engine {

// in-memory text being transformed during one run.
// the working text is lf-only without a byte order mark; the file's own conventions
// are restored by serialize().
class patch_document {
public:
  patch_document() = default;
  explicit patch_document(std::string raw_bytes);

  const std::string& text() const noexcept { return text_; }
  void set_text(std::string text) { text_ = std::move(text); }

  std::string serialize() const;

  // true once the working text differs from what was loaded
  bool changed() const noexcept { return text_ != loaded_text_; }

  const std::string& original_bytes() const noexcept { return original_; }
  bool uses_crlf() const noexcept { return crlf_; }
  bool has_bom() const noexcept { return bom_; }

  // line helpers over the working text
  size_t line_start(size_t pos) const;
  // offset of the terminating '\n' or text size
  size_t line_end(size_t pos) const;
  // first offset after the terminating '\n' or text size
  size_t next_line_start(size_t pos) const;
  std::string_view line_at(size_t pos) const;

private:
  std::string original_;
  std::string loaded_text_;
  std::string text_;
  bool crlf_ = false;
  bool bom_ = false;
};

} // namespace gr4ft::engine
