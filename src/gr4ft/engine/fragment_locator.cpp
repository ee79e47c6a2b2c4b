#include "fragment_locator.hpp"
#include "brace_scanner.hpp"
#include "utils/string_utils.hpp"
#include <optional>
#include <redlog.hpp>

namespace gr4ft::engine {

namespace {

// first non-blank line at or after pos; text size when only blank lines remain
size_t skip_blank_lines(const patch_document& document, size_t pos) {
  const auto& text = document.text();
  while (pos < text.size()) {
    if (!utils::is_blank(document.line_at(pos))) {
      return pos;
    }
    pos = document.next_line_start(pos);
  }
  return text.size();
}

bool match_unused_flat_line(
    const compiled_fragment& fragment, std::string_view trimmed_line, std::vector<bool>& used
) {
  std::string line(trimmed_line);
  for (size_t i = 0; i < fragment.flat_patterns.size(); ++i) {
    if (used[i]) {
      continue;
    }
    if (std::regex_match(line, fragment.flat_patterns[i])) {
      used[i] = true;
      return true;
    }
  }
  return false;
}

// block header of a line, ignoring a trailing // comment
std::optional<std::string> header_of(std::string_view line) {
  auto trimmed = utils::trim_view(line);
  size_t comment = trimmed.find("//");
  if (comment != std::string_view::npos) {
    trimmed = utils::trim_view(trimmed.substr(0, comment));
  }
  return parse_block_header(trimmed);
}

} // namespace

std::vector<size_t> find_markers(const patch_document& document, const compiled_fragment& fragment) {
  std::vector<size_t> offsets;
  const auto& text = document.text();
  const auto& marker = fragment.spec.marker;
  size_t pos = text.find(marker);
  while (pos != std::string::npos) {
    offsets.push_back(pos);
    pos = text.find(marker, pos + marker.size());
  }
  return offsets;
}

result<fragment_region> locate_fragment(
    const patch_document& document, const compiled_fragment& fragment, size_t marker_offset
) {
  auto log = redlog::get_logger("gr4ft.locator");
  const auto& text = document.text();
  const auto& name = fragment.spec.name;

  fragment_region region;
  region.marker_offset = marker_offset;

  size_t line_start = document.line_start(marker_offset);
  bool whole_lines = utils::is_blank(std::string_view(text).substr(line_start, marker_offset - line_start));
  region.span.begin = whole_lines ? line_start : marker_offset;

  size_t last_end = document.line_end(marker_offset);
  size_t cursor = document.next_line_start(marker_offset);

  std::vector<bool> used(fragment.flat_patterns.size(), false);
  while (cursor < text.size() && region.flat_lines < fragment.flat_patterns.size()) {
    size_t candidate = skip_blank_lines(document, cursor);
    if (candidate >= text.size()) {
      break;
    }
    if (!match_unused_flat_line(fragment, utils::trim_view(document.line_at(candidate)), used)) {
      break;
    }
    region.flat_lines++;
    last_end = document.line_end(candidate);
    cursor = document.next_line_start(candidate);
  }

  if (fragment.shape.block_header) {
    const auto& header = *fragment.shape.block_header;
    size_t candidate = skip_blank_lines(document, cursor);
    auto header_line = candidate < text.size() ? document.line_at(candidate) : std::string_view{};
    auto parsed = header_of(header_line);
    if (!parsed || *parsed != header) {
      log.dbg(
          "block header not found after marker", redlog::field("fragment", name), redlog::field("block", header),
          redlog::field("offset", marker_offset)
      );
      return error_result<fragment_region>(
          error_code::pattern_not_found,
          "fragment '" + name + "': expected block '" + header + "' after marker at offset " +
              std::to_string(marker_offset)
      );
    }

    size_t open = text.find('{', candidate);
    brace_scanner scanner;
    auto close = scanner.find_matching_close(text, open);
    if (!close.ok()) {
      return error_result<fragment_region>(
          error_code::pattern_not_found, "fragment '" + name + "': block '" + header + "' is never closed"
      );
    }

    region.has_block = true;
    size_t close_line_end = document.line_end(close.value);
    bool rest_blank = utils::is_blank(std::string_view(text).substr(close.value + 1, close_line_end - close.value - 1));
    last_end = rest_blank ? close_line_end : close.value + 1;
  } else if (region.flat_lines == 0) {
    return error_result<fragment_region>(
        error_code::pattern_not_found,
        "fragment '" + name + "': no recognizable lines follow marker at offset " + std::to_string(marker_offset)
    );
  }

  region.span.end = last_end;
  if (whole_lines && last_end < text.size() && text[last_end] == '\n') {
    region.span.end = last_end + 1;
  }

  log.trc(
      "located fragment", redlog::field("fragment", name), redlog::field("begin", region.span.begin),
      redlog::field("end", region.span.end), redlog::field("flat_lines", region.flat_lines),
      redlog::field("block", region.has_block)
  );
  return ok_result(region);
}

} // namespace gr4ft::engine
