#include "injector.hpp"
#include "brace_scanner.hpp"
#include "fragment_locator.hpp"
#include "utils/string_utils.hpp"
#include <redlog.hpp>
#include <regex>

namespace gr4ft::engine {

namespace {

constexpr const char* default_indent_step = "    ";

std::string escape_for_regex(const std::string& text) {
  static const std::string special = R"(\^$.|?*+()[]{}/)";
  std::string out;
  for (char ch : text) {
    if (special.find(ch) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

// indentation of the first line inside the block when it is deeper than the header,
// otherwise the header's indentation plus one step
std::string block_indent(const patch_document& document, size_t open_offset) {
  const auto& text = document.text();
  std::string header_indent = utils::leading_whitespace(document.line_at(open_offset));

  brace_scanner scanner;
  auto close = scanner.find_matching_close(text, open_offset);
  size_t limit = close.ok() ? close.value : text.size();

  size_t pos = document.next_line_start(open_offset);
  while (pos < limit) {
    auto line = document.line_at(pos);
    if (!utils::is_blank(line)) {
      std::string indent = utils::leading_whitespace(line);
      if (indent.size() > header_indent.size()) {
        return indent;
      }
      break;
    }
    pos = document.next_line_start(pos);
  }
  return header_indent + default_indent_step;
}

} // namespace

result<size_t> find_anchor_block(std::string_view text, const std::string& block_name) {
  // the name must not be the tail of a longer identifier or a dotted path
  std::regex header("(?:^|[^A-Za-z0-9_.])" + escape_for_regex(block_name) + "[ \\t]*\\{");
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(text.begin(), text.end(), match, header)) {
    return error_result<size_t>(error_code::anchor_not_found, "block '" + block_name + "' not found");
  }
  size_t offset = static_cast<size_t>(match.position(0) + match.length(0) - 1);
  return ok_result(offset);
}

result<bool> injector::insert(patch_document& document, const compiled_fragment& fragment) const {
  auto log = redlog::get_logger("gr4ft.injector");

  if (!find_markers(document, fragment).empty()) {
    log.dbg("fragment already present, skipping", redlog::field("fragment", fragment.spec.name));
    return ok_result(false);
  }

  auto lines = render_body_lines(fragment, versions_);
  if (!lines.ok()) {
    return error_result<bool>(lines.status_info);
  }

  if (fragment.spec.anchor.kind == anchor_kind::block) {
    auto inserted = insert_in_block(document, fragment, lines.value);
    if (!inserted.ok()) {
      return error_result<bool>(inserted);
    }
  } else {
    append_at_end(document, fragment, lines.value);
  }

  log.inf(
      "injected fragment", redlog::field("fragment", fragment.spec.name),
      redlog::field("anchor", fragment.spec.anchor.to_string()), redlog::field("lines", lines.value.size() + 1)
  );
  return ok_result(true);
}

status injector::insert_in_block(
    patch_document& document, const compiled_fragment& fragment, const std::vector<std::string>& lines
) const {
  auto log = redlog::get_logger("gr4ft.injector");
  const auto& block_name = fragment.spec.anchor.block_name;

  auto open = find_anchor_block(document.text(), block_name);
  if (!open.ok()) {
    log.err(
        "anchor block not found", redlog::field("fragment", fragment.spec.name), redlog::field("block", block_name)
    );
    return make_status(
        error_code::anchor_not_found,
        "fragment '" + fragment.spec.name + "': block '" + block_name + "' not found in file"
    );
  }

  std::string indent = block_indent(document, open.value);

  std::string insertion;
  insertion += "\n" + indent + fragment.spec.marker;
  for (const auto& line : lines) {
    insertion += "\n";
    if (!utils::is_blank(line)) {
      insertion += indent + line;
    }
  }

  std::string text = document.text();
  size_t at = open.value + 1;
  size_t header_end = document.line_end(open.value);
  auto rest = utils::trim_view(std::string_view(text).substr(at, header_end - at));
  if (rest.substr(0, 2) == "//") {
    // keep a trailing comment on the header line
    at = header_end;
  } else if (!rest.empty()) {
    insertion += "\n" + utils::leading_whitespace(document.line_at(open.value));
  }

  log.trc(
      "inserting into block", redlog::field("fragment", fragment.spec.name), redlog::field("block", block_name),
      redlog::field("offset", at)
  );
  text.insert(at, insertion);
  document.set_text(std::move(text));
  return ok_status();
}

void injector::append_at_end(
    patch_document& document, const compiled_fragment& fragment, const std::vector<std::string>& lines
) const {
  std::string text = utils::trim_end_copy(document.text());
  if (!text.empty()) {
    text += "\n\n";
  }
  text += fragment.spec.marker;
  for (const auto& line : lines) {
    text += "\n" + line;
  }
  text += "\n";
  document.set_text(std::move(text));
}

} // namespace gr4ft::engine
