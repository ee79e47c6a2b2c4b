#include "fragment.hpp"
#include "brace_scanner.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <redlog.hpp>
#include <set>

namespace gr4ft::engine {

namespace {

bool is_identifier_start(char ch) { return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_'; }

bool is_identifier_char(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '.' || ch == '-';
}

bool is_block_name(std::string_view name) {
  if (name.empty() || !is_identifier_start(name.front())) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char ch) { return is_identifier_char(ch) && ch != '-'; });
}

struct template_piece {
  bool placeholder = false;
  std::string text;
};

result<std::vector<template_piece>> split_template(std::string_view text) {
  std::vector<template_piece> pieces;
  std::string literal;
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] == '$' && i + 1 < text.size() && text[i + 1] == '{') {
      size_t close = text.find('}', i + 2);
      if (close == std::string_view::npos) {
        return error_result<std::vector<template_piece>>(error_code::invalid_recipe, "unterminated placeholder");
      }
      std::string key(text.substr(i + 2, close - i - 2));
      if (key.empty() || !std::all_of(key.begin(), key.end(), is_identifier_char)) {
        return error_result<std::vector<template_piece>>(
            error_code::invalid_recipe, "invalid placeholder name '" + key + "'"
        );
      }
      if (!literal.empty()) {
        pieces.push_back({false, literal});
        literal.clear();
      }
      pieces.push_back({true, key});
      i = close + 1;
      continue;
    }
    literal.push_back(text[i]);
    i++;
  }
  if (!literal.empty()) {
    pieces.push_back({false, literal});
  }
  return ok_result(pieces);
}

std::string escape_regex_literal(std::string_view text) {
  static const std::string special = R"(\^$.|?*+()[]{}/)";
  std::string out;
  out.reserve(text.size() * 2);
  bool in_space = false;
  for (char ch : text) {
    if (ch == ' ' || ch == '\t') {
      if (!in_space) {
        out += "[ \\t]+";
        in_space = true;
      }
      continue;
    }
    in_space = false;
    if (special.find(ch) != std::string::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

// version tokens are anything up to a quote or whitespace.
// a user may end the line with a semicolon or a trailing // comment.
result<std::regex> make_flat_pattern(std::string_view trimmed_line) {
  auto pieces = split_template(trimmed_line);
  if (!pieces.ok()) {
    return error_result<std::regex>(pieces.status_info);
  }

  std::string expr = "^";
  for (const auto& piece : pieces.value) {
    expr += piece.placeholder ? std::string(R"([^'"\s]+)") : escape_regex_literal(piece.text);
  }
  expr += R"([ \t]*;?[ \t]*(//.*)?$)";

  try {
    return ok_result(std::regex(expr, std::regex::ECMAScript | std::regex::optimize));
  } catch (const std::regex_error& e) {
    return error_result<std::regex>(error_code::invalid_recipe, std::string("line pattern failed to compile: ") + e.what());
  }
}

std::vector<std::string> dedent_lines(std::string_view body) {
  std::string normalized;
  normalized.reserve(body.size());
  for (char ch : body) {
    if (ch != '\r') {
      normalized.push_back(ch);
    }
  }

  auto lines = utils::split_lines(normalized);
  while (!lines.empty() && utils::is_blank(lines.front())) {
    lines.erase(lines.begin());
  }
  while (!lines.empty() && utils::is_blank(lines.back())) {
    lines.pop_back();
  }

  size_t common = std::string::npos;
  for (const auto& line : lines) {
    if (utils::is_blank(line)) {
      continue;
    }
    common = std::min(common, utils::leading_whitespace(line).size());
  }

  for (auto& line : lines) {
    if (utils::is_blank(line)) {
      line.clear();
      continue;
    }
    line = utils::trim_end_copy(line.substr(common == std::string::npos ? 0 : common));
  }
  return lines;
}

std::string join_lines(const std::vector<std::string>& lines, size_t from) {
  std::string out;
  for (size_t i = from; i < lines.size(); ++i) {
    if (i > from) {
      out.push_back('\n');
    }
    out += lines[i];
  }
  return out;
}

result<fragment_shape> analyze_shape(const std::vector<std::string>& lines, const std::string& fragment_name) {
  auto log = redlog::get_logger("gr4ft.fragment");
  fragment_shape shape;
  brace_scanner scanner;

  for (const auto& line : lines) {
    if (auto header = parse_block_header(utils::trim_view(line))) {
      shape.introduced_blocks.push_back(*header);
    }
  }

  size_t flat_end = lines.size();
  for (size_t i = 0; i < lines.size(); ++i) {
    auto header = parse_block_header(utils::trim_view(lines[i]));
    if (!header) {
      continue;
    }

    std::string tail = join_lines(lines, i);
    size_t open = tail.find('{');
    auto close = scanner.find_matching_close(tail, open);
    if (!close.ok()) {
      // leave the remainder flat; the pre-commit balance check reports the damage
      log.wrn(
          "template block is not closed", redlog::field("fragment", fragment_name), redlog::field("block", *header)
      );
      break;
    }
    if (!utils::is_blank(std::string_view(tail).substr(close.value + 1))) {
      return error_result<fragment_shape>(
          error_code::invalid_recipe,
          "fragment '" + fragment_name + "': content follows block '" + *header + "'; a block must be last"
      );
    }
    if (header->find("${") != std::string::npos) {
      return error_result<fragment_shape>(
          error_code::invalid_recipe, "fragment '" + fragment_name + "': block header cannot contain placeholders"
      );
    }
    shape.block_header = *header;
    flat_end = i;
    break;
  }

  for (size_t i = 0; i < flat_end; ++i) {
    if (!utils::is_blank(lines[i])) {
      shape.flat_lines.push_back(utils::trim_copy(lines[i]));
    }
  }
  return ok_result(shape);
}

} // namespace

std::optional<std::string> parse_block_header(std::string_view trimmed_line) {
  if (trimmed_line.size() < 2 || trimmed_line.back() != '{') {
    return std::nullopt;
  }
  std::string name = utils::trim_copy(trimmed_line.substr(0, trimmed_line.size() - 1));
  if (!is_block_name(name)) {
    return std::nullopt;
  }
  return name;
}

result<compiled_fragment> compile_fragment(const fragment_spec& spec) {
  compiled_fragment compiled;
  compiled.spec = spec;
  compiled.body_lines = dedent_lines(spec.body);
  if (compiled.body_lines.empty()) {
    return error_result<compiled_fragment>(error_code::invalid_recipe, "fragment '" + spec.name + "' has an empty body");
  }

  auto shape = analyze_shape(compiled.body_lines, spec.name);
  if (!shape.ok()) {
    return error_result<compiled_fragment>(shape.status_info);
  }
  compiled.shape = shape.value;

  for (const auto& line : compiled.shape.flat_lines) {
    auto pattern = make_flat_pattern(line);
    if (!pattern.ok()) {
      return error_result<compiled_fragment>(
          pattern.status_info.code, "fragment '" + spec.name + "': " + pattern.status_info.message
      );
    }
    compiled.flat_patterns.push_back(std::move(pattern.value));
  }

  std::set<std::string> keys;
  for (const auto& line : compiled.body_lines) {
    auto pieces = split_template(line);
    if (!pieces.ok()) {
      return error_result<compiled_fragment>(
          pieces.status_info.code, "fragment '" + spec.name + "': " + pieces.status_info.message
      );
    }
    for (const auto& piece : pieces.value) {
      if (piece.placeholder && keys.insert(piece.text).second) {
        compiled.placeholders.push_back(piece.text);
      }
    }
  }

  return ok_result(std::move(compiled));
}

result<std::vector<compiled_fragment>> compile_recipe(const std::vector<fragment_spec>& specs) {
  using fragments = std::vector<compiled_fragment>;
  auto log = redlog::get_logger("gr4ft.fragment");

  std::set<std::string> names;
  for (const auto& spec : specs) {
    if (spec.name.empty()) {
      return error_result<fragments>(error_code::invalid_recipe, "fragment name cannot be empty");
    }
    if (!names.insert(spec.name).second) {
      return error_result<fragments>(error_code::invalid_recipe, "duplicate fragment name '" + spec.name + "'");
    }
    if (utils::is_blank(spec.marker) || spec.marker.find('\n') != std::string::npos) {
      return error_result<fragments>(
          error_code::invalid_recipe, "fragment '" + spec.name + "' needs a single-line marker"
      );
    }
    if (spec.anchor.kind == anchor_kind::block && !is_block_name(spec.anchor.block_name)) {
      return error_result<fragments>(
          error_code::invalid_recipe,
          "fragment '" + spec.name + "' has an invalid anchor block name '" + spec.anchor.block_name + "'"
      );
    }
  }

  for (size_t i = 0; i < specs.size(); ++i) {
    for (size_t j = 0; j < specs.size(); ++j) {
      if (specs[j].body.find(specs[i].marker) != std::string::npos) {
        return error_result<fragments>(
            error_code::invalid_recipe,
            "marker of '" + specs[i].name + "' appears inside the body of '" + specs[j].name + "'"
        );
      }
      if (i != j && specs[j].marker.find(specs[i].marker) != std::string::npos) {
        return error_result<fragments>(
            error_code::invalid_recipe,
            "marker of '" + specs[i].name + "' is contained in the marker of '" + specs[j].name + "'"
        );
      }
    }
    for (const auto& dependency : specs[i].after) {
      if (dependency == specs[i].name || names.count(dependency) == 0) {
        return error_result<fragments>(
            error_code::invalid_recipe, "fragment '" + specs[i].name + "' has an invalid ordering reference '" +
                                            dependency + "'"
        );
      }
    }
  }

  fragments compiled;
  compiled.reserve(specs.size());
  for (const auto& spec : specs) {
    auto fragment = compile_fragment(spec);
    if (!fragment.ok()) {
      return error_result<fragments>(fragment.status_info);
    }
    log.trc(
        "compiled fragment", redlog::field("name", spec.name), redlog::field("anchor", spec.anchor.to_string()),
        redlog::field("flat_lines", fragment.value.shape.flat_lines.size()),
        redlog::field("block", fragment.value.shape.block_header.value_or("-"))
    );
    compiled.push_back(std::move(fragment.value));
  }

  auto order = injection_order(compiled);
  if (!order.ok()) {
    return error_result<fragments>(order.status_info);
  }

  return ok_result(std::move(compiled));
}

result<std::string> render_template(std::string_view text, const version_set& versions, std::string_view owner) {
  auto pieces = split_template(text);
  if (!pieces.ok()) {
    return error_result<std::string>(pieces.status_info);
  }

  std::string rendered;
  rendered.reserve(text.size());
  for (const auto& piece : pieces.value) {
    if (!piece.placeholder) {
      rendered += piece.text;
      continue;
    }
    auto value = versions.get(piece.text);
    if (!value) {
      std::string message = "unresolved placeholder ${" + piece.text + "}";
      if (!owner.empty()) {
        message += " in fragment '" + std::string(owner) + "'";
      }
      message += " for version set '" + versions.name + "'";
      return error_result<std::string>(error_code::invalid_recipe, message);
    }
    rendered += *value;
  }
  return ok_result(rendered);
}

result<std::vector<std::string>> render_body_lines(const compiled_fragment& fragment, const version_set& versions) {
  std::vector<std::string> lines;
  lines.reserve(fragment.body_lines.size());
  for (const auto& line : fragment.body_lines) {
    auto rendered = render_template(line, versions, fragment.spec.name);
    if (!rendered.ok()) {
      return error_result<std::vector<std::string>>(rendered.status_info);
    }
    lines.push_back(std::move(rendered.value));
  }
  return ok_result(lines);
}

result<std::vector<std::string>> render_required_patterns(
    const compiled_fragment& fragment, const version_set& versions
) {
  std::vector<std::string> patterns;
  if (!fragment.spec.required.empty()) {
    for (const auto& required : fragment.spec.required) {
      auto rendered = render_template(required, versions, fragment.spec.name);
      if (!rendered.ok()) {
        return error_result<std::vector<std::string>>(rendered.status_info);
      }
      patterns.push_back(std::move(rendered.value));
    }
    return ok_result(patterns);
  }

  auto lines = render_body_lines(fragment, versions);
  if (!lines.ok()) {
    return error_result<std::vector<std::string>>(lines.status_info);
  }
  for (const auto& line : lines.value) {
    if (!utils::is_blank(line)) {
      patterns.push_back(utils::trim_copy(line));
    }
  }
  return ok_result(patterns);
}

result<std::vector<size_t>> injection_order(const std::vector<compiled_fragment>& fragments) {
  const size_t count = fragments.size();
  std::vector<std::vector<size_t>> successors(count);
  std::vector<size_t> pending(count, 0);

  auto add_edge = [&](size_t before, size_t after) {
    successors[before].push_back(after);
    pending[after]++;
  };

  for (size_t i = 0; i < count; ++i) {
    const auto& spec = fragments[i].spec;
    for (const auto& dependency : spec.after) {
      for (size_t j = 0; j < count; ++j) {
        if (fragments[j].spec.name == dependency) {
          add_edge(j, i);
        }
      }
    }
    if (spec.anchor.kind != anchor_kind::block) {
      continue;
    }
    for (size_t j = 0; j < count; ++j) {
      if (i == j) {
        continue;
      }
      const auto& introduced = fragments[j].shape.introduced_blocks;
      if (std::find(introduced.begin(), introduced.end(), spec.anchor.block_name) != introduced.end()) {
        add_edge(j, i);
      }
    }
  }

  std::vector<size_t> order;
  std::vector<bool> done(count, false);
  order.reserve(count);
  while (order.size() < count) {
    size_t next = count;
    for (size_t i = 0; i < count; ++i) {
      if (!done[i] && pending[i] == 0) {
        next = i;
        break;
      }
    }
    if (next == count) {
      return error_result<std::vector<size_t>>(error_code::invalid_recipe, "fragment ordering contains a cycle");
    }
    done[next] = true;
    order.push_back(next);
    for (size_t successor : successors[next]) {
      pending[successor]--;
    }
  }
  return ok_result(order);
}

} // namespace gr4ft::engine
