#pragma once

#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gr4ft::engine {

// where a fragment is inserted
enum class anchor_kind {
  block,      // immediately after the opening delimiter of a named block
  end_of_file // appended after trimming trailing whitespace
};

struct fragment_anchor {
  anchor_kind kind = anchor_kind::end_of_file;
  std::string block_name;

  static fragment_anchor block(std::string name) { return fragment_anchor{anchor_kind::block, std::move(name)}; }
  static fragment_anchor end_of_file() { return fragment_anchor{anchor_kind::end_of_file, {}}; }

  std::string to_string() const { return kind == anchor_kind::block ? "block:" + block_name : "eof"; }
};

// declarative description of one required fragment
struct fragment_spec {
  std::string name;
  std::string marker;
  // template body without the marker line; version keys are written ${key}
  std::string body;
  fragment_anchor anchor;
  // substrings that must appear in the fragment region; empty means every non-blank body line
  std::vector<std::string> required;
  // fragments that must be injected before this one
  std::vector<std::string> after;
};

// named bundle of version strings, immutable for one run
struct version_set {
  std::string name;
  std::map<std::string, std::string> versions;

  std::optional<std::string> get(const std::string& key) const {
    auto it = versions.find(key);
    if (it == versions.end()) {
      return std::nullopt;
    }
    return it->second;
  }
};

// a complete set of fragments plus the version sets they can be rendered with
struct recipe {
  std::string name;
  std::vector<fragment_spec> fragments;
  std::vector<version_set> version_sets;

  const version_set* find_version_set(const std::string& set_name) const {
    for (const auto& set : version_sets) {
      if (set.name == set_name) {
        return &set;
      }
    }
    return nullptr;
  }
};

enum class fragment_state { absent, correct_present, stale_present };

const char* fragment_state_name(fragment_state state);

// half-open byte range [begin, end) in a document
struct text_span {
  size_t begin = 0;
  size_t end = 0;

  size_t size() const noexcept { return end - begin; }
  bool empty() const noexcept { return end <= begin; }
};

struct fragment_classification {
  std::string name;
  std::string marker;
  fragment_state state = fragment_state::absent;
  size_t occurrences = 0;
  // patterns that were expected but not found in the region
  std::vector<std::string> missing;
  std::string detail;
};

} // namespace gr4ft::engine
