#include "validator.hpp"
#include "fragment_locator.hpp"
#include <algorithm>
#include <redlog.hpp>

namespace gr4ft::engine {

result<fragment_classification> validator::classify(
    const patch_document& document, const compiled_fragment& fragment
) const {
  auto log = redlog::get_logger("gr4ft.validator");

  fragment_classification classification;
  classification.name = fragment.spec.name;
  classification.marker = fragment.spec.marker;

  // render first so a broken version set fails the same way whether or not the marker exists
  auto required = render_required_patterns(fragment, versions_);
  if (!required.ok()) {
    return error_result<fragment_classification>(required.status_info);
  }

  auto markers = find_markers(document, fragment);
  classification.occurrences = markers.size();
  if (markers.empty()) {
    classification.state = fragment_state::absent;
    log.dbg("fragment absent", redlog::field("fragment", fragment.spec.name));
    return ok_result(classification);
  }

  if (markers.size() > 1) {
    classification.state = fragment_state::stale_present;
    classification.detail = "marker occurs " + std::to_string(markers.size()) + " times";
    log.dbg(
        "fragment duplicated", redlog::field("fragment", fragment.spec.name),
        redlog::field("occurrences", markers.size())
    );
    return ok_result(classification);
  }

  auto region = locate_fragment(document, fragment, markers.front());
  if (!region.ok()) {
    classification.state = fragment_state::stale_present;
    classification.detail = region.status_info.message;
    log.dbg(
        "fragment region not recognized", redlog::field("fragment", fragment.spec.name),
        redlog::field("error", region.status_info.message)
    );
    return ok_result(classification);
  }

  std::string_view region_text =
      std::string_view(document.text()).substr(region.value.span.begin, region.value.span.size());
  for (const auto& pattern : required.value) {
    if (region_text.find(pattern) == std::string_view::npos) {
      classification.missing.push_back(pattern);
    }
  }

  if (classification.missing.empty()) {
    classification.state = fragment_state::correct_present;
  } else {
    classification.state = fragment_state::stale_present;
    classification.detail = "missing '" + classification.missing.front() + "'";
    if (classification.missing.size() > 1) {
      classification.detail += " and " + std::to_string(classification.missing.size() - 1) + " more";
    }
  }

  log.dbg(
      "classified fragment", redlog::field("fragment", fragment.spec.name),
      redlog::field("state", fragment_state_name(classification.state)),
      redlog::field("missing", classification.missing.size())
  );
  return ok_result(classification);
}

result<std::vector<fragment_classification>> validator::classify_all(
    const patch_document& document, const std::vector<compiled_fragment>& fragments
) const {
  std::vector<fragment_classification> classifications;
  classifications.reserve(fragments.size());
  for (const auto& fragment : fragments) {
    auto classified = classify(document, fragment);
    if (!classified.ok()) {
      return error_result<std::vector<fragment_classification>>(classified.status_info);
    }
    classifications.push_back(std::move(classified.value));
  }
  return ok_result(classifications);
}

bool all_correct(const std::vector<fragment_classification>& classifications) {
  return std::all_of(classifications.begin(), classifications.end(), [](const fragment_classification& entry) {
    return entry.state == fragment_state::correct_present;
  });
}

} // namespace gr4ft::engine
