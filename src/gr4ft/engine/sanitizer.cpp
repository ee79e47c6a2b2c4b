#include "sanitizer.hpp"
#include "fragment_locator.hpp"
#include <redlog.hpp>

namespace gr4ft::engine {

result<size_t> sanitizer::remove(patch_document& document, const compiled_fragment& fragment) const {
  auto log = redlog::get_logger("gr4ft.sanitizer");

  patch_document working = document;
  size_t removed = 0;
  const size_t initial = find_markers(working, fragment).size();

  // each pass deletes one marker, so the loop is bounded by the initial count
  for (size_t pass = 0; pass < initial; ++pass) {
    auto markers = find_markers(working, fragment);
    if (markers.empty()) {
      break;
    }

    auto region = locate_fragment(working, fragment, markers.front());
    if (!region.ok()) {
      log.err(
          "cannot bound stale fragment", redlog::field("fragment", fragment.spec.name),
          redlog::field("error", region.status_info.message)
      );
      return error_result<size_t>(region.status_info);
    }

    std::string text = working.text();
    log.dbg(
        "removing fragment instance", redlog::field("fragment", fragment.spec.name),
        redlog::field("begin", region.value.span.begin), redlog::field("end", region.value.span.end)
    );
    text.erase(region.value.span.begin, region.value.span.size());
    working.set_text(std::move(text));
    removed++;
  }

  if (!find_markers(working, fragment).empty()) {
    return error_result<size_t>(
        error_code::internal_error, "fragment '" + fragment.spec.name + "' still present after removal"
    );
  }

  if (removed > 0) {
    log.inf("removed stale fragment", redlog::field("fragment", fragment.spec.name), redlog::field("instances", removed));
  }
  document = std::move(working);
  return ok_result(removed);
}

} // namespace gr4ft::engine
