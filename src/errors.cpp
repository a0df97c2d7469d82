#include "errors.h"

#include "util.h"

#include <sstream>

namespace blext {

namespace {

std::string format_reference_conflict(reference_conflict_error::payload const &p) {
  std::ostringstream oss;
  oss << p.package << p.constraint << " (required by " << p.requirer << ") conflicts with "
      << p.package << "==" << p.pinned_version << " bundled with Blender "
      << p.blender_version;
  if (!p.remedy.empty()) { oss << "\n  remedy: " << p.remedy; }
  return oss.str();
}

std::string format_resolution_conflict(resolution_conflict_error::payload const &p) {
  std::ostringstream oss;
  oss << "Cannot resolve " << p.package << " for " << p.target
      << ": no version satisfies all requirers";
  for (auto const &r : p.requirers) {
    oss << "\n  - " << r.requirer << " requires " << p.package << r.constraint;
    if (!r.chain.empty()) { oss << " (via " << util_join(r.chain, " -> ") << ")"; }
  }
  if (p.narrowest) {
    auto const &a{ p.requirers[p.narrowest->first] };
    auto const &b{ p.requirers[p.narrowest->second] };
    oss << "\n  narrowest conflict: " << a.requirer << " (" << p.package << a.constraint
        << ") vs " << b.requirer << " (" << p.package << b.constraint << ")";
  }
  if (!p.common_ancestor.empty()) { oss << "\n  common ancestor: " << p.common_ancestor; }
  if (!p.available_versions.empty()) {
    oss << "\n  available: " << util_join(p.available_versions, ", ");
  }
  return oss.str();
}

std::string format_no_compatible_wheel(no_compatible_wheel_error::payload const &p) {
  std::ostringstream oss;
  oss << "No compatible wheel for " << p.package << "==" << p.version << " on " << p.target;
  for (auto const &r : p.rejected) { oss << "\n  rejected: " << r; }
  if (p.min_version_hint) {
    oss << "\n  remedy: raise your minimum to " << *p.min_version_hint << " ("
        << p.min_version_label << ", tool.blext." << p.min_version_setting << ")";
  } else {
    oss << "\n  remedy: remove " << p.package
        << " from the dependencies, or remove the platform from tool.blext.supported_platforms";
  }
  return oss.str();
}

}  // namespace

std::string_view error_kind_name(error_kind kind) {
  switch (kind) {
    case error_kind::unrecognized_tag: return "UnrecognizedTagError";
    case error_kind::reference_conflict: return "ReferenceConflictError";
    case error_kind::resolution_conflict: return "ResolutionConflictError";
    case error_kind::no_compatible_wheel: return "NoCompatibleWheelError";
    case error_kind::integrity: return "IntegrityError";
    case error_kind::download: return "DownloadError";
    case error_kind::config: return "ConfigError";
    case error_kind::index: return "IndexError";
  }
  return "UnknownError";
}

blext_error::blext_error(error_kind kind, std::string const &message)
    : std::runtime_error{ message }, kind_{ kind } {}

unrecognized_tag_error::unrecognized_tag_error(std::string tag, std::string detail)
    : blext_error{ error_kind::unrecognized_tag,
                   "Unrecognized tag '" + tag + "'" +
                       (detail.empty() ? std::string{} : ": " + detail) },
      tag_{ std::move(tag) } {}

reference_conflict_error::reference_conflict_error(payload p)
    : blext_error{ error_kind::reference_conflict, format_reference_conflict(p) },
      p_{ std::move(p) } {}

resolution_conflict_error::resolution_conflict_error(payload p)
    : blext_error{ error_kind::resolution_conflict, format_resolution_conflict(p) },
      p_{ std::move(p) } {}

no_compatible_wheel_error::no_compatible_wheel_error(payload p)
    : blext_error{ error_kind::no_compatible_wheel, format_no_compatible_wheel(p) },
      p_{ std::move(p) } {}

integrity_error::integrity_error(std::string filename,
                                 std::string expected,
                                 std::string actual)
    : blext_error{ error_kind::integrity,
                   "SHA256 mismatch for " + filename + ": expected " + expected +
                       " but got " + actual },
      filename_{ std::move(filename) },
      expected_{ std::move(expected) },
      actual_{ std::move(actual) } {}

download_error::download_error(std::string url, std::string reason, int attempts)
    : blext_error{ error_kind::download,
                   "Download failed after " + std::to_string(attempts) + " attempt(s): " +
                       url + ": " + reason },
      url_{ std::move(url) },
      reason_{ std::move(reason) },
      attempts_{ attempts } {}

config_error::config_error(std::string const &message)
    : blext_error{ error_kind::config, message } {}

index_error::index_error(std::string const &message)
    : blext_error{ error_kind::index, message } {}

error_record describe_exception(std::exception_ptr const &ep) {
  try {
    std::rethrow_exception(ep);
  } catch (blext_error const &e) {
    return { std::string{ error_kind_name(e.kind()) }, e.what() };
  } catch (std::exception const &e) { return { "Error", e.what() }; } catch (...) {
    return { "Error", "unknown exception" };
  }
}

}  // namespace blext
