#include "wheel_selector.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <tuple>

namespace blext {

namespace {

std::string min_version_label(platform_tag const &p) {
  return p.os == os_family::MACOS ? "macOS" : "glibc";
}

std::string min_version_setting(platform_tag const &p) {
  return p.os == os_family::MACOS ? "min_macos_version" : "min_glibc_version";
}

// Set when some wheel tag matches the target exactly except for a newer minimum.
std::optional<os_version> blocking_minimum(wheel_descriptor const &w, platform_tag const &target) {
  std::optional<os_version> out;
  for (auto const &p : w.platforms) {
    if (!(p == target) || !p.min_os_version) { continue; }
    if (target.min_os_version && *p.min_os_version <= *target.min_os_version) { continue; }
    if (!out || *p.min_os_version < *out) { out = p.min_os_version; }
  }
  return out;
}

std::string platform_list(wheel_descriptor const &w) {
  std::vector<std::string> names;
  for (auto const &p : w.platforms) { names.push_back(p.str()); }
  return util_join(names, ", ");
}

}  // namespace

wheel_selector::wheel_selector(engine_config const &cfg) : cfg_{ cfg } {}

selected_wheel wheel_selector::select(resolved_package const &pkg,
                                      resolve_target const &target) const {
  auto const &release{ *target.release };
  return select(pkg.package,
                pkg.version.str(),
                pkg.metadata.files,
                cfg_.target_platform(release, target.platform),
                release.interpreter_tag(),
                cfg_.valid_python_tags(release),
                cfg_.valid_abi_tags(release),
                target.label);
}

selected_wheel wheel_selector::select(std::string const &package,
                                      std::string const &version,
                                      std::vector<index_file> const &files,
                                      platform_tag const &target_platform,
                                      std::string const &interpreter,
                                      std::vector<std::string> const &valid_python_tags,
                                      std::vector<std::string> const &valid_abi_tags,
                                      std::string const &target_label) {
  std::vector<selected_wheel> survivors;
  std::vector<std::string> rejected;
  std::optional<os_version> hint;

  for (auto const &f : files) {
    std::optional<wheel_descriptor> parsed;
    try {
      parsed = parse_wheel_filename(f.filename);
    } catch (unrecognized_tag_error const &e) {
      tui::warn("%s: skipping wheel: %s", target_label.c_str(), e.what());
      BLEXT_TRACE_WHEEL_SKIPPED(package, f.filename, std::string{ e.what() });
      continue;
    }
    wheel_descriptor &w{ *parsed };
    w.size = f.size;
    w.sha256 = f.sha256;
    w.url = f.url;

    if (!w.admits_python(interpreter, valid_python_tags, valid_abi_tags)) {
      rejected.push_back(f.filename + ": python/abi tags " + util_join(w.python_tags, ".") +
                         "-" + util_join(w.abi_tags, ".") + " not supported");
      continue;
    }

    if (w.platform_any) {
      survivors.push_back({ .wheel = std::move(w) });
      continue;
    }

    if (auto const match{ best_platform_match(w.platforms, target_platform) }) {
      survivors.push_back({ .wheel = std::move(w), .matched = match });
      continue;
    }

    if (auto const blocked{ blocking_minimum(w, target_platform) }) {
      rejected.push_back(f.filename + ": requires " + min_version_label(target_platform) +
                         ">=" + blocked->str());
      if (!hint || *blocked < *hint) { hint = blocked; }
    } else {
      rejected.push_back(f.filename + ": built for " + platform_list(w));
    }
  }

  if (survivors.empty()) {
    no_compatible_wheel_error::payload p{ .package = package,
                                          .version = version,
                                          .target = target_label,
                                          .rejected = std::move(rejected) };
    if (hint) {
      p.min_version_hint = hint->str();
      p.min_version_label = min_version_label(target_platform);
      p.min_version_setting = min_version_setting(target_platform);
    }
    throw no_compatible_wheel_error(std::move(p));
  }

  std::ranges::sort(survivors, [](selected_wheel const &a, selected_wheel const &b) {
    return std::tie(a.wheel.size, a.wheel.sha256, a.wheel.filename) <
           std::tie(b.wheel.size, b.wheel.sha256, b.wheel.filename);
  });

  auto &chosen{ survivors.front() };
  BLEXT_TRACE_WHEEL_SELECTED(target_label, package, version, chosen.wheel.filename);
  tui::debug("%s: %s %s -> %s",
             target_label.c_str(),
             package.c_str(),
             version.c_str(),
             chosen.wheel.filename.c_str());
  return std::move(chosen);
}

}  // namespace blext
