#include "report.h"

#include "util.h"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace blext {

namespace {

std::string pad(std::string s, std::size_t width) {
  if (s.size() < width) { s.append(width - s.size(), ' '); }
  return s;
}

group_report make_group_report(group_plan const &g) {
  group_report r{ .name = g.name,
                  .blender_version_min = g.group.first().version.str(),
                  .blender_version_last = g.group.last().version.str() };
  for (auto const p : g.group.platforms) { r.platforms.emplace_back(bl_platform_name(p)); }

  struct accum {
    std::set<std::string> platforms;
    std::map<std::string, std::uint64_t> wheel_sizes;  // sha256 or filename -> size
  };
  std::map<std::pair<std::string, std::string>, accum> rows;
  std::map<std::string, std::uint64_t> all_wheels;
  std::set<std::string> bundled;

  for (auto const &t : g.targets) {
    std::string const platform{ bl_platform_name(t.target.platform) };
    for (auto const &w : t.wheels) {
      auto &a{ rows[{ w.wheel.package, w.wheel.version.str() }] };
      auto const key{ w.wheel.sha256.empty() ? w.wheel.filename : w.wheel.sha256 };
      a.platforms.insert(platform);
      a.wheel_sizes.emplace(key, w.wheel.size);
      all_wheels.emplace(key, w.wheel.size);
    }
    if (t.resolved) {
      for (auto const &pin : t.resolved->reference_used) {
        bundled.insert(pin.package + " " + pin.version.str());
      }
    }
    for (auto const &e : t.errors) { r.errors.push_back({ .target = t.target.label, .error = e }); }
  }

  for (auto const &[key, a] : rows) {
    report_row row{ .package = key.first, .version = key.second };
    row.platforms.assign(a.platforms.begin(), a.platforms.end());
    for (auto const &[wheel, size] : a.wheel_sizes) { row.size += size; }
    r.rows.push_back(std::move(row));
  }
  for (auto const &[wheel, size] : all_wheels) { r.total_size += size; }
  r.bundled.assign(bundled.begin(), bundled.end());
  return r;
}

}  // namespace

std::vector<group_report> make_report(build_plan const &plan) {
  std::vector<group_report> out;
  for (auto const &g : plan.groups) { out.push_back(make_group_report(g)); }
  return out;
}

std::string report_text(build_plan const &plan) {
  std::string out;
  for (auto const &r : make_report(plan)) {
    out += r.name + " (Blender " + r.blender_version_min;
    if (r.blender_version_last != r.blender_version_min) { out += " to " + r.blender_version_last; }
    out += "; " + util_join(r.platforms, ", ") + ")\n";

    std::size_t name_w{ 7 };
    std::size_t version_w{ 7 };
    std::size_t platforms_w{ 9 };
    for (auto const &row : r.rows) {
      name_w = std::max(name_w, row.package.size());
      version_w = std::max(version_w, row.version.size());
      platforms_w = std::max(platforms_w, util_join(row.platforms, ", ").size());
    }

    if (r.rows.empty()) {
      out += "  no wheels\n";
    } else {
      out += "  " + pad("package", name_w) + "  " + pad("version", version_w) + "  " +
             pad("platforms", platforms_w) + "  size\n";
      for (auto const &row : r.rows) {
        out += "  " + pad(row.package, name_w) + "  " + pad(row.version, version_w) + "  " +
               pad(util_join(row.platforms, ", "), platforms_w) + "  " +
               util_format_bytes(row.size) + "\n";
      }
    }
    if (!r.bundled.empty()) { out += "  bundled by Blender: " + util_join(r.bundled, ", ") + "\n"; }
    out += "  total: " + util_format_bytes(r.total_size) + "\n";
    for (auto const &e : r.errors) {
      out += "  error [" + e.target + "] " + e.error.kind + ": " + e.error.message + "\n";
    }
  }
  return out;
}

nlohmann::json report_json(build_plan const &plan) {
  nlohmann::json groups = nlohmann::json::array();
  for (auto const &r : make_report(plan)) {
    nlohmann::json packages = nlohmann::json::array();
    for (auto const &row : r.rows) {
      packages.push_back({ { "name", row.package },
                           { "version", row.version },
                           { "platforms", row.platforms },
                           { "size", row.size } });
    }
    nlohmann::json errors = nlohmann::json::array();
    for (auto const &e : r.errors) {
      errors.push_back(
          { { "target", e.target }, { "kind", e.error.kind }, { "message", e.error.message } });
    }
    groups.push_back({ { "name", r.name },
                       { "blender_version_min", r.blender_version_min },
                       { "blender_version_last", r.blender_version_last },
                       { "platforms", r.platforms },
                       { "packages", packages },
                       { "bundled", r.bundled },
                       { "total_size", r.total_size },
                       { "errors", errors } });
  }
  return { { "ok", plan.ok() }, { "groups", groups } };
}

std::string report_errors_text(build_plan const &plan) {
  std::string out;
  for (auto const &g : plan.groups) {
    for (auto const &t : g.targets) {
      for (auto const &e : t.errors) {
        out += "[" + t.target.label + "] " + e.kind + ": " + e.message + "\n";
      }
    }
  }
  return out;
}

}  // namespace blext
