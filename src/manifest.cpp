#include "manifest.h"

#include "errors.h"
#include "util.h"

#include <toml++/toml.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <sstream>

namespace blext {

namespace {

constexpr std::size_t kTerseMaxLength{ 64 };

bool has_control_chars(std::string_view s) {
  return std::ranges::any_of(s, [](char c) {
    auto const u{ static_cast<unsigned char>(c) };
    return u < 0x20 || u == 0x7f;
  });
}

bool is_clean_text(std::string_view s) {
  return !s.empty() && util_trim(s) == s && !has_control_chars(s);
}

bool is_number(std::string_view s, bool allow_leading_zero) {
  if (s.empty()) { return false; }
  if (!allow_leading_zero && s.size() > 1 && s.front() == '0') { return false; }
  return std::ranges::all_of(s, [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool is_semver_ident(std::string_view s) {
  if (s.empty()) { return false; }
  for (auto const &part : util_split(s, '.')) {
    if (part.empty() || !std::ranges::all_of(part, [](char c) {
          return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
        })) {
      return false;
    }
  }
  return true;
}

// MAJOR.MINOR.PATCH with optional -prerelease and +build.
bool is_bl_semver(std::string_view s) {
  if (auto const plus{ s.find('+') }; plus != std::string_view::npos) {
    if (!is_semver_ident(s.substr(plus + 1))) { return false; }
    s = s.substr(0, plus);
  }
  if (auto const dash{ s.find('-') }; dash != std::string_view::npos) {
    if (!is_semver_ident(s.substr(dash + 1))) { return false; }
    s = s.substr(0, dash);
  }
  auto const parts{ util_split(s, '.') };
  return parts.size() == 3 &&
         std::ranges::all_of(parts, [](std::string const &p) { return is_number(p, false); });
}

// Taglines and permission reasons.
bool is_terse_description(std::string_view s) {
  if (s.empty() || s.size() > kTerseMaxLength || s.ends_with('_') || has_control_chars(s)) {
    return false;
  }
  char const last{ s.back() };
  return std::isalnum(static_cast<unsigned char>(last)) || last == ')' || last == ']' ||
         last == '}';
}

// "2025 Name" or "2019-2025 Name"
bool is_copyright_line(std::string_view s) {
  auto const space{ s.find(' ') };
  if (space == std::string_view::npos || util_trim(s.substr(space + 1)).empty()) { return false; }
  auto const years{ s.substr(0, space) };
  auto const dash{ years.find('-') };
  if (dash == std::string_view::npos) { return is_number(years, true); }
  return is_number(years.substr(0, dash), true) && is_number(years.substr(dash + 1), true);
}

bool is_valid_id(std::string_view s) {
  if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front())) || s.starts_with('_') ||
      s.ends_with('_') || s.find("__") != std::string_view::npos) {
    return false;
  }
  return std::ranges::all_of(s, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

bool is_valid_wheel_path(std::string_view s) {
  if (!is_clean_text(s) || s.find('"') != std::string_view::npos ||
      s.find('\\') != std::string_view::npos) {
    return false;
  }
  auto const filename{ s.substr(s.rfind('/') + 1) };
  auto const dashes{ std::ranges::count(filename, '-') };
  return util_to_lower(filename).ends_with(".whl") && (dashes == 4 || dashes == 5);
}

bool is_supported_blender(std::string_view s) {
  try {
    return bl_version::parse(s) >= bl_version{ 4, 2, 0 };
  } catch (std::invalid_argument const &) { return false; }
}

toml::array to_array(std::vector<std::string> const &values) {
  toml::array out;
  for (auto const &v : values) { out.push_back(v); }
  return out;
}

}  // namespace

void bl_manifest::validate() const {
  std::vector<std::string> errs;
  auto const check{ [&errs](bool ok, std::string msg) {
    if (!ok) { errs.push_back("- " + std::move(msg)); }
  } };

  check(is_bl_semver(schema_version), "`schema_version` '" + schema_version + "' is not semver");
  check(is_valid_id(id),
        "`id` '" + id + "' must be an identifier without leading, trailing or double '_'");
  check(is_clean_text(name), "`name` must be non-empty and free of surrounding whitespace");
  check(is_terse_description(tagline),
        "`tagline` must be at most 64 characters and end with a letter, digit or closing "
        "bracket");
  check(is_bl_semver(version), "`version` '" + version + "' is not semver");
  check(is_clean_text(maintainer), "`maintainer` must be non-empty");
  check(type == "add-on" || type == "theme", "`type` must be add-on or theme");
  check(is_supported_blender(blender_version_min),
        "`blender_version_min` '" + blender_version_min + "' must be 4.2.0 or newer");
  if (blender_version_max) {
    check(is_supported_blender(*blender_version_max),
          "`blender_version_max` '" + *blender_version_max + "' must be 4.2.0 or newer");
  }
  if (website) { check(is_clean_text(*website), "`website` must be non-empty"); }
  for (auto const &l : license) {
    check(l.starts_with("SPDX:") && l.size() > 5, "`license` '" + l + "' must be SPDX:<id>");
  }
  for (auto const &c : copyright) {
    check(is_copyright_line(c), "`copyright` '" + c + "' must read \"<year> <name>\"");
  }
  for (auto const &p : platforms) {
    check(bl_platform_parse(p).has_value(), "`platforms` has unknown platform '" + p + "'");
  }
  for (auto const &w : wheels) {
    check(is_valid_wheel_path(w), "`wheels` entry '" + w + "' is not a wheel path");
  }
  for (auto const &[perm, reason] : permissions) {
    check(is_terse_description(reason),
          "`permissions." + perm +
              "` must be at most 64 characters and end with a letter, digit or closing bracket");
  }

  if (!errs.empty()) {
    throw config_error("invalid blender_manifest.toml for " + id + ":\n" + util_join(errs, "\n"));
  }
}

std::string bl_manifest::to_toml() const {
  toml::table t{
    { "schema_version", schema_version },
    { "id", id },
    { "version", version },
    { "name", name },
    { "tagline", tagline },
    { "maintainer", maintainer },
    { "type", type },
    { "blender_version_min", blender_version_min },
    { "license", to_array(license) },
  };
  if (website) { t.insert_or_assign("website", *website); }
  if (blender_version_max) { t.insert_or_assign("blender_version_max", *blender_version_max); }
  if (!tags.empty()) { t.insert_or_assign("tags", to_array(tags)); }
  if (!copyright.empty()) { t.insert_or_assign("copyright", to_array(copyright)); }
  if (!platforms.empty()) { t.insert_or_assign("platforms", to_array(platforms)); }
  if (!wheels.empty()) { t.insert_or_assign("wheels", to_array(wheels)); }
  if (!permissions.empty()) {
    toml::table perms;
    for (auto const &[perm, reason] : permissions) { perms.insert_or_assign(perm, reason); }
    t.insert_or_assign("permissions", std::move(perms));
  }

  std::ostringstream os;
  os << t << '\n';
  return os.str();
}

bl_manifest make_manifest(project const &p,
                          release_group const &group,
                          std::vector<std::string> const &wheel_filenames) {
  bl_manifest m{
    .id = p.id,
    .version = p.version,
    .name = p.pretty_name,
    .tagline = p.tagline,
    .maintainer = p.maintainer,
    .website = p.website,
    .tags = p.bl_tags,
    .blender_version_min = group.first().version.str(),
    .license = { "SPDX:" + p.license },
    .copyright = p.copyright,
    .permissions = p.permissions,
  };

  auto const &all{ official_releases() };
  auto const next{ std::ranges::find_if(
      all, [&](bl_release const &r) { return r.version > group.last().version; }) };
  if (next != all.end()) {
    m.blender_version_max = next->version.str();
  } else if (p.blender_version_max) {
    m.blender_version_max = p.blender_version_max->str();
  }

  for (auto const platform : group.platforms) {
    m.platforms.emplace_back(bl_platform_name(platform));
  }

  std::set<std::string> const unique{ wheel_filenames.begin(), wheel_filenames.end() };
  for (auto const &filename : unique) { m.wheels.push_back("./wheels/" + filename); }
  return m;
}

std::string_view release_profile_name(release_profile profile) {
  switch (profile) {
    case release_profile::TEST: return "test";
    case release_profile::DEV: return "dev";
    case release_profile::RELEASE: return "release";
    case release_profile::RELEASE_DEBUG: return "release-debug";
  }
  return "release";
}

std::optional<release_profile> release_profile_parse(std::string_view name) {
  constexpr std::array kAll{ release_profile::TEST,
                             release_profile::DEV,
                             release_profile::RELEASE,
                             release_profile::RELEASE_DEBUG };
  auto const lowered{ util_to_lower(util_trim(name)) };
  for (auto const profile : kAll) {
    if (release_profile_name(profile) == lowered) { return profile; }
  }
  return std::nullopt;
}

std::string release_profile_init_settings(release_profile profile) {
  bool const release{ profile == release_profile::RELEASE };
  toml::table t{
    { "use_log_file", !release },
    { "log_file_level", "debug" },
    { "use_log_console", true },
    { "log_console_level", release ? "warning" : "info" },
  };
  if (!release) { t.insert_or_assign("log_file_name", "addon.log"); }

  std::ostringstream os;
  os << t << '\n';
  return os.str();
}

}  // namespace blext
