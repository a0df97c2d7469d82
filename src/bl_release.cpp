#include "bl_release.h"

#include "requirement.h"
#include "util.h"

#include <algorithm>
#include <charconv>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace blext {

namespace {

struct platform_info {
  bl_platform platform;
  std::string_view name;
  os_family os;
  cpu_arch arch;
  std::vector<std::string> machines;
};

std::vector<platform_info> const &platform_table() {
  static std::vector<platform_info> const table{
    { bl_platform::LINUX_X64, "linux-x64", os_family::LINUX, cpu_arch::X64, { "x86_64" } },
    { bl_platform::LINUX_ARM64, "linux-arm64", os_family::LINUX, cpu_arch::ARM64, { "aarch64" } },
    { bl_platform::MACOS_X64, "macos-x64", os_family::MACOS, cpu_arch::X64, { "x86_64", "i386" } },
    { bl_platform::MACOS_ARM64, "macos-arm64", os_family::MACOS, cpu_arch::ARM64, { "arm64" } },
    { bl_platform::WINDOWS_X64, "windows-x64", os_family::WINDOWS, cpu_arch::X64, { "AMD64" } },
    { bl_platform::WINDOWS_ARM64, "windows-arm64", os_family::WINDOWS, cpu_arch::ARM64, { "ARM64" } },
  };
  return table;
}

platform_info const &info(bl_platform p) {
  return *std::ranges::find(platform_table(), p, &platform_info::platform);
}

std::vector<std::string> const kExtensionTags{
  "3D View",        "Add Curve",     "Add Mesh",       "Animation", "Bake",
  "Camera",         "Compositing",   "Development",    "Game Engine",
  "Geometry Nodes", "Grease Pencil", "Import-Export",  "Lighting",  "Material",
  "Modeling",       "Mesh",          "Node",           "Object",    "Paint",
  "Pipeline",       "Physics",       "Render",         "Rigging",   "Scene",
  "Sculpt",         "Sequencer",     "System",         "Text Editor",
  "Tracking",       "User Interface", "UV",
};

using pin_list = std::vector<std::pair<std::string_view, std::string_view>>;

pin_list const kPins4_2{
  { "autopep8", "1.6.0" },       { "certifi", "2021.10.8" },     { "charset_normalizer", "2.0.10" },
  { "Cython", "0.29.30" },       { "idna", "3.3" },              { "numpy", "1.24.3" },
  { "pip", "23.2.1" },           { "pycodestyle", "2.8.0" },     { "requests", "2.27.1" },
  { "setuptools", "63.2.0" },    { "toml", "0.10.2" },           { "urllib3", "1.26.8" },
  { "zstandard", "0.16.0" },
};

pin_list const kPins4_3{
  { "autopep8", "2.3.1" },       { "certifi", "2021.10.8" },     { "charset_normalizer", "2.0.10" },
  { "Cython", "0.29.30" },       { "idna", "3.3" },              { "numpy", "1.24.3" },
  { "pip", "24.0" },             { "pycodestyle", "2.12.1" },    { "requests", "2.27.1" },
  { "setuptools", "63.2.0" },    { "urllib3", "1.26.8" },        { "zstandard", "0.16.0" },
};

pin_list const kPins4_4{
  { "autopep8", "2.3.1" },       { "certifi", "2021.10.8" },     { "charset_normalizer", "2.0.10" },
  { "Cython", "3.0.11" },        { "idna", "3.3" },              { "numpy", "1.26.4" },
  { "pip", "24.0" },             { "pycodestyle", "2.12.1" },    { "requests", "2.27.1" },
  { "setuptools", "63.2.0" },    { "urllib3", "1.26.8" },        { "zstandard", "0.16.0" },
};

bl_release make_release(bl_version v,
                        std::string python_version,
                        os_version min_macos,
                        std::vector<bl_platform> platforms,
                        pin_list const &pins) {
  bl_release r{
    .version = v,
    .python_version = std::move(python_version),
    .min_glibc = { 2, 28 },
    .min_macos = min_macos,
    .platforms = std::move(platforms),
    .python_tags = { "py3", "cp36", "cp37", "cp38", "cp39", "cp310", "cp311" },
    .abi_tags = { "none", "abi3", "cp311" },
    .manifest_versions = { "1.0.0" },
    .extension_tags = kExtensionTags,
  };
  for (auto const &[name, ver] : pins) {
    r.reference.push_back({ .package = canonicalize_name(name),
                            .version = pep440::version{ ver },
                            .platforms = r.platforms });
  }
  std::ranges::sort(r.reference, {}, &reference_pin::package);
  return r;
}

std::optional<int> parse_component(std::string_view text) {
  int value{ 0 };
  auto const [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), value) };
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

bool same_pins(bl_release const &a, bl_release const &b) {
  return std::ranges::equal(a.reference, b.reference, [](auto const &x, auto const &y) {
    return x.package == y.package && x.version == y.version;
  });
}

std::vector<bl_platform> supported_subset(bl_release const &r,
                                          std::vector<bl_platform> const &ext_platforms) {
  std::vector<bl_platform> out;
  for (auto const p : ext_platforms) {
    if (r.supports(p)) { out.push_back(p); }
  }
  return out;
}

bool smooshable(bl_release const &a,
                bl_release const &b,
                std::vector<bl_platform> const &ext_platforms) {
  return a.python_version == b.python_version && a.min_glibc == b.min_glibc &&
         a.min_macos == b.min_macos && a.python_tags == b.python_tags &&
         a.abi_tags == b.abi_tags && a.manifest_versions == b.manifest_versions &&
         same_pins(a, b) &&
         supported_subset(a, ext_platforms) == supported_subset(b, ext_platforms);
}

std::string underscored(std::initializer_list<int> parts) {
  std::string out{ "bl" };
  bool first{ true };
  for (int const p : parts) {
    if (!first) { out += '_'; }
    out += std::to_string(p);
    first = false;
  }
  return out;
}

// Name for the half-open range [v0, v1).
std::string pretty_range(bl_version const &v0, bl_version const &v1) {
  std::string v0_str{ underscored({ v0.major, v0.minor, v0.patch }) };
  std::optional<std::string> v1_str{ underscored({ v1.major, v1.minor, v1.patch }) };

  bool const later_line{ v0.major < v1.major || (v0.major == v1.major && v0.minor < v1.minor) };
  if (later_line && v0.patch == 0) { v0_str = underscored({ v0.major, v0.minor }); }

  if (v0.major < v1.major) {
    if (v1.patch == 0) {
      v1_str = v1.minor == 0 ? underscored({ v1.major }) : underscored({ v1.major, v1.minor - 1 });
    } else {
      v1_str = underscored({ v1.major, v1.minor, v1.patch - 1 });
    }
  } else if (v1.patch == 0) {
    if (v0.minor == v1.minor - 1) {
      v1_str.reset();
    } else if (v0.minor < v1.minor) {
      v1_str = underscored({ v1.major, v1.minor - 1 });
    }
  } else if (v0.minor == v1.minor && v0.patch == v1.patch - 1) {
    v1_str.reset();
  } else {
    v1_str = underscored({ v1.major, v1.minor, v1.patch - 1 });
  }

  return v1_str ? v0_str + "-" + *v1_str : v0_str;
}

}  // namespace

std::vector<bl_platform> const &all_bl_platforms() {
  static std::vector<bl_platform> const all{ [] {
    std::vector<bl_platform> out;
    for (auto const &p : platform_table()) { out.push_back(p.platform); }
    return out;
  }() };
  return all;
}

std::string_view bl_platform_name(bl_platform p) { return info(p).name; }

std::optional<bl_platform> bl_platform_parse(std::string_view name) {
  auto const lowered{ util_to_lower(util_trim(name)) };
  for (auto const &p : platform_table()) {
    if (p.name == lowered) { return p.platform; }
  }
  return std::nullopt;
}

os_family bl_platform_os(bl_platform p) { return info(p).os; }
cpu_arch bl_platform_arch(bl_platform p) { return info(p).arch; }
std::vector<std::string> const &bl_platform_machines(bl_platform p) { return info(p).machines; }

bl_version bl_version::parse(std::string_view text) {
  auto const parts{ util_split(util_trim(text), '.') };
  if (parts.size() < 2 || parts.size() > 3) {
    throw std::invalid_argument("invalid Blender version '" + std::string{ text } + "'");
  }
  std::vector<int> nums;
  for (auto const &part : parts) {
    auto const n{ parse_component(part) };
    if (!n || *n < 0) {
      throw std::invalid_argument("invalid Blender version '" + std::string{ text } + "'");
    }
    nums.push_back(*n);
  }
  return { nums[0], nums[1], nums.size() == 3 ? nums[2] : 0 };
}

std::string bl_version::str() const {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

std::string bl_version::line() const {
  return std::to_string(major) + "." + std::to_string(minor);
}

reference_pin const *bl_release::find_pin(std::string_view package) const {
  auto const canonical{ canonicalize_name(package) };
  auto const it{ std::ranges::lower_bound(reference, canonical, {}, &reference_pin::package) };
  return it != reference.end() && it->package == canonical ? &*it : nullptr;
}

bool bl_release::supports(bl_platform p) const {
  return std::ranges::find(platforms, p) != platforms.end();
}

std::string bl_release::marker_extra() const {
  return "blender" + std::to_string(version.major) + "-" + std::to_string(version.minor);
}

std::string bl_release::interpreter_tag() const {
  auto const parts{ util_split(python_version, '.') };
  if (parts.size() < 2) { throw std::logic_error("bad python version " + python_version); }
  return "cp" + parts[0] + parts[1];
}

platform_tag bl_release::target_platform(bl_platform p,
                                         std::optional<os_version> min_override) const {
  platform_tag tag{ .os = bl_platform_os(p), .arch = bl_platform_arch(p) };
  switch (tag.os) {
    case os_family::LINUX:
      tag.libc = libc_family::GLIBC;
      tag.min_os_version = min_override.value_or(min_glibc);
      break;
    case os_family::MACOS: tag.min_os_version = min_override.value_or(min_macos); break;
    case os_family::WINDOWS: break;
  }
  return tag;
}

std::vector<bl_release> const &official_releases() {
  static std::vector<bl_release> const releases{ [] {
    using P = bl_platform;
    std::vector<P> const without_win_arm{ P::LINUX_X64, P::MACOS_X64, P::MACOS_ARM64, P::WINDOWS_X64 };
    std::vector<P> const standard{ P::LINUX_X64, P::MACOS_X64, P::MACOS_ARM64, P::WINDOWS_X64,
                                   P::WINDOWS_ARM64 };

    std::vector<bl_release> out;
    out.push_back(make_release({ 4, 2, 0 }, "3.11.7", { 11, 0 }, without_win_arm, kPins4_2));
    for (int patch{ 1 }; patch <= 8; ++patch) {
      out.push_back(make_release({ 4, 2, patch }, "3.11.7", { 11, 0 }, standard, kPins4_2));
    }
    for (int patch{ 0 }; patch <= 2; ++patch) {
      out.push_back(make_release({ 4, 3, patch }, "3.11.9", { 11, 0 }, standard, kPins4_3));
    }
    out.push_back(make_release({ 4, 4, 0 }, "3.11.11", { 12, 0 }, standard, kPins4_4));
    return out;
  }() };
  return releases;
}

bl_release const *find_release(bl_version const &v) {
  auto const &all{ official_releases() };
  auto const it{ std::ranges::find(all, v, &bl_release::version) };
  return it == all.end() ? nullptr : &*it;
}

std::vector<bl_release const *> releases_in_range(bl_version const &min,
                                                  std::optional<bl_version> const &max_exclusive) {
  std::vector<bl_release const *> out;
  for (auto const &r : official_releases()) {
    if (r.version < min) { continue; }
    if (max_exclusive && !(r.version < *max_exclusive)) { continue; }
    out.push_back(&r);
  }
  return out;
}

std::vector<marker_environment> marker_environments(bl_release const &release, bl_platform p) {
  auto const full{ pep440::version{ release.python_version } };
  auto const &rel{ full.release() };
  std::string const short_version{ std::to_string(rel.at(0)) + "." + std::to_string(rel.at(1)) };

  std::string_view os_name;
  std::string_view platform_system;
  std::string_view sys_platform;
  switch (bl_platform_os(p)) {
    case os_family::LINUX:
      os_name = "posix";
      platform_system = "Linux";
      sys_platform = "linux";
      break;
    case os_family::MACOS:
      os_name = "posix";
      platform_system = "Darwin";
      sys_platform = "darwin";
      break;
    case os_family::WINDOWS:
      os_name = "nt";
      platform_system = "Windows";
      sys_platform = "win32";
      break;
  }

  std::vector<marker_environment> envs;
  for (auto const &machine : bl_platform_machines(p)) {
    envs.push_back({
        { "implementation_name", "cpython" },
        { "implementation_version", release.python_version },
        { "os_name", std::string{ os_name } },
        { "platform_machine", machine },
        { "platform_release", "" },
        { "platform_system", std::string{ platform_system } },
        { "platform_python_implementation", "CPython" },
        { "python_full_version", release.python_version },
        { "python_version", short_version },
        { "sys_platform", std::string{ sys_platform } },
        { "extra", release.marker_extra() },
    });
  }
  return envs;
}

std::string release_group::name() const {
  auto const &all{ official_releases() };
  auto const it{ std::ranges::find_if(all, [&](bl_release const &r) {
    return last().version < r.version;
  }) };
  bl_version const end{ it != all.end()
                            ? it->version
                            : bl_version{ last().version.major, last().version.minor,
                                          last().version.patch + 1 } };
  return pretty_range(first().version, end);
}

std::vector<release_group> smoosh_releases(std::vector<bl_release const *> const &releases,
                                           std::vector<bl_platform> const &ext_platforms) {
  std::vector<release_group> groups;
  for (auto const *r : releases) {
    if (!groups.empty() && smooshable(groups.back().last(), *r, ext_platforms)) {
      groups.back().members.push_back(r);
      continue;
    }
    groups.push_back({ .members = { r }, .platforms = supported_subset(*r, ext_platforms) });
  }
  return groups;
}

}  // namespace blext
