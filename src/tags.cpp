#include "tags.h"

#include "errors.h"
#include "requirement.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace blext {

namespace {

struct arch_entry {
  std::string_view tag;
  std::vector<cpu_arch> archs;
};

std::vector<arch_entry> const &linux_archs() {
  static std::vector<arch_entry> const table{
    { "x86_64", { cpu_arch::X64 } },       { "aarch64", { cpu_arch::ARM64 } },
    { "i686", { cpu_arch::X86 } },         { "armv7l", { cpu_arch::ARMV7L } },
    { "ppc64le", { cpu_arch::PPC64LE } },  { "s390x", { cpu_arch::S390X } },
    { "riscv64", { cpu_arch::RISCV64 } },
  };
  return table;
}

// Fat binaries list every architecture they carry; only x64/arm64/x86 matter here.
std::vector<arch_entry> const &macos_archs() {
  static std::vector<arch_entry> const table{
    { "x86_64", { cpu_arch::X64 } },
    { "arm64", { cpu_arch::ARM64 } },
    { "universal2", { cpu_arch::X64, cpu_arch::ARM64 } },
    { "intel", { cpu_arch::X64, cpu_arch::X86 } },
    { "fat64", { cpu_arch::X64 } },
    { "fat3", { cpu_arch::X64, cpu_arch::X86 } },
    { "universal", { cpu_arch::X64, cpu_arch::X86 } },
    { "fat32", { cpu_arch::X86 } },
    { "i386", { cpu_arch::X86 } },
  };
  return table;
}

std::vector<arch_entry> const &windows_archs() {
  static std::vector<arch_entry> const table{
    { "win_amd64", { cpu_arch::X64 } },
    { "win_arm64", { cpu_arch::ARM64 } },
    { "win32", { cpu_arch::X86 } },
  };
  return table;
}

std::vector<cpu_arch> const *find_archs(std::vector<arch_entry> const &table,
                                        std::string_view tag) {
  auto const it{ std::ranges::find(table, tag, &arch_entry::tag) };
  return it == table.end() ? nullptr : &it->archs;
}

std::optional<int> parse_int(std::string_view text) {
  int value{ 0 };
  auto const [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), value) };
  if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
    return std::nullopt;
  }
  return value;
}

// "<major>_<minor>_<arch>" where arch may itself contain underscores.
struct versioned_suffix {
  os_version version;
  std::string_view arch;
};

std::optional<versioned_suffix> split_versioned(std::string_view rest) {
  auto const first{ rest.find('_') };
  if (first == std::string_view::npos) { return std::nullopt; }
  auto const second{ rest.find('_', first + 1) };
  if (second == std::string_view::npos) { return std::nullopt; }
  auto const major{ parse_int(rest.substr(0, first)) };
  auto const minor{ parse_int(rest.substr(first + 1, second - first - 1)) };
  if (!major || !minor) { return std::nullopt; }
  return versioned_suffix{ { *major, *minor }, rest.substr(second + 1) };
}

std::vector<platform_tag> expand(os_family os,
                                 libc_family libc,
                                 std::vector<cpu_arch> const &archs,
                                 std::optional<os_version> min) {
  std::vector<platform_tag> out;
  out.reserve(archs.size());
  for (auto const arch : archs) {
    out.push_back({ .os = os, .arch = arch, .libc = libc, .min_os_version = min });
  }
  return out;
}

// "cp311" -> (3, 11)
std::optional<std::pair<int, int>> cpython_version(std::string_view tag) {
  if (!tag.starts_with("cp") || tag.size() < 4) { return std::nullopt; }
  int major{ 0 };
  int minor{ 0 };
  auto const digits{ tag.substr(2) };
  if (std::from_chars(digits.data(), digits.data() + 1, major).ec != std::errc{}) {
    return std::nullopt;
  }
  auto const [end, ec]{ std::from_chars(digits.data() + 1, digits.data() + digits.size(), minor) };
  if (ec != std::errc{} || end != digits.data() + digits.size()) { return std::nullopt; }
  return std::make_pair(major, minor);
}

bool loadable_pair(std::string_view python, std::string_view abi, std::string_view interpreter) {
  if (abi == "none") { return python == interpreter || python.starts_with("py"); }
  if (abi == "abi3") {
    auto const tag{ cpython_version(python) };
    auto const interp{ cpython_version(interpreter) };
    return tag && interp && tag->first == 3 && interp->first == 3 && tag->second >= 2 &&
           tag->second <= interp->second;
  }
  return abi == interpreter && python == interpreter;
}

}  // namespace

std::string_view os_family_name(os_family os) {
  switch (os) {
    case os_family::LINUX: return "linux";
    case os_family::MACOS: return "macos";
    case os_family::WINDOWS: return "windows";
  }
  return "unknown";
}

std::string_view cpu_arch_name(cpu_arch arch) {
  switch (arch) {
    case cpu_arch::X64: return "x64";
    case cpu_arch::ARM64: return "arm64";
    case cpu_arch::X86: return "x86";
    case cpu_arch::ARMV7L: return "armv7l";
    case cpu_arch::PPC64LE: return "ppc64le";
    case cpu_arch::S390X: return "s390x";
    case cpu_arch::RISCV64: return "riscv64";
  }
  return "unknown";
}

os_version os_version::parse(std::string_view text) {
  auto const trimmed{ util_trim(text) };
  auto const sep{ trimmed.find_first_of("._") };
  auto const major{ parse_int(trimmed.substr(0, sep)) };
  auto const minor{ sep == std::string_view::npos ? std::optional<int>{ 0 }
                                                  : parse_int(trimmed.substr(sep + 1)) };
  if (!major || !minor || *major < 0 || *minor < 0) {
    throw std::invalid_argument("invalid OS version '" + std::string{ text } + "'");
  }
  return { *major, *minor };
}

std::string os_version::str() const {
  return std::to_string(major) + "." + std::to_string(minor);
}

std::strong_ordering platform_tag::operator<=>(platform_tag const &other) const {
  return std::tie(os, arch, libc) <=> std::tie(other.os, other.arch, other.libc);
}

std::string platform_tag::str() const {
  std::string out{ std::string{ os_family_name(os) } + "-" + std::string{ cpu_arch_name(arch) } };
  if (libc == libc_family::MUSL) { out += " musl"; }
  if (min_os_version) {
    out += os == os_family::MACOS ? " macos>=" : libc == libc_family::MUSL ? ">=" : " glibc>=";
    out += min_os_version->str();
  }
  return out;
}

std::string legacy_manylinux_to_pep600(std::string_view tag) {
  static std::pair<std::string_view, std::string_view> const kAliases[]{
    { "manylinux1", "manylinux_2_5" },
    { "manylinux2010", "manylinux_2_12" },
    { "manylinux2014", "manylinux_2_17" },
  };
  for (auto const &[legacy, modern] : kAliases) {
    if (tag == legacy) { return std::string{ modern }; }
    if (tag.starts_with(legacy) && tag.size() > legacy.size() && tag[legacy.size()] == '_') {
      return std::string{ modern } + std::string{ tag.substr(legacy.size()) };
    }
  }
  return std::string{ tag };
}

std::vector<platform_tag> normalize_platform_tag(std::string_view raw) {
  std::string const tag{ legacy_manylinux_to_pep600(util_to_lower(util_trim(raw))) };
  std::string_view const view{ tag };

  auto const versioned{ [&](std::string_view prefix,
                            os_family os,
                            libc_family libc,
                            std::vector<arch_entry> const &table) -> std::vector<platform_tag> {
    auto const parts{ split_versioned(view.substr(prefix.size())) };
    if (!parts) {
      throw unrecognized_tag_error(std::string{ raw }, "expected <major>_<minor>_<arch>");
    }
    auto const *archs{ find_archs(table, parts->arch) };
    if (!archs) {
      throw unrecognized_tag_error(std::string{ raw },
                                   "unknown architecture '" + std::string{ parts->arch } + "'");
    }
    return expand(os, libc, *archs, parts->version);
  } };

  if (view.starts_with("manylinux_")) {
    return versioned("manylinux_", os_family::LINUX, libc_family::GLIBC, linux_archs());
  }
  if (view.starts_with("musllinux_")) {
    return versioned("musllinux_", os_family::LINUX, libc_family::MUSL, linux_archs());
  }
  if (view.starts_with("macosx_")) {
    return versioned("macosx_", os_family::MACOS, libc_family::NONE, macos_archs());
  }
  if (auto const *archs{ find_archs(windows_archs(), view) }) {
    return expand(os_family::WINDOWS, libc_family::NONE, *archs, std::nullopt);
  }
  throw unrecognized_tag_error(std::string{ raw }, "not a manylinux, musllinux, macosx or win tag");
}

bool is_compatible(platform_tag const &wheel_platform, platform_tag const &target) {
  if (!(wheel_platform == target)) { return false; }
  if (!wheel_platform.min_os_version) { return true; }
  return target.min_os_version && *target.min_os_version >= *wheel_platform.min_os_version;
}

std::optional<platform_tag> best_platform_match(std::vector<platform_tag> const &wheel_tags,
                                                platform_tag const &target) {
  std::optional<platform_tag> best;
  for (auto const &tag : wheel_tags) {
    if (!is_compatible(tag, target)) { continue; }
    if (!best || tag.min_os_version > best->min_os_version) { best = tag; }
  }
  return best;
}

bool wheel_descriptor::admits_python(std::string_view interpreter,
                                     std::vector<std::string> const &valid_python_tags,
                                     std::vector<std::string> const &valid_abi_tags) const {
  for (auto const &py : python_tags) {
    if (std::ranges::find(valid_python_tags, py) == valid_python_tags.end()) { continue; }
    for (auto const &abi : abi_tags) {
      if (std::ranges::find(valid_abi_tags, abi) == valid_abi_tags.end()) { continue; }
      if (loadable_pair(py, abi, interpreter)) { return true; }
    }
  }
  return false;
}

wheel_descriptor parse_wheel_filename(std::string_view filename) {
  if (!filename.ends_with(".whl")) {
    throw unrecognized_tag_error(std::string{ filename }, "not a .whl file");
  }
  auto const parts{ util_split(filename.substr(0, filename.size() - 4), '-') };
  if (parts.size() != 5 && parts.size() != 6) {
    throw unrecognized_tag_error(std::string{ filename },
                                 "expected name-version[-build]-python-abi-platform");
  }
  if (std::ranges::any_of(parts, [](std::string const &p) { return p.empty(); })) {
    throw unrecognized_tag_error(std::string{ filename }, "empty filename component");
  }

  auto const ver{ pep440::version::parse(parts[1]) };
  if (!ver) {
    throw unrecognized_tag_error(std::string{ filename }, "invalid version '" + parts[1] + "'");
  }

  std::string build_tag;
  if (parts.size() == 6) {
    build_tag = parts[2];
    if (!std::isdigit(static_cast<unsigned char>(build_tag.front()))) {
      throw unrecognized_tag_error(std::string{ filename },
                                   "build tag must start with a digit");
    }
  }

  auto const n{ parts.size() };
  wheel_descriptor wd{
    .filename = std::string{ filename },
    .package = canonicalize_name(parts[0]),
    .version = *ver,
    .build_tag = std::move(build_tag),
    .python_tags = util_split(parts[n - 3], '.'),
    .abi_tags = util_split(parts[n - 2], '.'),
  };

  bool saw_unrecognized{ false };
  for (auto const &component : util_split(parts[n - 1], '.')) {
    if (component == "any") {
      wd.platform_any = true;
      wd.platform_tags.push_back(component);
      continue;
    }
    try {
      auto expanded{ normalize_platform_tag(component) };
      wd.platform_tags.push_back(legacy_manylinux_to_pep600(component));
      wd.platforms.insert(wd.platforms.end(), expanded.begin(), expanded.end());
    } catch (unrecognized_tag_error const &e) {
      saw_unrecognized = true;
      tui::debug("%s: dropping platform component: %s", wd.filename.c_str(), e.what());
    }
  }

  if (wd.platform_tags.empty()) {
    throw unrecognized_tag_error(std::string{ filename },
                                 saw_unrecognized ? "no recognized platform tag"
                                                  : "missing platform tag");
  }
  return wd;
}

}  // namespace blext
