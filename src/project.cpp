#include "project.h"

#include "errors.h"
#include "tui.h"
#include "util.h"

#include <toml++/toml.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace blext {

namespace {

using node_view = toml::node_view<toml::node const>;

constexpr std::array<std::string_view, 5> kPermissions{
  "files", "network", "clipboard", "camera", "microphone"
};

// Field problems gathered over the whole spec, reported together.
struct field_errors {
  std::vector<std::string> lines;

  void missing(std::string_view field) {
    lines.push_back("- `" + std::string{ field } + "` is not defined");
  }
  void bad(std::string_view field, std::string_view why) {
    lines.push_back("- `" + std::string{ field } + "` " + std::string{ why });
  }
};

bool is_identifier(std::string_view s) {
  if (s.empty() || std::isdigit(static_cast<unsigned char>(s.front()))) { return false; }
  return std::ranges::all_of(s, [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

std::optional<std::string> required_string(node_view n, std::string_view field, field_errors &errs) {
  if (!n) {
    errs.missing(field);
    return std::nullopt;
  }
  auto value{ n.value<std::string>() };
  if (!value) { errs.bad(field, "must be a string"); }
  return value;
}

std::vector<std::string> string_array(node_view n, std::string_view field, field_errors &errs) {
  std::vector<std::string> out;
  if (!n) { return out; }
  auto const *arr{ n.as_array() };
  if (!arr) {
    errs.bad(field, "must be an array of strings");
    return out;
  }
  for (auto const &el : *arr) {
    auto s{ el.value<std::string>() };
    if (!s) {
      errs.bad(field, "must be an array of strings");
      return {};
    }
    out.push_back(std::move(*s));
  }
  return out;
}

template <typename T, typename Parse>
std::optional<T> parsed_field(node_view n, std::string_view field, field_errors &errs, Parse parse) {
  if (!n) { return std::nullopt; }
  auto const text{ n.value<std::string>() };
  if (!text) {
    errs.bad(field, "must be a string");
    return std::nullopt;
  }
  try {
    return parse(*text);
  } catch (std::invalid_argument const &e) {
    errs.bad(field, e.what());
    return std::nullopt;
  }
}

std::optional<std::string> license_field(node_view n, field_errors &errs) {
  if (!n) {
    errs.missing("project.license");
    return std::nullopt;
  }
  if (auto s{ n.value<std::string>() }) { return s; }
  if (auto text{ n["text"].value<std::string>() }) { return text; }
  errs.bad("project.license", "must be an SPDX identifier or a table with a `text` field");
  return std::nullopt;
}

std::string maintainer_field(node_view n, field_errors &errs) {
  if (!n) { return "Unknown <unknown@example.com>"; }
  auto const *arr{ n.as_array() };
  if (auto const *first{ arr && !arr->empty() ? (*arr)[0].as_table() : nullptr }) {
    auto const name{ (*first)["name"].value<std::string>() };
    auto const email{ (*first)["email"].value<std::string>() };
    if (name && email) { return *name + " <" + *email + ">"; }
  }
  errs.bad("project.maintainers", "must be a non-empty array of {name, email} tables");
  return {};
}

// Restricts a requirement to one Blender line through the root's "extra" marker variable.
requirement gated_requirement(std::string_view text, std::string_view group) {
  auto const semi{ text.find(';') };
  std::string gated{ util_trim(text.substr(0, semi)) };
  gated += "; ";
  if (semi != std::string_view::npos) {
    gated += "(" + std::string{ util_trim(text.substr(semi + 1)) } + ") and ";
  }
  gated += "extra == \"" + std::string{ group } + "\"";
  return requirement::parse(gated);
}

std::vector<dependency_spec> parse_dependencies(node_view deps_node,
                                                std::string_view deps_field,
                                                node_view optional_node,
                                                field_errors &errs) {
  std::vector<dependency_spec> deps;
  for (auto const &text : string_array(deps_node, deps_field, errs)) {
    try {
      auto req{ requirement::parse(text) };
      auto const dup{ std::ranges::find_if(
          deps, [&](dependency_spec const &d) { return d.req.name == req.name; }) };
      if (dup != deps.end()) {
        errs.bad(deps_field, "lists " + req.name + " more than once");
        continue;
      }
      deps.push_back({ .req = std::move(req) });
    } catch (std::invalid_argument const &e) { errs.bad(deps_field, e.what()); }
  }

  auto const *groups{ optional_node.as_table() };
  if (!groups) { return deps; }

  for (auto &&[key, value] : *groups) {
    std::string const group{ key.str() };
    auto const line{ blender_line_from_group(group) };
    if (!line) {
      tui::debug("ignoring optional-dependency group '%s'", group.c_str());
      continue;
    }
    std::string const field{ "project.optional-dependencies." + group };
    for (auto const &text : string_array(node_view{ value }, field, errs)) {
      try {
        auto req{ requirement::parse(text) };
        auto const it{ std::ranges::find_if(
            deps, [&](dependency_spec const &d) { return d.req.name == req.name; }) };
        if (it == deps.end()) {
          deps.push_back({ .req = gated_requirement(text, group) });
        } else if (!it->blender_overrides.emplace(*line, std::move(req)).second) {
          errs.bad(field, "lists " + it->req.name + " more than once");
        }
      } catch (std::invalid_argument const &e) { errs.bad(field, e.what()); }
    }
  }
  return deps;
}

std::map<std::string, std::string> parse_permissions(node_view n, field_errors &errs) {
  std::map<std::string, std::string> out;
  if (!n) { return out; }
  auto const *tbl{ n.as_table() };
  if (!tbl) {
    errs.bad("tool.blext.permissions", "must be a table of permission = \"reason\"");
    return out;
  }
  for (auto &&[key, value] : *tbl) {
    std::string const name{ key.str() };
    if (std::find(kPermissions.begin(), kPermissions.end(), name) == kPermissions.end()) {
      errs.bad("tool.blext.permissions", "has unknown permission '" + name + "'");
      continue;
    }
    auto reason{ value.value<std::string>() };
    if (!reason || reason->empty()) {
      errs.bad("tool.blext.permissions." + name, "must be a non-empty reason");
      continue;
    }
    out.emplace(name, std::move(*reason));
  }
  return out;
}

toml::table parse_spec_file(project_files const &files) {
  try {
    if (files.is_script()) {
      auto const block{ script_metadata_block(util_load_text_file(files.spec_path)) };
      if (block.empty()) {
        throw config_error("no inline script metadata in " + files.spec_path.string() +
                           " (looking for a `# /// script` block)");
      }
      return toml::parse(block, files.spec_path.string());
    }
    return toml::parse_file(files.spec_path.string());
  } catch (toml::parse_error const &e) {
    throw config_error(files.spec_path.string() + ":" +
                       std::to_string(e.source().begin.line) + ": " +
                       std::string{ e.description() });
  }
}

}  // namespace

std::filesystem::path project::package_dir() const {
  return files.is_script() ? std::filesystem::path{} : files.root / id;
}

void project::apply_to(engine_config &cfg) const {
  cfg.blender_version_min = blender_version_min;
  cfg.blender_version_max = blender_version_max;
  cfg.platforms = platforms.empty() ? all_bl_platforms() : platforms;
  cfg.min_glibc_version = min_glibc_version;
  cfg.min_macos_version = min_macos_version;
  cfg.python_tags = python_tags;
  cfg.abi_tags = abi_tags;
}

std::string script_metadata_block(std::string_view source) {
  std::vector<std::string> blocks;
  std::optional<std::string> current;

  for (auto line : util_split(source, '\n')) {
    if (line.ends_with('\r')) { line.pop_back(); }
    if (!current) {
      if (line == "# /// script") { current.emplace(); }
      continue;
    }
    if (line == "# ///") {
      blocks.push_back(std::move(*current));
      current.reset();
    } else if (line == "#") {
      *current += '\n';
    } else if (line.starts_with("# ")) {
      *current += line.substr(2) + '\n';
    } else {
      current.reset();  // not a metadata block
    }
  }

  if (blocks.size() > 1) {
    throw config_error("multiple `# /// script` blocks of inline script metadata");
  }
  return blocks.empty() ? std::string{} : blocks.front();
}

std::optional<std::string> blender_line_from_group(std::string_view group) {
  if (!group.starts_with("blender")) { return std::nullopt; }
  auto const parts{ util_split(group.substr(7), '_') };
  if (parts.size() != 2) { return std::nullopt; }
  for (auto const &p : parts) {
    if (p.empty() || !std::ranges::all_of(p, [](char c) {
          return std::isdigit(static_cast<unsigned char>(c));
        })) {
      return std::nullopt;
    }
  }
  return parts[0] + "." + parts[1];
}

project project_load(project_files const &files) {
  auto const spec{ parse_spec_file(files) };
  node_view const root{ spec };

  if (!root["project"].as_table()) {
    throw config_error(files.spec_path.string() + " has no [project] table");
  }
  if (!root["tool"]["blext"].as_table()) {
    throw config_error(files.spec_path.string() + " has no [tool.blext] table");
  }
  auto const proj{ root["project"] };
  auto const blext{ root["tool"]["blext"] };

  field_errors errs;
  project p;
  p.files = files;

  p.id = required_string(proj["name"], "project.name", errs).value_or("");
  p.version = required_string(proj["version"], "project.version", errs).value_or("");
  p.tagline = required_string(proj["description"], "project.description", errs).value_or("");
  p.pretty_name =
      required_string(blext["pretty_name"], "tool.blext.pretty_name", errs).value_or("");
  p.license = license_field(proj["license"], errs).value_or("");
  p.maintainer = maintainer_field(proj["maintainers"], errs);
  p.website = proj["urls"]["Homepage"].value<std::string>();

  auto const requires_python_node{ files.is_script() && root["requires-python"]
                                       ? root["requires-python"]
                                       : proj["requires-python"] };
  p.requires_python =
      required_string(requires_python_node, "project.requires-python", errs).value_or("");

  if (!blext["copyright"]) {
    errs.missing("tool.blext.copyright");
  } else {
    p.copyright = string_array(blext["copyright"], "tool.blext.copyright", errs);
  }
  p.bl_tags = string_array(blext["bl_tags"], "tool.blext.bl_tags", errs);
  p.permissions = parse_permissions(blext["permissions"], errs);

  if (!blext["blender_version_min"]) { errs.missing("tool.blext.blender_version_min"); }
  auto const parse_bl{ [](std::string const &s) { return bl_version::parse(s); } };
  if (auto v{ parsed_field<bl_version>(
          blext["blender_version_min"], "tool.blext.blender_version_min", errs, parse_bl) }) {
    p.blender_version_min = *v;
  }
  p.blender_version_max = parsed_field<bl_version>(
      blext["blender_version_max"], "tool.blext.blender_version_max", errs, parse_bl);
  if (p.blender_version_max && *p.blender_version_max <= p.blender_version_min) {
    errs.bad("tool.blext.blender_version_max", "must be greater than blender_version_min");
  }

  auto const parse_os{ [](std::string const &s) { return os_version::parse(s); } };
  p.min_glibc_version = parsed_field<os_version>(
      blext["min_glibc_version"], "tool.blext.min_glibc_version", errs, parse_os);
  p.min_macos_version = parsed_field<os_version>(
      blext["min_macos_version"], "tool.blext.min_macos_version", errs, parse_os);

  for (auto const &name :
       string_array(blext["supported_platforms"], "tool.blext.supported_platforms", errs)) {
    if (auto const platform{ bl_platform_parse(name) }) {
      if (std::ranges::find(p.platforms, *platform) == p.platforms.end()) {
        p.platforms.push_back(*platform);
      }
    } else {
      errs.bad("tool.blext.supported_platforms", "has unknown platform '" + name + "'");
    }
  }
  p.python_tags =
      string_array(blext["supported_python_tags"], "tool.blext.supported_python_tags", errs);
  p.abi_tags = string_array(blext["supported_abi_tags"], "tool.blext.supported_abi_tags", errs);

  bool const script_deps{ files.is_script() && root["dependencies"] };
  p.dependencies = parse_dependencies(script_deps ? root["dependencies"] : proj["dependencies"],
                                      script_deps ? "dependencies" : "project.dependencies",
                                      proj["optional-dependencies"],
                                      errs);

  if (!p.id.empty()) {
    if (!is_identifier(p.id)) {
      errs.bad("project.name", "must be a valid Python identifier (got '" + p.id + "')");
    } else if (files.is_script()) {
      auto const stem{ files.spec_path.stem().string() };
      if (stem != p.id) {
        errs.bad("project.name",
                 "does not match the script name; rename " + files.spec_path.filename().string() +
                     " to " + p.id + ".py or set project.name = \"" + stem + "\"");
      }
    } else if (!std::filesystem::is_directory(p.package_dir())) {
      errs.bad("project.name",
               "names no package directory; rename the extension package to " + p.id + "/");
    }
  }

  if (!errs.lines.empty()) {
    throw config_error("In " + files.spec_path.string() + ":\n" + util_join(errs.lines, "\n"));
  }

  tui::debug("loaded project %s %s with %zu dependencies",
             p.id.c_str(),
             p.version.c_str(),
             p.dependencies.size());
  return p;
}

}  // namespace blext
