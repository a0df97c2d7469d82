#include "cmd_common.h"

#include "errors.h"
#include "location.h"
#include "pypi_index.h"
#include "tui.h"

#include <CLI/CLI.hpp>

#include <stdexcept>

namespace blext {

void register_project_options(CLI::App &sub, project_options &opts) {
  sub.add_option("location",
                 opts.location,
                 "Project directory, pyproject.toml, script, archive, URL or git+URL[@ref]")
      ->capture_default_str();
  sub.add_option("--platform",
                 opts.platforms,
                 "Build only for these platforms (linux-x64, macos-arm64, windows-x64, ...)");
  sub.add_option("--bl-version", opts.bl_version, "Plan for one Blender release only (4.2.3)");
  sub.add_option("--index-url", opts.index_url, "Package index base URL")
      ->capture_default_str();
  sub.add_option("--jobs", opts.jobs, "Concurrent resolutions and downloads")
      ->check(CLI::Range(1u, 64u))
      ->capture_default_str();
  sub.add_flag("--pre", opts.allow_prereleases, "Allow pre-release versions");
}

loaded_project load_project(project_options const &opts, cache &c) {
  auto const files{ locate(parse_location(opts.location), c) };
  loaded_project lp{ .proj = project_load(files) };
  lp.proj.apply_to(lp.cfg);

  if (!opts.platforms.empty()) {
    lp.cfg.platforms.clear();
    for (auto const &name : opts.platforms) {
      auto const p{ bl_platform_parse(name) };
      if (!p) { throw config_error("unknown platform '" + name + "'"); }
      lp.cfg.platforms.push_back(*p);
    }
  }

  if (opts.bl_version) {
    bl_version v;
    try {
      v = bl_version::parse(*opts.bl_version);
    } catch (std::invalid_argument const &e) { throw config_error(e.what()); }
    if (v < lp.cfg.blender_version_min ||
        (lp.cfg.blender_version_max && v >= *lp.cfg.blender_version_max)) {
      throw config_error("Blender " + v.str() + " is outside the project's supported range");
    }
    if (!find_release(v)) {
      throw config_error("Blender " + v.str() + " is not an official release");
    }
    lp.cfg.blender_version_min = v;
    lp.cfg.blender_version_max = bl_version{ v.major, v.minor, v.patch + 1 };
  }

  lp.cfg.index_url = opts.index_url;
  lp.cfg.worker_count = opts.jobs;
  lp.cfg.allow_prereleases = opts.allow_prereleases;
  lp.cfg.cache_root = c.root();

  tui::info("Project %s %s (%s)",
            lp.proj.id.c_str(),
            lp.proj.version.c_str(),
            files.spec_path.string().c_str());
  return lp;
}

build_plan plan_project(loaded_project const &lp) {
  pypi_index index{ lp.cfg.index_url,
                    libcurl_get,
                    { .attempts = lp.cfg.download_attempts, .backoff = lp.cfg.retry_backoff } };
  return make_build_plan(lp.cfg, index, lp.proj.id, lp.proj.dependencies);
}

std::size_t log_plan_errors(build_plan const &plan) {
  for (auto const &g : plan.groups) {
    for (auto const &t : g.targets) {
      for (auto const &e : t.errors) {
        tui::error("[%s] %s: %s", t.target.label.c_str(), e.kind.c_str(), e.message.c_str());
      }
    }
  }
  auto const failed{ plan.failed_target_count() };
  if (failed) {
    tui::error("%zu of %zu targets failed", failed, plan.target_count());
  }
  return failed;
}

}  // namespace blext
