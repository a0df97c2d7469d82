#include "build_plan.h"

#include "tui.h"

#include <tbb/parallel_for_each.h>
#include <tbb/task_arena.h>

#include <algorithm>
#include <exception>
#include <map>
#include <set>

namespace blext {

namespace {

bool varies_by_line(std::vector<dependency_spec> const &deps) {
  return std::ranges::any_of(deps, [](dependency_spec const &d) {
    return !d.blender_overrides.empty() ||
           (d.req.env_marker && d.req.env_marker->str().find("extra") != std::string::npos);
  });
}

std::vector<release_group> split_by_line(std::vector<release_group> const &groups) {
  std::vector<release_group> out;
  for (auto const &g : groups) {
    bool fresh{ true };
    for (auto const *member : g.members) {
      if (!fresh && out.back().last().version.line() == member->version.line()) {
        out.back().members.push_back(member);
      } else {
        out.push_back({ .members = { member }, .platforms = g.platforms });
      }
      fresh = false;
    }
  }
  return out;
}

void plan_target(target_plan &t,
                 resolver const &res,
                 wheel_selector const &selector,
                 std::string const &project_name,
                 std::vector<dependency_spec> const &deps) {
  try {
    t.resolved = res.resolve(project_name, deps, t.target);
  } catch (...) {
    t.errors.push_back(describe_exception(std::current_exception()));
    return;
  }

  for (auto const &pkg : t.resolved->packages) {
    try {
      t.wheels.push_back(selector.select(pkg, t.target));
    } catch (...) { t.errors.push_back(describe_exception(std::current_exception())); }
  }
}

}  // namespace

bool group_plan::ok() const {
  return std::ranges::all_of(targets, [](target_plan const &t) { return t.ok(); });
}

std::vector<std::string> group_plan::wheel_filenames() const {
  std::set<std::string> names;
  for (auto const &t : targets) {
    for (auto const &w : t.wheels) { names.insert(w.wheel.filename); }
  }
  return { names.begin(), names.end() };
}

std::map<std::string, std::filesystem::path> group_plan::wheel_files() const {
  std::map<std::string, std::filesystem::path> by_name;
  for (auto const &t : targets) {
    for (std::size_t i{ 0 }; i < t.wheel_paths.size() && i < t.wheels.size(); ++i) {
      by_name.emplace(t.wheels[i].wheel.filename, t.wheel_paths[i]);
    }
  }
  return by_name;
}

bool build_plan::ok() const {
  return std::ranges::all_of(groups, [](group_plan const &g) { return g.ok(); });
}

std::size_t build_plan::target_count() const {
  std::size_t n{ 0 };
  for (auto const &g : groups) { n += g.targets.size(); }
  return n;
}

std::size_t build_plan::failed_target_count() const {
  std::size_t n{ 0 };
  for (auto const &g : groups) {
    n += static_cast<std::size_t>(
        std::ranges::count_if(g.targets, [](target_plan const &t) { return !t.ok(); }));
  }
  return n;
}

std::vector<release_group> plan_release_groups(engine_config const &cfg,
                                               std::vector<dependency_spec> const &deps) {
  auto const releases{ releases_in_range(cfg.blender_version_min, cfg.blender_version_max) };
  if (releases.empty()) {
    throw config_error("no official Blender release between " + cfg.blender_version_min.str() +
                       " and " +
                       (cfg.blender_version_max ? cfg.blender_version_max->str() : "the latest"));
  }

  auto const platforms{ cfg.platforms.empty() ? all_bl_platforms() : cfg.platforms };
  auto groups{ smoosh_releases(releases, platforms) };
  if (varies_by_line(deps)) { groups = split_by_line(groups); }

  std::erase_if(groups, [](release_group const &g) {
    if (g.platforms.empty()) {
      tui::warn("%s supports none of the requested platforms; skipping", g.name().c_str());
      return true;
    }
    return false;
  });
  if (groups.empty()) { throw config_error("no requested platform is supported in range"); }
  return groups;
}

build_plan make_build_plan(engine_config const &cfg,
                           package_index &index,
                           std::string const &project_name,
                           std::vector<dependency_spec> const &deps) {
  build_plan plan;
  for (auto const &g : plan_release_groups(cfg, deps)) {
    group_plan gp{ .group = g, .name = g.name() };
    for (auto const platform : g.platforms) {
      gp.targets.push_back({ .target = { .release = &g.first(),
                                         .platform = platform,
                                         .label = gp.name + " " +
                                                  std::string{ bl_platform_name(platform) } } });
    }
    plan.groups.push_back(std::move(gp));
  }

  std::vector<target_plan *> work;
  for (auto &g : plan.groups) {
    for (auto &t : g.targets) { work.push_back(&t); }
  }
  tui::info("Resolving %zu targets in %zu release groups", work.size(), plan.groups.size());

  index_memo memo{ index };
  resolver const res{ cfg, memo };
  wheel_selector const selector{ cfg };

  tbb::task_arena arena{ static_cast<int>(std::max(1u, cfg.worker_count)) };
  arena.execute([&] {
    tbb::parallel_for_each(work.begin(), work.end(), [&](target_plan *t) {
      plan_target(*t, res, selector, project_name, deps);
    });
  });

  for (auto const *t : work) {
    if (!t->ok()) {
      tui::debug("%s: %zu error(s)", t->target.label.c_str(), t->errors.size());
    }
  }
  return plan;
}

void download_plan(build_plan &plan, wheel_downloader &downloader) {
  std::vector<target_plan *> targets;
  std::vector<download_job> jobs;
  for (auto &g : plan.groups) {
    for (auto &t : g.targets) {
      if (!t.ok()) { continue; }
      download_job job{ .target = t.target.label };
      for (auto const &w : t.wheels) { job.wheels.push_back(w.wheel); }
      jobs.push_back(std::move(job));
      targets.push_back(&t);
    }
  }

  auto results{ downloader.run(jobs) };
  for (std::size_t i{ 0 }; i < results.size(); ++i) {
    auto &t{ *targets[i] };
    t.wheel_paths = std::move(results[i].wheel_paths);
    for (auto &e : results[i].errors) { t.errors.push_back(std::move(e)); }
  }
}

}  // namespace blext
