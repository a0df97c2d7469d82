#include "resolver.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace blext {

namespace {

constexpr std::size_t kMaxListedVersions{ 10 };

struct constraint_entry {
  std::string requirer;  // label shown to the user
  pep440::specifier_set spec;
  std::vector<std::string> chain;
  std::set<std::string> causes;  // decided packages that put this constraint in place
};

struct conflict {
  std::string package;
  std::vector<constraint_entry> constraints;
};

// A dead end, with the decisions that led to it. Changing any other decision cannot help.
struct failure {
  conflict c;
  std::set<std::string> culprits;
};

struct edge {
  requirement req;
  std::string requirer;
  std::string requirer_package;  // empty for the project
  std::vector<std::string> chain;  // project ... requirer
  std::set<std::string> causes;
};

struct node {
  pep440::version version;
  index_release meta;
  std::vector<std::string> extras;
  std::set<std::string> extra_causes;  // packages whose edges asked for extras
  std::vector<std::string> chain;  // project ... this package
  std::vector<std::string> required_by;
};

// Everything one branch of the search has committed to. Copied at each decision so a
// rejected candidate leaves its parent untouched.
struct search_state {
  std::vector<edge> stack;
  std::map<std::string, node> nodes;
  std::map<std::string, std::vector<constraint_entry>> constraints;
  std::map<std::string, reference_pin> pins_used;
};

std::string package_label(std::string const &package, pep440::version const &v) {
  return package + " " + v.str();
}

std::string pin_label(bl_release const &release) {
  return "Blender " + release.version.str() + " (bundled)";
}

bool admits(pep440::specifier_set const &spec, pep440::version const &v) {
  return spec.contains(v, true);
}

bool admits_all(std::vector<constraint_entry> const &cs, pep440::version const &v) {
  return std::ranges::all_of(cs, [&](constraint_entry const &c) { return admits(c.spec, v); });
}

bool mentions_prerelease(std::vector<constraint_entry> const &cs) {
  return std::ranges::any_of(cs, [](constraint_entry const &c) {
    return std::ranges::any_of(c.spec.specifiers(),
                               [](pep440::specifier const &s) { return s.mentions_prerelease(); });
  });
}

std::set<std::string> causes_of(std::vector<constraint_entry> const &cs) {
  std::set<std::string> out;
  for (auto const &c : cs) { out.insert(c.causes.begin(), c.causes.end()); }
  return out;
}

std::vector<pep440::version> sorted_desc(std::vector<pep440::version> versions) {
  std::ranges::sort(versions, std::greater<>{});
  return versions;
}

// Depth-first search over package decisions with conflict-directed backjumping: a failed
// branch returns to the newest decision among its culprits, skipping unrelated ones.
class dependency_search : unmovable {
 public:
  dependency_search(engine_config const &cfg,
         package_index &index,
         resolve_target const &target,
         std::string const &project_name)
      : cfg_{ cfg },
        index_{ index },
        target_{ target },
        release_{ *target.release },
        project_name_{ project_name },
        base_envs_{ marker_environments(*target.release, target.platform) } {}

  void seed(search_state &s, std::vector<dependency_spec> const &deps) const {
    std::vector<edge> roots;
    for (auto const &dep : deps) {
      auto const &req{ dep.for_blender_line(release_.version.line()) };
      if (!req.applies_to(base_envs_)) {
        tui::debug("%s: %s does not apply", target_.label.c_str(), req.str().c_str());
        continue;
      }
      roots.push_back({ .req = req, .requirer = project_name_, .chain = { project_name_ } });
    }
    push_all(s, std::move(roots));
  }

  std::optional<failure> solve(search_state &s) {
    while (!s.stack.empty()) {
      edge e{ std::move(s.stack.back()) };
      s.stack.pop_back();
      if (auto const *pin{ release_.find_pin(e.req.name) }) {
        if (auto f{ check_pin(s, e, *pin) }) { return f; }
        continue;
      }
      auto const name{ e.req.name };
      add_constraint(s, e);
      if (s.nodes.contains(name)) {
        if (auto f{ revisit(s, e) }) { return f; }
        continue;
      }
      return decide(s, name, e);
    }
    return std::nullopt;
  }

  int attempts() const { return attempts_; }

 private:
  // Depth-first: children are processed before siblings, in declaration order.
  static void push_all(search_state &s, std::vector<edge> edges) {
    for (auto it{ edges.rbegin() }; it != edges.rend(); ++it) { s.stack.push_back(std::move(*it)); }
  }

  static constraint_entry entry_for(edge const &e) {
    return { .requirer = e.requirer, .spec = e.req.specifiers, .chain = e.chain, .causes = e.causes };
  }

  constraint_entry pin_entry(reference_pin const &pin) const {
    return { .requirer = pin_label(release_), .spec = pep440::specifier_set{ "==" + pin.version.str() } };
  }

  std::optional<failure> check_pin(search_state &s, edge const &e, reference_pin const &pin) const {
    if (!e.req.url.empty()) { reject_url(e); }
    s.pins_used.emplace(e.req.name, pin);
    if (admits(e.req.specifiers, pin.version)) { return std::nullopt; }
    if (e.requirer_package.empty()) { throw_reference_conflict(e, pin); }
    return failure{ .c = { .package = e.req.name, .constraints = { entry_for(e), pin_entry(pin) } },
                    .culprits = e.causes };
  }

  [[noreturn]] static void reject_url(edge const &e) {
    throw config_error(e.requirer + ": direct URL requirement '" + e.req.str() +
                       "' cannot be vendored; publish it to a package index");
  }

  static void add_constraint(search_state &s, edge const &e) {
    if (!e.req.url.empty()) { reject_url(e); }
    auto &cs{ s.constraints[e.req.name] };
    auto entry{ entry_for(e) };
    bool const duplicate{ std::ranges::any_of(cs, [&](constraint_entry const &c) {
      return c.requirer == entry.requirer && c.spec.str() == entry.spec.str();
    }) };
    if (!duplicate) { cs.push_back(std::move(entry)); }
  }

  // A package already decided on this branch gains another requirer.
  std::optional<failure> revisit(search_state &s, edge const &e) const {
    auto const &name{ e.req.name };
    node &n{ s.nodes.at(name) };
    if (std::ranges::find(n.required_by, e.requirer) == n.required_by.end()) {
      n.required_by.push_back(e.requirer);
    }
    if (!admits(e.req.specifiers, n.version)) {
      auto const &cs{ s.constraints.at(name) };
      auto culprits{ causes_of(cs) };
      culprits.insert(name);
      return failure{ .c = { .package = name, .constraints = cs }, .culprits = std::move(culprits) };
    }

    std::vector<std::string> added;
    for (auto const &x : e.req.extras) {
      if (std::ranges::find(n.extras, x) == n.extras.end()) { added.push_back(x); }
    }
    if (!added.empty()) {
      n.extras.insert(n.extras.end(), added.begin(), added.end());
      std::ranges::sort(n.extras);
      n.extra_causes.insert(e.causes.begin(), e.causes.end());
      expand(s, name);
    }
    return std::nullopt;
  }

  std::optional<failure> decide(search_state &s, std::string const &name, edge const &e) {
    auto const cs{ s.constraints.at(name) };
    bool const prerelease_ok{ cfg_.allow_prereleases || mentions_prerelease(cs) };

    // Pre-releases are tried only when no final release is installable.
    std::vector<pep440::version> finals;
    std::vector<pep440::version> prereleases;
    for (auto const &v : sorted_desc(index_.versions(name))) {
      if (!admits_all(cs, v)) { continue; }
      (v.is_prerelease() && !prerelease_ok ? prereleases : finals).push_back(v);
    }

    std::vector<std::string> skipped;
    bool installable{ false };
    std::optional<failure> first;
    std::set<std::string> culprits{ causes_of(cs) };
    for (auto const *pass : { &finals, &prereleases }) {
      if (pass == &prereleases && installable) { break; }
      for (auto const &v : *pass) {
        auto meta{ index_.release(name, v) };
        if (auto const reason{ skip_reason(meta) }) {
          skipped.push_back(v.str() + " (" + *reason + ")");
          continue;
        }
        installable = true;
        if (++attempts_ > cfg_.resolve_max_attempts) { throw_exhausted(); }

        search_state next{ s };
        auto chain{ e.chain };
        chain.push_back(name);
        next.nodes.emplace(name,
                           node{ .version = v,
                                 .meta = std::move(meta),
                                 .extras = e.req.extras,
                                 .extra_causes = e.causes,
                                 .chain = std::move(chain),
                                 .required_by = { e.requirer } });
        expand(next, name);

        auto f{ solve(next) };
        if (!f) {
          s = std::move(next);
          return std::nullopt;
        }
        if (!f->culprits.contains(name)) { return f; }

        BLEXT_TRACE_RESOLVE_BACKTRACK(target_.label, name, v.str(), attempts_);
        tui::debug("%s: rejecting %s %s (conflict on %s)",
                   target_.label.c_str(),
                   name.c_str(),
                   v.str().c_str(),
                   f->c.package.c_str());
        last_conflict_ = f->c.package;
        culprits.insert(f->culprits.begin(), f->culprits.end());
        if (!first) { first = std::move(f); }
      }
    }

    if (!installable) {
      if (culprits.empty() && !skipped.empty()) {
        throw index_error("No installable version of " + name + " for " + target_.label +
                          "; skipped: " + util_join(skipped, ", "));
      }
      return failure{ .c = { .package = name, .constraints = cs }, .culprits = std::move(culprits) };
    }

    culprits.erase(name);
    first->culprits = std::move(culprits);
    return first;
  }

  std::optional<std::string> skip_reason(index_release const &meta) const {
    if (meta.yanked) { return "yanked"; }
    if (!requires_python_ok(meta, pep440::version{ release_.python_version })) {
      return "requires Python " + meta.requires_python;
    }
    if (meta.files.empty()) { return "no wheels"; }
    return std::nullopt;
  }

  bool requires_python_ok(index_release const &meta, pep440::version const &python) const {
    if (meta.requires_python.empty()) { return true; }
    try {
      return pep440::specifier_set{ meta.requires_python }.contains(python, true);
    } catch (std::invalid_argument const &ex) {
      tui::debug("%s %s: ignoring requires_python: %s",
                 meta.package.c_str(),
                 meta.version.c_str(),
                 ex.what());
      return true;
    }
  }

  [[noreturn]] void throw_exhausted() const {
    std::string msg{ "Gave up resolving " + target_.label + " after trying " +
                     std::to_string(cfg_.resolve_max_attempts) + " candidate versions" };
    if (!last_conflict_.empty()) { msg += "; last conflict on " + last_conflict_; }
    throw index_error(msg);
  }

  [[noreturn]] void throw_reference_conflict(edge const &e, reference_pin const &pin) const {
    std::string remedy;
    if (auto const newer{ resolver::release_admitting(pin.package, e.req.specifiers,
                                                      release_.version) }) {
      remedy = "raise tool.blext.blender_version_min to " + newer->str();
    } else {
      remedy = "relax the " + pin.package + " constraint to admit " + pin.version.str() +
               ", or drop Blender " + release_.version.line() + " support";
    }
    throw reference_conflict_error({ .package = pin.package,
                                     .pinned_version = pin.version.str(),
                                     .constraint = e.req.specifiers.str(),
                                     .requirer = e.requirer,
                                     .blender_version = release_.version.str(),
                                     .remedy = std::move(remedy) });
  }

  std::vector<marker_environment> envs_for(std::vector<std::string> const &extras) const {
    std::vector<marker_environment> envs{ base_envs_ };
    for (auto const &x : extras) {
      for (auto env : base_envs_) {
        env["extra"] = x;
        envs.push_back(std::move(env));
      }
    }
    return envs;
  }

  void expand(search_state &s, std::string const &name) const {
    node const &n{ s.nodes.at(name) };
    auto const envs{ envs_for(n.extras) };
    auto const label{ package_label(name, n.version) };
    auto causes{ n.extra_causes };
    causes.insert(name);

    std::vector<edge> children;
    for (auto const &raw : n.meta.requires_dist) {
      std::optional<requirement> req;
      try {
        req = requirement::parse(raw);
      } catch (std::invalid_argument const &ex) {
        tui::warn("%s: skipping unparseable dependency: %s", label.c_str(), ex.what());
        continue;
      }
      if (!req->applies_to(envs)) { continue; }
      children.push_back({ .req = std::move(*req),
                           .requirer = label,
                           .requirer_package = name,
                           .chain = n.chain,
                           .causes = causes });
    }
    push_all(s, std::move(children));
  }

  engine_config const &cfg_;
  package_index &index_;
  resolve_target const &target_;
  bl_release const &release_;
  std::string const &project_name_;
  std::vector<marker_environment> const base_envs_;
  int attempts_{ 0 };
  std::string last_conflict_;
};

std::string common_ancestor(std::vector<constraint_entry> const &cs) {
  std::vector<std::string> prefix;
  bool first{ true };
  for (auto const &c : cs) {
    if (c.chain.empty()) { continue; }
    if (first) {
      prefix = c.chain;
      first = false;
      continue;
    }
    auto const [a, b]{ std::ranges::mismatch(prefix, c.chain) };
    prefix.erase(a, prefix.end());
  }
  return prefix.empty() ? std::string{} : prefix.back();
}

[[noreturn]] void throw_fatal(conflict const &c,
                              resolve_target const &target,
                              package_index &index) {
  std::vector<pep440::version> available;
  if (auto const *pin{ target.release->find_pin(c.package) }) {
    available.push_back(pin->version);
  } else {
    available = sorted_desc(index.versions(c.package));
  }

  if (c.constraints.size() < 2) {
    auto const &only{ c.constraints.front() };
    std::vector<std::string> listed;
    for (std::size_t i{ 0 }; i < available.size() && i < kMaxListedVersions; ++i) {
      listed.push_back(available[i].str());
    }
    throw index_error("No version of " + c.package + only.spec.str() + " (required by " +
                      only.requirer + ") exists for " + target.label + "; available: " +
                      (listed.empty() ? std::string{ "none" } : util_join(listed, ", ")));
  }

  resolution_conflict_error::payload p{ .target = target.label, .package = c.package };
  for (auto const &entry : c.constraints) {
    p.requirers.push_back(
        { .requirer = entry.requirer, .constraint = entry.spec.str(), .chain = entry.chain });
  }
  p.common_ancestor = common_ancestor(c.constraints);

  for (std::size_t i{ 0 }; i < c.constraints.size() && !p.narrowest; ++i) {
    for (std::size_t j{ i + 1 }; j < c.constraints.size() && !p.narrowest; ++j) {
      bool const disjoint{ std::ranges::none_of(available, [&](pep440::version const &v) {
        return admits(c.constraints[i].spec, v) && admits(c.constraints[j].spec, v);
      }) };
      if (disjoint) { p.narrowest = std::make_pair(i, j); }
    }
  }

  for (std::size_t i{ 0 }; i < available.size() && i < kMaxListedVersions; ++i) {
    p.available_versions.push_back(available[i].str());
  }
  throw resolution_conflict_error(std::move(p));
}

}  // namespace

resolver::resolver(engine_config const &cfg, package_index &index)
    : cfg_{ cfg }, index_{ index } {}

std::optional<bl_version> resolver::release_admitting(std::string_view package,
                                                      pep440::specifier_set const &spec,
                                                      bl_version const &after) {
  for (auto const &r : official_releases()) {
    if (!(after < r.version)) { continue; }
    auto const *pin{ r.find_pin(package) };
    if (!pin || admits(spec, pin->version)) { return r.version; }
  }
  return std::nullopt;
}

resolution resolver::resolve(std::string const &project_name,
                             std::vector<dependency_spec> const &deps,
                             resolve_target const &target) const {
  auto const start{ std::chrono::steady_clock::now() };
  BLEXT_TRACE_RESOLVE_START(target.label, static_cast<std::int64_t>(deps.size()));

  dependency_search solver{ cfg_, index_, target, project_name };
  search_state state;
  solver.seed(state, deps);
  if (auto const f{ solver.solve(state) }) { throw_fatal(f->c, target, index_); }

  resolution out{ .target = target.label };
  for (auto &[name, n] : state.nodes) {
    out.packages.push_back({ .package = name,
                             .version = n.version,
                             .extras = n.extras,
                             .required_by = n.required_by,
                             .metadata = n.meta });
  }
  for (auto const &[name, pin] : state.pins_used) { out.reference_used.push_back(pin); }

  auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start) };
  BLEXT_TRACE_RESOLVE_COMPLETE(target.label,
                               static_cast<std::int64_t>(out.packages.size()),
                               static_cast<std::int64_t>(elapsed.count()));
  tui::debug("%s: resolved %zu packages after %d candidate(s)",
             target.label.c_str(),
             out.packages.size(),
             solver.attempts());
  return out;
}

}  // namespace blext
