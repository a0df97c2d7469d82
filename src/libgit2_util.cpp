#include "libgit2_util.h"

#include "tui.h"

#include <git2.h>

#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace blext {

namespace {

std::string last_git_error(std::string prefix) {
  if (git_error const *err{ git_error_last() }; err && err->message) { prefix += err->message; }
  return prefix;
}

git_repository *try_git_clone(std::string const &url,
                              std::filesystem::path const &dest,
                              int depth) {
  git_clone_options clone_opts;
  git_clone_options_init(&clone_opts, GIT_CLONE_OPTIONS_VERSION);
  if (depth > 0) { clone_opts.fetch_opts.depth = depth; }

  git_repository *repo_raw{ nullptr };
  if (git_clone(&repo_raw, url.c_str(), dest.string().c_str(), &clone_opts)) {
    return nullptr;
  }
  return repo_raw;
}

git_object *try_resolve_ref(git_repository *repo, std::string const &ref) {
  for (auto const &candidate : { ref, "origin/" + ref }) {
    if (git_object *obj{ nullptr }; !git_revparse_single(&obj, repo, candidate.c_str())) {
      return obj;
    }
  }
  return nullptr;
}

}  // namespace

libgit2_scope::libgit2_scope() { git_libgit2_init(); }
libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

void libgit2_clone(std::string const &url,
                   std::string const &ref,
                   std::filesystem::path const &destination) {
  std::filesystem::create_directories(destination);

  // Shallow clones may miss the ref (tags, old commits); fall back to a full clone.
  git_repository *repo_raw{ try_git_clone(url, destination, 1) };
  git_object *target_obj{ repo_raw ? try_resolve_ref(repo_raw, ref) : nullptr };

  if (!target_obj) {
    if (repo_raw) { git_repository_free(repo_raw); }
    tui::debug("git: shallow clone of %s did not provide '%s'; cloning fully",
               url.c_str(),
               ref.c_str());

    std::error_code ec;
    std::filesystem::remove_all(destination, ec);
    std::filesystem::create_directories(destination);

    repo_raw = try_git_clone(url, destination, 0);
    if (!repo_raw) { throw std::runtime_error(last_git_error("git clone " + url + " failed: ")); }

    target_obj = try_resolve_ref(repo_raw, ref);
    if (!target_obj) {
      git_repository_free(repo_raw);
      throw std::runtime_error(last_git_error("git: cannot resolve '" + ref + "' in " + url + ": "));
    }
  }

  std::unique_ptr<git_repository, decltype(&git_repository_free)> repo{ repo_raw,
                                                                        git_repository_free };
  std::unique_ptr<git_object, decltype(&git_object_free)> target{ target_obj, git_object_free };

  git_checkout_options checkout_opts;
  git_checkout_options_init(&checkout_opts, GIT_CHECKOUT_OPTIONS_VERSION);
  checkout_opts.checkout_strategy = GIT_CHECKOUT_FORCE;

  if (git_checkout_tree(repo.get(), target.get(), &checkout_opts)) {
    throw std::runtime_error(last_git_error("git checkout failed: "));
  }
  if (git_repository_set_head_detached(repo.get(), git_object_id(target.get()))) {
    throw std::runtime_error(last_git_error("git: failed to update HEAD: "));
  }
}

}  // namespace blext
