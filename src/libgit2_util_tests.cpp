#include "libgit2_util.h"

#include "cache.h"
#include "errors.h"
#include "location.h"
#include "util.h"

#include <doctest/doctest.h>

#include <git2.h>

#include <filesystem>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace blext;

namespace {

void git_check(int rc, char const *what) {
  if (rc != 0) { throw std::runtime_error(std::string{ what } + " failed"); }
}

// A repository with one commit holding files, tagged v1.
void make_repo(std::filesystem::path const &dir,
               std::vector<std::pair<std::string, std::string>> const &files) {
  std::filesystem::create_directories(dir);
  git_repository *repo_raw{ nullptr };
  git_check(git_repository_init(&repo_raw, dir.string().c_str(), 0), "git_repository_init");
  std::unique_ptr<git_repository, decltype(&git_repository_free)> repo{ repo_raw,
                                                                        git_repository_free };

  git_index *index_raw{ nullptr };
  git_check(git_repository_index(&index_raw, repo.get()), "git_repository_index");
  std::unique_ptr<git_index, decltype(&git_index_free)> index{ index_raw, git_index_free };
  for (auto const &[name, content] : files) {
    util_write_text_file(dir / name, content);
    git_check(git_index_add_bypath(index.get(), name.c_str()), "git_index_add_bypath");
  }
  git_check(git_index_write(index.get()), "git_index_write");

  git_oid tree_id;
  git_check(git_index_write_tree(&tree_id, index.get()), "git_index_write_tree");
  git_tree *tree_raw{ nullptr };
  git_check(git_tree_lookup(&tree_raw, repo.get(), &tree_id), "git_tree_lookup");
  std::unique_ptr<git_tree, decltype(&git_tree_free)> tree{ tree_raw, git_tree_free };

  git_signature *sig_raw{ nullptr };
  git_check(git_signature_new(&sig_raw, "Test", "test@example.com", 1700000000, 0),
            "git_signature_new");
  std::unique_ptr<git_signature, decltype(&git_signature_free)> sig{ sig_raw,
                                                                    git_signature_free };

  git_oid commit_id;
  git_check(git_commit_create_v(&commit_id,
                                repo.get(),
                                "HEAD",
                                sig.get(),
                                sig.get(),
                                nullptr,
                                "initial",
                                tree.get(),
                                0),
            "git_commit_create_v");

  git_object *commit_raw{ nullptr };
  git_check(git_object_lookup(&commit_raw, repo.get(), &commit_id, GIT_OBJECT_COMMIT),
            "git_object_lookup");
  std::unique_ptr<git_object, decltype(&git_object_free)> commit{ commit_raw, git_object_free };
  git_oid tag_id;
  git_check(git_tag_create_lightweight(&tag_id, repo.get(), "v1", commit.get(), 0),
            "git_tag_create_lightweight");
}

struct git_fixture {
  git_fixture() {
    static std::mt19937_64 rng{ std::random_device{}() };
    root = std::filesystem::temp_directory_path() / ("blext-git-test-" + std::to_string(rng()));
    make_repo(root / "origin",
              { { "pyproject.toml", "[project]\nname = \"my_addon\"\n" },
                { "README.md", "hello\n" } });
  }

  ~git_fixture() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  std::filesystem::path root;
};

}  // namespace

TEST_CASE_FIXTURE(git_fixture, "libgit2_clone checks out a tag") {
  auto const dest{ root / "clone" };
  libgit2_clone((root / "origin").string(), "v1", dest);
  CHECK(std::filesystem::exists(dest / "pyproject.toml"));
  CHECK(util_load_text_file(dest / "README.md") == "hello\n");
}

TEST_CASE_FIXTURE(git_fixture, "libgit2_clone rejects unknown refs") {
  CHECK_THROWS_AS(libgit2_clone((root / "origin").string(), "no-such-ref", root / "clone"),
                  std::runtime_error);
}

TEST_CASE_FIXTURE(git_fixture, "git locations are cloned into the cache") {
  std::filesystem::create_directories(root / "cache");
  cache c{ root / "cache" };

  auto const files{ locate(git_location{ .url = (root / "origin").string(), .ref = "v1" }, c) };
  CHECK(files.spec_path.filename() == "pyproject.toml");
  CHECK(files.root.string().starts_with(c.root().string()));

  CHECK_THROWS_AS(locate(git_location{ .url = (root / "missing").string(), .ref = "v1" }, c),
                  download_error);
}
