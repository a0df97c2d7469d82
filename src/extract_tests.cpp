#include "extract.h"

#include "pack.h"

#include <doctest/doctest.h>

#include <algorithm>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::filesystem::path make_temp_dir() {
  static std::mt19937_64 rng{ std::random_device{}() };
  auto dir{ std::filesystem::temp_directory_path() /
            std::filesystem::path("blext-extract-test-" + std::to_string(rng())) };
  std::filesystem::create_directories(dir);
  return dir;
}

std::vector<std::string> collect_files_recursive(std::filesystem::path const &root) {
  std::vector<std::string> files;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(root)) {
    if (entry.is_regular_file()) {
      files.push_back(std::filesystem::relative(entry.path(), root).generic_string());
    }
  }
  std::ranges::sort(files);
  return files;
}

// root/file1.txt, root/file2.txt, root/subdir/file3.txt
std::filesystem::path make_sample_zip(std::filesystem::path const &dir) {
  auto const path{ dir / "sample.zip" };
  blext::zip_writer zip{ path };
  zip.add_text("root/file1.txt", "one\n");
  zip.add_text("root/file2.txt", "two\n");
  zip.add_text("root/subdir/file3.txt", "three\n");
  zip.close();
  return path;
}

}  // namespace

TEST_CASE("extract with strip_components=0 preserves structure") {
  auto const tmp{ make_temp_dir() };
  auto const archive{ make_sample_zip(tmp) };
  auto const dest{ tmp / "out" };

  auto const count{ blext::extract(archive, dest) };
  CHECK(count == 3);

  auto const files{ collect_files_recursive(dest) };
  REQUIRE(files.size() == 3);
  CHECK(files[0] == "root/file1.txt");
  CHECK(files[1] == "root/file2.txt");
  CHECK(files[2] == "root/subdir/file3.txt");

  std::filesystem::remove_all(tmp);
}

TEST_CASE("extract with strip_components=1 drops the top directory") {
  auto const tmp{ make_temp_dir() };
  auto const archive{ make_sample_zip(tmp) };
  auto const dest{ tmp / "out" };

  blext::extract_options const opts{ .strip_components = 1 };
  CHECK(blext::extract(archive, dest, opts) == 3);

  auto const files{ collect_files_recursive(dest) };
  REQUIRE(files.size() == 3);
  CHECK(files[0] == "file1.txt");
  CHECK(files[2] == "subdir/file3.txt");

  std::filesystem::remove_all(tmp);
}

TEST_CASE("extract rejects an archive that yields no files") {
  auto const tmp{ make_temp_dir() };
  auto const archive{ make_sample_zip(tmp) };

  blext::extract_options const opts{ .strip_components = 5 };
  CHECK_THROWS_AS(blext::extract(archive, tmp / "out", opts), std::runtime_error);

  std::filesystem::remove_all(tmp);
}

TEST_CASE("extract reports a missing archive") {
  auto const tmp{ make_temp_dir() };
  CHECK_THROWS_AS(blext::extract(tmp / "missing.zip", tmp / "out"), std::runtime_error);
  std::filesystem::remove_all(tmp);
}

TEST_CASE("extract_is_archive_extension") {
  CHECK(blext::extract_is_archive_extension("addon.zip"));
  CHECK(blext::extract_is_archive_extension("addon-1.0.tar.gz"));
  CHECK(blext::extract_is_archive_extension("addon.tgz"));
  CHECK(blext::extract_is_archive_extension("addon.tar.zst"));
  CHECK_FALSE(blext::extract_is_archive_extension("addon.py"));
  CHECK_FALSE(blext::extract_is_archive_extension("numpy-2.0.0-cp311-cp311-win_amd64.whl"));
  CHECK_FALSE(blext::extract_is_archive_extension("project"));
}
