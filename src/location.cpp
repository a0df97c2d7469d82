#include "location.h"

#include "blake3_util.h"
#include "errors.h"
#include "extract.h"
#include "libcurl_util.h"
#include "libgit2_util.h"
#include "sha256.h"
#include "tui.h"
#include "util.h"

#include <functional>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace blext {

namespace {

bool starts_with_http(std::string_view text) {
  return text.starts_with("http://") || text.starts_with("https://");
}

// Last path segment of a URL, without query or fragment.
std::string url_filename(std::string_view url) {
  url = url.substr(0, url.find_first_of("?#"));
  while (url.ends_with('/')) { url.remove_suffix(1); }
  auto const slash{ url.rfind('/') };
  return std::string{ slash == std::string_view::npos ? url : url.substr(slash + 1) };
}

project_files find_in_tree(std::filesystem::path const &dir) {
  if (std::filesystem::exists(dir / "pyproject.toml")) { return find_project_files(dir); }

  std::vector<std::filesystem::path> subdirs;
  for (auto const &entry : std::filesystem::directory_iterator{ dir }) {
    if (entry.is_directory() && entry.path().filename() != ".git") {
      subdirs.push_back(entry.path());
    }
  }
  if (subdirs.size() == 1 && std::filesystem::exists(subdirs.front() / "pyproject.toml")) {
    return find_project_files(subdirs.front());
  }
  throw config_error("no pyproject.toml at the top of " + dir.string());
}

std::filesystem::path ensure_tree(
    cache &c,
    std::string const &key,
    std::function<void(std::filesystem::path const &stage)> const &populate) {
  auto entry{ c.ensure_project(key) };
  if (entry.lock) {
    populate(entry.lock->stage_dir());
    entry.lock->publish();
    entry.lock.reset();
  }
  return entry.payload_path;
}

void unpack(std::filesystem::path const &archive, std::filesystem::path const &dest) {
  try {
    extract(archive, dest);
  } catch (std::runtime_error const &e) {
    throw config_error("cannot unpack project archive " + archive.filename().string() + ": " +
                       e.what());
  }
}

project_files locate_url(url_location const &loc, cache &c) {
  auto const name{ url_filename(loc.url) };
  bool const is_script{ std::filesystem::path{ name }.extension() == ".py" };
  if (!is_script && !extract_is_archive_extension(name)) {
    throw config_error("URL must name a .py script or a project archive: " + loc.url);
  }

  auto const payload{ ensure_tree(c,
                                  blake3_fingerprint({ "url", loc.url }),
                                  [&](std::filesystem::path const &stage) {
                                    tui::info("Downloading %s", loc.url.c_str());
                                    if (is_script) {
                                      libcurl_download(loc.url, stage / name);
                                      return;
                                    }
                                    auto const download_dir{ stage / ".download" };
                                    std::filesystem::create_directories(download_dir);
                                    libcurl_download(loc.url, download_dir / name);
                                    unpack(download_dir / name, stage / "tree");
                                    std::filesystem::remove_all(download_dir);
                                  }) };

  return is_script ? find_project_files(payload / name) : find_in_tree(payload / "tree");
}

project_files locate_git(git_location const &loc, cache &c) {
  auto const payload{ ensure_tree(c,
                                  blake3_fingerprint({ "git", loc.url, loc.ref }),
                                  [&](std::filesystem::path const &stage) {
                                    tui::info("Cloning %s at %s",
                                              loc.url.c_str(),
                                              loc.ref.c_str());
                                    try {
                                      libgit2_clone(loc.url, loc.ref, stage / "repo");
                                    } catch (std::runtime_error const &e) {
                                      throw download_error(loc.url, e.what());
                                    }
                                  }) };
  return find_in_tree(payload / "repo");
}

project_files locate_packed(packed_location const &loc, cache &c) {
  if (!std::filesystem::is_regular_file(loc.archive)) {
    throw config_error("project archive does not exist: " + loc.archive.string());
  }
  auto const digest{ sha256_hex(sha256(loc.archive)) };
  auto const payload{ ensure_tree(c,
                                  blake3_fingerprint({ "packed", digest }),
                                  [&](std::filesystem::path const &stage) {
                                    unpack(loc.archive, stage / "tree");
                                  }) };
  return find_in_tree(payload / "tree");
}

}  // namespace

project_location parse_location(std::string_view text) {
  auto const trimmed{ util_trim(text) };
  if (trimmed.empty()) { throw config_error("empty project location"); }

  if (trimmed.starts_with("git+")) {
    auto url{ trimmed.substr(4) };
    git_location loc;
    auto const at{ url.rfind('@') };
    auto const slash{ url.rfind('/') };
    if (at != std::string_view::npos && (slash == std::string_view::npos || at > slash)) {
      loc.ref = std::string{ url.substr(at + 1) };
      url = url.substr(0, at);
      if (loc.ref.empty()) {
        throw config_error("empty git ref in '" + std::string{ trimmed } + "'");
      }
    }
    if (url.empty()) { throw config_error("empty git URL in '" + std::string{ trimmed } + "'"); }
    loc.url = std::string{ url };
    return loc;
  }

  if (starts_with_http(trimmed)) {
    if (url_filename(trimmed).ends_with(".git")) {
      return git_location{ .url = std::string{ trimmed } };
    }
    return url_location{ std::string{ trimmed } };
  }

  std::filesystem::path const path{ std::string{ trimmed } };
  if (extract_is_archive_extension(path)) { return packed_location{ path }; }
  return path_location{ path };
}

std::string location_str(project_location const &loc) {
  return std::visit(
      match{
          [](path_location const &l) { return l.path.string(); },
          [](url_location const &l) { return l.url; },
          [](git_location const &l) { return "git+" + l.url + "@" + l.ref; },
          [](packed_location const &l) { return l.archive.string(); },
      },
      loc);
}

project_files find_project_files(std::filesystem::path const &path) {
  auto const abs{ std::filesystem::absolute(path).lexically_normal() };

  if (std::filesystem::is_directory(abs)) {
    auto const spec{ abs / "pyproject.toml" };
    if (!std::filesystem::is_regular_file(spec)) {
      throw config_error("no pyproject.toml in " + abs.string());
    }
    return { abs, spec };
  }

  if (std::filesystem::is_regular_file(abs)) {
    if (abs.filename() == "pyproject.toml" || abs.extension() == ".py") {
      return { abs.parent_path(), abs };
    }
    throw config_error(abs.string() +
                       " is neither a project directory, a pyproject.toml nor a .py script");
  }

  throw config_error("project path does not exist: " + abs.string());
}

project_files locate(project_location const &loc, cache &c) {
  return std::visit(
      match{
          [](path_location const &l) { return find_project_files(l.path); },
          [&c](url_location const &l) { return locate_url(l, c); },
          [&c](git_location const &l) { return locate_git(l, c); },
          [&c](packed_location const &l) { return locate_packed(l, c); },
      },
      loc);
}

}  // namespace blext
