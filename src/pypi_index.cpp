#include "pypi_index.h"

#include "errors.h"
#include "requirement.h"
#include "tui.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <thread>
#include <utility>

namespace blext {

namespace {

nlohmann::json parse_document(std::string_view package, std::string_view json_text) {
  try {
    return nlohmann::json::parse(json_text);
  } catch (nlohmann::json::parse_error const &e) {
    throw index_error("pypi: malformed response for '" + std::string{ package } + "': " + e.what());
  }
}

bool retryable_status(long status) { return status == 429 || status >= 500; }

std::string string_or_empty(nlohmann::json const &obj, char const *key) {
  auto const it{ obj.find(key) };
  return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

}  // namespace

pypi_index::pypi_index(std::string base_url, http_get_fn get, retry_policy retry)
    : base_url_{ std::move(base_url) }, get_{ std::move(get) }, retry_{ retry } {
  while (base_url_.ends_with('/')) { base_url_.pop_back(); }
}

std::string pypi_index::fetch(std::string const &url, std::string_view what) {
  int const attempts{ std::max(1, retry_.attempts) };
  auto backoff{ retry_.backoff };

  for (int attempt{ 1 };; ++attempt) {
    tui::debug("pypi: GET %s", url.c_str());
    http_response response;
    std::string reason;
    try {
      response = get_(url);
    } catch (download_error const &e) {
      reason = e.reason().empty() ? std::string{ "transport failure" } : e.reason();
    }

    if (reason.empty()) {
      if (response.status == 200) { return std::move(response.body); }
      if (response.status == 404) {
        throw index_error("pypi: " + std::string{ what } + " not found at " + base_url_);
      }
      reason = "HTTP " + std::to_string(response.status);
      if (!retryable_status(response.status)) { throw download_error(url, reason, attempt); }
    }

    if (attempt >= attempts) { throw download_error(url, reason, attempt); }
    tui::warn("pypi: %s: attempt %d of %d failed (%s); retrying in %lld ms",
              std::string{ what }.c_str(),
              attempt,
              attempts,
              reason.c_str(),
              static_cast<long long>(backoff.count()));
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

std::vector<pep440::version> pypi_index::versions(std::string_view package) {
  auto const name{ canonicalize_name(package) };
  auto const body{ fetch(base_url_ + "/pypi/" + name + "/json", "package '" + name + "'") };
  return pypi_parse_versions(name, body);
}

index_release pypi_index::release(std::string_view package, pep440::version const &version) {
  auto const name{ canonicalize_name(package) };
  auto const body{ fetch(base_url_ + "/pypi/" + name + "/" + version.str() + "/json",
                         "release '" + name + "==" + version.str() + "'") };
  return pypi_parse_release(name, body);
}

std::vector<pep440::version> pypi_parse_versions(std::string_view package,
                                                 std::string_view json_text) {
  auto const doc = parse_document(package, json_text);
  auto const releases{ doc.find("releases") };
  if (releases == doc.end() || !releases->is_object()) {
    throw index_error("pypi: response for '" + std::string{ package } + "' has no releases");
  }

  std::vector<pep440::version> out;
  for (auto const &[text, files] : releases->items()) {
    bool const has_wheel{ files.is_array() &&
                          std::ranges::any_of(files, [](nlohmann::json const &f) {
                            return string_or_empty(f, "filename").ends_with(".whl");
                          }) };
    if (!has_wheel) { continue; }
    if (auto v{ pep440::version::parse(text) }) {
      out.push_back(std::move(*v));
    } else {
      tui::debug("pypi: %s: ignoring unparseable version '%s'",
                 std::string{ package }.c_str(),
                 text.c_str());
    }
  }
  return out;
}

index_release pypi_parse_release(std::string_view package, std::string_view json_text) {
  auto const doc = parse_document(package, json_text);
  auto const info{ doc.find("info") };
  auto const urls{ doc.find("urls") };
  if (info == doc.end() || !info->is_object() || urls == doc.end() || !urls->is_array()) {
    throw index_error("pypi: release document for '" + std::string{ package } +
                      "' lacks info or urls");
  }

  index_release rel{
    .package = canonicalize_name(package),
    .version = string_or_empty(*info, "version"),
    .requires_python = string_or_empty(*info, "requires_python"),
    .yanked = info->value("yanked", false),
  };

  if (auto const deps{ info->find("requires_dist") }; deps != info->end() && deps->is_array()) {
    for (auto const &d : *deps) {
      if (d.is_string()) { rel.requires_dist.push_back(d.get<std::string>()); }
    }
  }

  for (auto const &file : *urls) {
    auto filename{ string_or_empty(file, "filename") };
    if (!filename.ends_with(".whl")) { continue; }
    if (file.value("yanked", false)) { continue; }

    std::string sha256;
    if (auto const digests{ file.find("digests") };
        digests != file.end() && digests->is_object()) {
      sha256 = string_or_empty(*digests, "sha256");
    }
    rel.files.push_back({ .filename = std::move(filename),
                          .url = string_or_empty(file, "url"),
                          .size = file.value("size", std::uint64_t{ 0 }),
                          .sha256 = std::move(sha256) });
  }
  return rel;
}

}  // namespace blext
