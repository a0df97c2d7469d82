#include "test_support.h"

#include "errors.h"
#include "requirement.h"
#include "sha256.h"

#include <utility>

namespace blext::test {

index_file wheel_file(std::string filename, std::uint64_t size) {
  auto const digest{ sha256(filename.data(), filename.size()) };
  std::string url{ "https://files.example/" + filename };
  return { .filename = std::move(filename),
           .url = std::move(url),
           .size = size,
           .sha256 = sha256_hex(digest) };
}

fake_index &fake_index::add(std::string_view package, std::string_view version, release_spec spec) {
  auto const name{ canonicalize_name(package) };
  auto const v{ pep440::version{ version } };
  if (spec.files.empty()) {
    std::string stem{ name };
    for (auto &c : stem) {
      if (c == '-') { c = '_'; }
    }
    spec.files.push_back(wheel_file(stem + "-" + v.str() + "-py3-none-any.whl"));
  }

  std::lock_guard lock{ mutex_ };
  packages_[name].insert_or_assign(v.str(),
                                   index_release{ .package = name,
                                                  .version = v.str(),
                                                  .requires_dist = std::move(spec.requires_dist),
                                                  .requires_python = std::move(spec.requires_python),
                                                  .yanked = spec.yanked,
                                                  .files = std::move(spec.files) });
  return *this;
}

std::vector<pep440::version> fake_index::versions(std::string_view package) {
  ++version_calls;
  std::lock_guard lock{ mutex_ };
  auto const it{ packages_.find(canonicalize_name(package)) };
  if (it == packages_.end()) {
    throw index_error("fake index: package '" + std::string{ package } + "' not found");
  }
  std::vector<pep440::version> out;
  for (auto const &[text, rel] : it->second) { out.emplace_back(text); }
  return out;
}

index_release fake_index::release(std::string_view package, pep440::version const &version) {
  ++release_calls;
  std::lock_guard lock{ mutex_ };
  auto const it{ packages_.find(canonicalize_name(package)) };
  if (it != packages_.end()) {
    if (auto const rel{ it->second.find(version.str()) }; rel != it->second.end()) {
      return rel->second;
    }
  }
  throw index_error("fake index: release '" + std::string{ package } + "==" + version.str() +
                    "' not found");
}

}  // namespace blext::test
