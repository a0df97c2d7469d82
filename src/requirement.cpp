#include "requirement.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace blext {

namespace {

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

[[noreturn]] void fail(std::string_view text, std::string const &why) {
  throw std::invalid_argument("invalid requirement '" + std::string{ text } + "': " + why);
}

}  // namespace

std::string canonicalize_name(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  bool in_separator{ false };
  for (char const c : util_trim(name)) {
    if (c == '-' || c == '_' || c == '.') {
      in_separator = true;
      continue;
    }
    if (in_separator && !out.empty()) { out.push_back('-'); }
    in_separator = false;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

requirement requirement::parse(std::string_view text) {
  std::string_view rest{ util_trim(text) };
  requirement req;

  std::string_view marker_text;
  if (auto const semi{ rest.find(';') }; semi != std::string_view::npos) {
    marker_text = util_trim(rest.substr(semi + 1));
    rest = util_trim(rest.substr(0, semi));
    if (marker_text.empty()) { fail(text, "empty marker after ';'"); }
  }

  std::size_t i{ 0 };
  while (i < rest.size() && is_name_char(rest[i])) { ++i; }
  if (i == 0 || !std::isalnum(static_cast<unsigned char>(rest[0])) ||
      !std::isalnum(static_cast<unsigned char>(rest[i - 1]))) {
    fail(text, "missing or malformed project name");
  }
  req.display_name = std::string{ rest.substr(0, i) };
  req.name = canonicalize_name(req.display_name);
  rest = util_trim(rest.substr(i));

  if (rest.starts_with('[')) {
    auto const close{ rest.find(']') };
    if (close == std::string_view::npos) { fail(text, "unterminated extras"); }
    for (auto const &extra : util_split(rest.substr(1, close - 1), ',')) {
      auto const trimmed{ util_trim(extra) };
      if (trimmed.empty()) { continue; }
      req.extras.push_back(canonicalize_name(trimmed));
    }
    std::ranges::sort(req.extras);
    rest = util_trim(rest.substr(close + 1));
  }

  if (rest.starts_with('@')) {
    req.url = std::string{ util_trim(rest.substr(1)) };
    if (req.url.empty()) { fail(text, "empty URL after '@'"); }
  } else {
    if (rest.starts_with('(')) {
      if (!rest.ends_with(')')) { fail(text, "unbalanced parentheses"); }
      rest = util_trim(rest.substr(1, rest.size() - 2));
    }
    try {
      req.specifiers = pep440::specifier_set{ rest };
    } catch (std::invalid_argument const &e) { fail(text, e.what()); }
  }

  if (!marker_text.empty()) {
    try {
      req.env_marker = marker::parse(marker_text);
    } catch (std::invalid_argument const &e) { fail(text, e.what()); }
  }

  return req;
}

bool requirement::applies_to(std::vector<marker_environment> const &envs) const {
  return !env_marker || env_marker->evaluate_any(envs);
}

std::string requirement::str() const {
  std::string out{ name };
  if (!extras.empty()) { out += "[" + util_join(extras, ",") + "]"; }
  if (!url.empty()) {
    out += " @ " + url;
  } else {
    out += specifiers.str();
  }
  if (env_marker) { out += "; " + env_marker->str(); }
  return out;
}

requirement const &dependency_spec::for_blender_line(std::string_view line) const {
  auto const it{ blender_overrides.find(line) };
  return it == blender_overrides.end() ? req : it->second;
}

}  // namespace blext
