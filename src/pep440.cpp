#include "pep440.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>

namespace blext::pep440 {

namespace {

struct cursor {
  std::string_view s;
  std::size_t pos{ 0 };

  bool done() const { return pos >= s.size(); }
  char peek() const { return done() ? '\0' : s[pos]; }

  bool digit() const { return !done() && std::isdigit(static_cast<unsigned char>(s[pos])); }

  bool consume(char c) {
    if (peek() != c) { return false; }
    ++pos;
    return true;
  }

  bool consume_word(std::string_view word) {
    if (s.substr(pos).starts_with(word)) {
      pos += word.size();
      return true;
    }
    return false;
  }

  bool consume_separator() {
    char const c{ peek() };
    if (c == '.' || c == '-' || c == '_') {
      ++pos;
      return true;
    }
    return false;
  }

  std::optional<std::int64_t> number() {
    if (!digit()) { return std::nullopt; }
    std::int64_t value{ 0 };
    while (digit()) {
      value = value * 10 + (s[pos] - '0');
      ++pos;
    }
    return value;
  }
};

// Longest spellings first so "alpha" is not read as "a".
constexpr std::pair<std::string_view, version::pre_phase> kPreSpellings[]{
  { "preview", version::pre_phase::rc }, { "alpha", version::pre_phase::alpha },
  { "beta", version::pre_phase::beta },  { "pre", version::pre_phase::rc },
  { "rc", version::pre_phase::rc },      { "a", version::pre_phase::alpha },
  { "b", version::pre_phase::beta },     { "c", version::pre_phase::rc },
};

constexpr std::string_view kPostSpellings[]{ "post", "rev", "r" };

std::optional<version::pre_phase> consume_pre_word(cursor &c) {
  for (auto const &[word, phase] : kPreSpellings) {
    if (c.consume_word(word)) { return phase; }
  }
  return std::nullopt;
}

std::vector<std::int64_t> trimmed_release(std::vector<std::int64_t> release) {
  while (release.size() > 1 && release.back() == 0) { release.pop_back(); }
  return release;
}

bool is_numeric(std::string const &s) {
  return !s.empty() &&
         std::ranges::all_of(s, [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::strong_ordering compare_local(std::string const &a, std::string const &b) {
  if (a.empty() || b.empty()) { return !a.empty() <=> !b.empty(); }

  auto const sa{ util_split(a, '.') };
  auto const sb{ util_split(b, '.') };
  for (std::size_t i{ 0 }; i < std::min(sa.size(), sb.size()); ++i) {
    bool const na{ is_numeric(sa[i]) };
    bool const nb{ is_numeric(sb[i]) };
    if (na && nb) {
      auto const ia{ std::stoll(sa[i]) };
      auto const ib{ std::stoll(sb[i]) };
      if (ia != ib) { return ia <=> ib; }
    } else if (na != nb) {
      return na ? std::strong_ordering::greater : std::strong_ordering::less;
    } else if (auto const cmp{ sa[i].compare(sb[i]) }; cmp != 0) {
      return cmp <=> 0;
    }
  }
  return sa.size() <=> sb.size();
}

bool release_prefix_matches(version const &candidate,
                            std::int64_t epoch,
                            std::vector<std::int64_t> const &prefix) {
  if (candidate.epoch() != epoch) { return false; }
  auto release{ candidate.release() };
  if (release.size() < prefix.size()) { release.resize(prefix.size(), 0); }
  return std::equal(prefix.begin(), prefix.end(), release.begin());
}

}  // namespace

std::optional<version> version::parse(std::string_view text) {
  std::string const lowered{ util_to_lower(util_trim(text)) };
  cursor c{ lowered };
  version v;

  c.consume('v');

  auto first{ c.number() };
  if (!first) { return std::nullopt; }
  if (c.consume('!')) {
    v.epoch_ = *first;
    first = c.number();
    if (!first) { return std::nullopt; }
  }
  v.release_.push_back(*first);
  while (c.peek() == '.' && c.pos + 1 < c.s.size() &&
         std::isdigit(static_cast<unsigned char>(c.s[c.pos + 1]))) {
    ++c.pos;
    v.release_.push_back(*c.number());
  }

  // pre-release
  {
    auto const save{ c.pos };
    c.consume_separator();
    if (auto const phase{ consume_pre_word(c) }) {
      auto const mark{ c.pos };
      c.consume_separator();
      auto n{ c.number() };
      if (!n) { c.pos = mark; }
      v.pre_ = std::make_pair(*phase, n.value_or(0));
    } else {
      c.pos = save;
    }
  }

  // post-release
  {
    auto const save{ c.pos };
    if (c.consume('-') && c.digit()) {
      v.post_ = c.number();
    } else {
      c.pos = save;
      c.consume_separator();
      bool matched{ false };
      for (auto const word : kPostSpellings) {
        if (c.consume_word(word)) {
          matched = true;
          break;
        }
      }
      if (matched) {
        auto const mark{ c.pos };
        c.consume_separator();
        auto n{ c.number() };
        if (!n) { c.pos = mark; }
        v.post_ = n.value_or(0);
      } else {
        c.pos = save;
      }
    }
  }

  // dev-release
  {
    auto const save{ c.pos };
    c.consume_separator();
    if (c.consume_word("dev")) {
      auto const mark{ c.pos };
      c.consume_separator();
      auto n{ c.number() };
      if (!n) { c.pos = mark; }
      v.dev_ = n.value_or(0);
    } else {
      c.pos = save;
    }
  }

  if (c.consume('+')) {
    std::string local;
    bool expect_segment{ true };
    while (!c.done()) {
      char const ch{ c.peek() };
      if (std::isalnum(static_cast<unsigned char>(ch))) {
        local.push_back(ch);
        expect_segment = false;
      } else if ((ch == '.' || ch == '-' || ch == '_') && !expect_segment) {
        local.push_back('.');
        expect_segment = true;
      } else {
        return std::nullopt;
      }
      ++c.pos;
    }
    if (local.empty() || expect_segment) { return std::nullopt; }
    v.local_ = std::move(local);
  }

  if (!c.done()) { return std::nullopt; }
  return v;
}

version::version(std::string_view text) {
  auto parsed{ parse(text) };
  if (!parsed) {
    throw std::invalid_argument("invalid version: '" + std::string{ text } + "'");
  }
  *this = std::move(*parsed);
}

version version::public_version() const {
  version v{ *this };
  v.local_.clear();
  return v;
}

version version::base_version() const {
  version v;
  v.epoch_ = epoch_;
  v.release_ = release_;
  return v;
}

std::string version::str() const {
  std::string out;
  if (epoch_ != 0) { out += std::to_string(epoch_) + "!"; }
  for (std::size_t i{ 0 }; i < release_.size(); ++i) {
    if (i) { out.push_back('.'); }
    out += std::to_string(release_[i]);
  }
  if (pre_) {
    switch (pre_->first) {
      case pre_phase::alpha: out += "a"; break;
      case pre_phase::beta: out += "b"; break;
      case pre_phase::rc: out += "rc"; break;
    }
    out += std::to_string(pre_->second);
  }
  if (post_) { out += ".post" + std::to_string(*post_); }
  if (dev_) { out += ".dev" + std::to_string(*dev_); }
  if (!local_.empty()) { out += "+" + local_; }
  return out;
}

std::strong_ordering version::operator<=>(version const &other) const {
  constexpr auto kMin{ std::numeric_limits<std::int64_t>::min() };
  constexpr auto kMax{ std::numeric_limits<std::int64_t>::max() };

  auto const key{ [&](version const &v) {
    // dev-only releases sort before any pre-release of the same release
    std::pair<std::int64_t, std::int64_t> pre_key{ 3, 0 };
    if (v.pre_) {
      pre_key = { static_cast<std::int64_t>(v.pre_->first), v.pre_->second };
    } else if (!v.post_ && v.dev_) {
      pre_key = { -1, 0 };
    }
    return std::make_tuple(v.epoch_,
                           trimmed_release(v.release_),
                           pre_key,
                           v.post_.value_or(kMin),
                           v.dev_.value_or(kMax));
  } };

  if (auto const cmp{ key(*this) <=> key(other) }; cmp != 0) { return cmp; }
  return compare_local(local_, other.local_);
}

std::string_view op_string(specifier::op o) {
  switch (o) {
    case specifier::op::arbitrary: return "===";
    case specifier::op::compatible: return "~=";
    case specifier::op::equal: return "==";
    case specifier::op::not_equal: return "!=";
    case specifier::op::less_equal: return "<=";
    case specifier::op::greater_equal: return ">=";
    case specifier::op::less: return "<";
    case specifier::op::greater: return ">";
  }
  return "?";
}

specifier::specifier(std::string_view text) {
  auto const trimmed{ util_trim(text) };

  constexpr std::pair<std::string_view, op> kOps[]{
    { "===", op::arbitrary },  { "~=", op::compatible },   { "==", op::equal },
    { "!=", op::not_equal },   { "<=", op::less_equal },   { ">=", op::greater_equal },
    { "<", op::less },         { ">", op::greater },
  };

  auto const it{ std::ranges::find_if(kOps, [&](auto const &entry) {
    return trimmed.starts_with(entry.first);
  }) };
  if (it == std::end(kOps)) {
    throw std::invalid_argument("invalid specifier (missing operator): '" +
                                std::string{ text } + "'");
  }

  op_ = it->second;
  raw_ = std::string{ util_trim(trimmed.substr(it->first.size())) };
  if (raw_.empty()) {
    throw std::invalid_argument("invalid specifier (missing version): '" +
                                std::string{ text } + "'");
  }

  if (op_ == op::arbitrary) { return; }

  std::string_view version_text{ raw_ };
  if (version_text.ends_with(".*")) {
    if (op_ != op::equal && op_ != op::not_equal) {
      throw std::invalid_argument("wildcard only allowed with == or !=: '" +
                                  std::string{ text } + "'");
    }
    wildcard_ = true;
    version_text.remove_suffix(2);
  }

  version_ = version::parse(version_text);
  if (!version_) {
    throw std::invalid_argument("invalid version in specifier: '" + std::string{ text } +
                                "'");
  }
  if (op_ == op::compatible && version_->release().size() < 2) {
    throw std::invalid_argument("~= requires at least two release segments: '" +
                                std::string{ text } + "'");
  }
}

bool specifier::mentions_prerelease() const {
  return op_ != op::not_equal && version_ && version_->is_prerelease();
}

bool specifier::contains(version const &v) const {
  if (op_ == op::arbitrary) { return util_to_lower(raw_) == v.str(); }

  auto const &spec{ *version_ };

  switch (op_) {
    case op::equal:
      if (wildcard_) { return release_prefix_matches(v, spec.epoch(), spec.release()); }
      return spec.local().empty() ? v.public_version() == spec : v == spec;

    case op::not_equal:
      if (wildcard_) { return !release_prefix_matches(v, spec.epoch(), spec.release()); }
      return spec.local().empty() ? v.public_version() != spec : v != spec;

    case op::compatible: {
      auto prefix{ spec.release() };
      prefix.pop_back();
      return v.public_version() >= spec && release_prefix_matches(v, spec.epoch(), prefix);
    }

    case op::less_equal: return v.public_version() <= spec;
    case op::greater_equal: return v.public_version() >= spec;

    case op::less:
      if (!(v < spec)) { return false; }
      if (!spec.is_prerelease() && v.is_prerelease() &&
          v.base_version() == spec.base_version()) {
        return false;
      }
      return true;

    case op::greater:
      if (!(v.public_version() > spec)) { return false; }
      if (!spec.is_postrelease() && v.is_postrelease() &&
          v.base_version() == spec.base_version()) {
        return false;
      }
      return true;

    case op::arbitrary: break;
  }
  return false;
}

std::string specifier::str() const { return std::string{ op_string(op_) } + raw_; }

specifier_set::specifier_set(std::string_view text) {
  if (util_trim(text).empty()) { return; }
  for (auto const &part : util_split(text, ',')) {
    if (util_trim(part).empty()) {
      throw std::invalid_argument("empty specifier in '" + std::string{ text } + "'");
    }
    specs_.emplace_back(part);
  }
}

bool specifier_set::contains(version const &v, bool allow_prereleases) const {
  if (v.is_prerelease() && !allow_prereleases &&
      std::ranges::none_of(specs_, [](auto const &s) { return s.mentions_prerelease(); })) {
    return false;
  }
  return std::ranges::all_of(specs_, [&](auto const &s) { return s.contains(v); });
}

void specifier_set::add(specifier_set const &other) {
  specs_.insert(specs_.end(), other.specs_.begin(), other.specs_.end());
}

std::string specifier_set::str() const {
  std::vector<std::string> parts;
  parts.reserve(specs_.size());
  for (auto const &s : specs_) { parts.push_back(s.str()); }
  return util_join(parts, ",");
}

}  // namespace blext::pep440
