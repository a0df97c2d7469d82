#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blext::pep440 {

// A PEP 440 version. Parsing accepts the permissive spellings (leading 'v', "alpha",
// "preview", "-1" post releases, '_' separators); str() yields the normalized form.
class version {
 public:
  enum class pre_phase { alpha, beta, rc };

  static std::optional<version> parse(std::string_view text);

  // Throws std::invalid_argument on malformed input.
  explicit version(std::string_view text);

  std::int64_t epoch() const { return epoch_; }
  std::vector<std::int64_t> const &release() const { return release_; }
  std::optional<std::pair<pre_phase, std::int64_t>> const &pre() const { return pre_; }
  std::optional<std::int64_t> const &post() const { return post_; }
  std::optional<std::int64_t> const &dev() const { return dev_; }
  std::string const &local() const { return local_; }

  bool is_prerelease() const { return pre_.has_value() || dev_.has_value(); }
  bool is_postrelease() const { return post_.has_value(); }

  // Same version without the +local segment.
  version public_version() const;

  // Same release tuple only (no pre/post/dev/local).
  version base_version() const;

  std::string str() const;

  std::strong_ordering operator<=>(version const &other) const;
  bool operator==(version const &other) const {
    return (*this <=> other) == std::strong_ordering::equal;
  }

 private:
  version() = default;

  std::int64_t epoch_{ 0 };
  std::vector<std::int64_t> release_;
  std::optional<std::pair<pre_phase, std::int64_t>> pre_;
  std::optional<std::int64_t> post_;
  std::optional<std::int64_t> dev_;
  std::string local_;
};

class specifier {
 public:
  enum class op { arbitrary, compatible, equal, not_equal, less_equal, greater_equal, less, greater };

  // Throws std::invalid_argument on malformed input.
  explicit specifier(std::string_view text);

  op get_op() const { return op_; }
  std::string const &raw_version() const { return raw_; }
  bool wildcard() const { return wildcard_; }

  // Specifier names a pre-release explicitly (e.g. ">=2.0b1").
  bool mentions_prerelease() const;

  bool contains(version const &v) const;

  std::string str() const;

 private:
  op op_{ op::equal };
  std::string raw_;
  bool wildcard_{ false };
  std::optional<version> version_;
};

class specifier_set {
 public:
  specifier_set() = default;

  // Comma separated; empty text admits every version. Throws std::invalid_argument.
  explicit specifier_set(std::string_view text);

  bool empty() const { return specs_.empty(); }
  std::vector<specifier> const &specifiers() const { return specs_; }

  // Pre-releases are admitted only when allow_prereleases is set or a member names one.
  bool contains(version const &v, bool allow_prereleases = false) const;

  void add(specifier_set const &other);

  std::string str() const;

 private:
  std::vector<specifier> specs_;
};

std::string_view op_string(specifier::op o);

}  // namespace blext::pep440
