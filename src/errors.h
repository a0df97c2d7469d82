#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blext {

enum class error_kind {
  unrecognized_tag,
  reference_conflict,
  resolution_conflict,
  no_compatible_wheel,
  integrity,
  download,
  config,
  index,
};

std::string_view error_kind_name(error_kind kind);

class blext_error : public std::runtime_error {
 public:
  blext_error(error_kind kind, std::string const &message);

  error_kind kind() const { return kind_; }

 private:
  error_kind kind_;
};

// Malformed wheel filename or platform tag. The wheel is skipped with a warning.
class unrecognized_tag_error : public blext_error {
 public:
  explicit unrecognized_tag_error(std::string tag, std::string detail = {});

  std::string const &tag() const { return tag_; }

 private:
  std::string tag_;
};

// A project constraint excludes the version Blender itself bundles.
class reference_conflict_error : public blext_error {
 public:
  struct payload {
    std::string package;
    std::string pinned_version;
    std::string constraint;
    std::string requirer;
    std::string blender_version;
    std::string remedy;
  };

  explicit reference_conflict_error(payload p);

  payload const &details() const { return p_; }

 private:
  payload p_;
};

// One party to an unsatisfiable set of constraints. chain runs from the project root to
// the requirer (inclusive).
struct conflict_requirer {
  std::string requirer;
  std::string constraint;
  std::vector<std::string> chain;
};

class resolution_conflict_error : public blext_error {
 public:
  struct payload {
    std::string target;
    std::string package;
    std::vector<conflict_requirer> requirers;
    std::string common_ancestor;
    // Indices into requirers of a pair that alone admits no available version.
    std::optional<std::pair<std::size_t, std::size_t>> narrowest;
    std::vector<std::string> available_versions;
  };

  explicit resolution_conflict_error(payload p);

  payload const &details() const { return p_; }

 private:
  payload p_;
};

class no_compatible_wheel_error : public blext_error {
 public:
  struct payload {
    std::string package;
    std::string version;
    std::string target;
    std::vector<std::string> rejected;  // "filename: reason"
    // Set only when the configured minimum OS/libc version is the sole blocker.
    std::optional<std::string> min_version_hint;
    std::string min_version_label;  // "glibc" or "macOS"
    std::string min_version_setting;  // "min_glibc_version" or "min_macos_version"
  };

  explicit no_compatible_wheel_error(payload p);

  payload const &details() const { return p_; }

 private:
  payload p_;
};

class integrity_error : public blext_error {
 public:
  integrity_error(std::string filename, std::string expected, std::string actual);

  std::string const &filename() const { return filename_; }
  std::string const &expected() const { return expected_; }
  std::string const &actual() const { return actual_; }

 private:
  std::string filename_;
  std::string expected_;
  std::string actual_;
};

class download_error : public blext_error {
 public:
  download_error(std::string url, std::string reason, int attempts = 1);

  std::string const &url() const { return url_; }
  std::string const &reason() const { return reason_; }
  int attempts() const { return attempts_; }

 private:
  std::string url_;
  std::string reason_;
  int attempts_;
};

class config_error : public blext_error {
 public:
  explicit config_error(std::string const &message);
};

class index_error : public blext_error {
 public:
  explicit index_error(std::string const &message);
};

// Kind and message of a caught exception, collected per target instead of propagated.
struct error_record {
  std::string kind;  // error_kind_name, or "Error" for anything else
  std::string message;
};

error_record describe_exception(std::exception_ptr const &ep);

}  // namespace blext
