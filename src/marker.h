#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace blext {

// PEP 508 environment: variable name -> value. Missing variables evaluate as "".
using marker_environment = std::map<std::string, std::string, std::less<>>;

// A parsed PEP 508 environment marker expression.
class marker {
 public:
  // Throws std::invalid_argument on malformed input.
  static marker parse(std::string_view text);

  bool evaluate(marker_environment const &env) const;

  // True if any environment satisfies the marker.
  bool evaluate_any(std::vector<marker_environment> const &envs) const;

  // Variable names referenced anywhere in the expression.
  std::vector<std::string> variables() const;

  std::string str() const;

  struct node;

 private:
  explicit marker(std::shared_ptr<node const> root);

  std::shared_ptr<node const> root_;
};

}  // namespace blext
