#include "marker.h"

#include "pep440.h"
#include "requirement.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <variant>

namespace blext {

namespace {

constexpr std::string_view kVariables[]{
  "python_version",   "python_full_version",
  "os_name",          "sys_platform",
  "platform_release", "platform_system",
  "platform_version", "platform_machine",
  "platform_python_implementation",
  "implementation_name",
  "implementation_version",
  "extra",
};

constexpr std::string_view kComparisonOps[]{ "===", "~=", "==", "!=", "<=", ">=", "<", ">" };

struct operand {
  bool is_variable;
  std::string value;
};

struct comparison {
  operand lhs;
  std::string op;  // one of kComparisonOps, "in" or "not in"
  operand rhs;
};

struct boolean_op {
  bool is_and;
  std::vector<std::shared_ptr<marker::node const>> children;
};

}  // namespace

struct marker::node {
  std::variant<comparison, boolean_op> value;
};

namespace {

enum class token_kind { lparen, rparen, string, identifier, op, end };

struct token {
  token_kind kind;
  std::string text;
};

std::vector<token> tokenize(std::string_view text) {
  std::vector<token> tokens;
  std::size_t i{ 0 };
  while (i < text.size()) {
    char const c{ text[i] };
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
    } else if (c == '(') {
      tokens.push_back({ token_kind::lparen, "(" });
      ++i;
    } else if (c == ')') {
      tokens.push_back({ token_kind::rparen, ")" });
      ++i;
    } else if (c == '\'' || c == '"') {
      auto const close{ text.find(c, i + 1) };
      if (close == std::string_view::npos) {
        throw std::invalid_argument("unterminated string in marker: " + std::string{ text });
      }
      tokens.push_back({ token_kind::string, std::string{ text.substr(i + 1, close - i - 1) } });
      i = close + 1;
    } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
      auto j{ i };
      while (j < text.size() &&
             (std::isalnum(static_cast<unsigned char>(text[j])) || text[j] == '_' ||
              text[j] == '.')) {
        ++j;
      }
      tokens.push_back({ token_kind::identifier, std::string{ text.substr(i, j - i) } });
      i = j;
    } else {
      auto const it{ std::ranges::find_if(kComparisonOps, [&](std::string_view op) {
        return text.substr(i).starts_with(op);
      }) };
      if (it == std::end(kComparisonOps)) {
        throw std::invalid_argument("unexpected character '" + std::string(1, c) +
                                    "' in marker: " + std::string{ text });
      }
      tokens.push_back({ token_kind::op, std::string{ *it } });
      i += it->size();
    }
  }
  tokens.push_back({ token_kind::end, {} });
  return tokens;
}

class parser {
 public:
  parser(std::vector<token> tokens, std::string_view source)
      : tokens_{ std::move(tokens) }, source_{ source } {}

  std::shared_ptr<marker::node const> parse() {
    auto root{ parse_or() };
    if (peek().kind != token_kind::end) { fail("unexpected '" + peek().text + "'"); }
    return root;
  }

 private:
  token const &peek() const { return tokens_[pos_]; }
  token const &next() { return tokens_[pos_++]; }

  bool peek_keyword(std::string_view word) const {
    return peek().kind == token_kind::identifier && peek().text == word;
  }

  [[noreturn]] void fail(std::string const &why) const {
    throw std::invalid_argument("invalid marker '" + std::string{ source_ } + "': " + why);
  }

  std::shared_ptr<marker::node const> parse_or() {
    return parse_chain(false, [this] { return parse_and(); });
  }

  std::shared_ptr<marker::node const> parse_and() {
    return parse_chain(true, [this] { return parse_atom(); });
  }

  template <typename sub_parser>
  std::shared_ptr<marker::node const> parse_chain(bool is_and, sub_parser sub) {
    auto first{ sub() };
    std::string_view const keyword{ is_and ? "and" : "or" };
    if (!peek_keyword(keyword)) { return first; }

    boolean_op op{ .is_and = is_and, .children = { first } };
    while (peek_keyword(keyword)) {
      next();
      op.children.push_back(sub());
    }
    return std::make_shared<marker::node const>(marker::node{ std::move(op) });
  }

  std::shared_ptr<marker::node const> parse_atom() {
    if (peek().kind == token_kind::lparen) {
      next();
      auto inner{ parse_or() };
      if (next().kind != token_kind::rparen) { fail("expected ')'"); }
      return inner;
    }

    auto lhs{ parse_operand() };
    std::string op;
    if (peek().kind == token_kind::op) {
      op = next().text;
    } else if (peek_keyword("in")) {
      next();
      op = "in";
    } else if (peek_keyword("not")) {
      next();
      if (!peek_keyword("in")) { fail("expected 'in' after 'not'"); }
      next();
      op = "not in";
    } else {
      fail("expected comparison operator");
    }
    auto rhs{ parse_operand() };
    return std::make_shared<marker::node const>(
        marker::node{ comparison{ std::move(lhs), std::move(op), std::move(rhs) } });
  }

  operand parse_operand() {
    token const &t{ next() };
    if (t.kind == token_kind::string) { return { false, t.text }; }
    if (t.kind == token_kind::identifier) {
      if (std::ranges::find(kVariables, t.text) == std::end(kVariables)) {
        fail("unknown variable '" + t.text + "'");
      }
      return { true, t.text };
    }
    fail("expected variable or quoted string");
  }

  std::vector<token> tokens_;
  std::size_t pos_{ 0 };
  std::string_view source_;
};

std::string resolve(operand const &o, marker_environment const &env) {
  if (!o.is_variable) { return o.value; }
  auto const it{ env.find(o.value) };
  return it == env.end() ? std::string{} : it->second;
}

bool compare_strings(std::string const &lhs, std::string const &op, std::string const &rhs) {
  if (op == "==" || op == "===") { return lhs == rhs; }
  if (op == "!=") { return lhs != rhs; }
  if (op == "<") { return lhs < rhs; }
  if (op == "<=") { return lhs <= rhs; }
  if (op == ">") { return lhs > rhs; }
  if (op == ">=") { return lhs >= rhs; }
  return false;  // "~=" has no string meaning
}

bool evaluate_comparison(comparison const &c, marker_environment const &env) {
  auto lhs{ resolve(c.lhs, env) };
  auto rhs{ resolve(c.rhs, env) };

  bool const is_extra{ (c.lhs.is_variable && c.lhs.value == "extra") ||
                       (c.rhs.is_variable && c.rhs.value == "extra") };
  if (is_extra) {
    lhs = canonicalize_name(lhs);
    rhs = canonicalize_name(rhs);
  }

  if (c.op == "in") { return rhs.find(lhs) != std::string::npos; }
  if (c.op == "not in") { return rhs.find(lhs) == std::string::npos; }

  if (!is_extra) {
    auto const v{ pep440::version::parse(lhs) };
    if (v) {
      try {
        pep440::specifier const spec{ c.op + rhs };
        return spec.contains(*v);
      } catch (std::invalid_argument const &) {
        // rhs is not a version; compare as strings
      }
    }
  }

  return compare_strings(lhs, c.op, rhs);
}

bool evaluate_node(marker::node const &n, marker_environment const &env) {
  return std::visit(
      match{
          [&](comparison const &c) { return evaluate_comparison(c, env); },
          [&](boolean_op const &b) {
            if (b.is_and) {
              return std::ranges::all_of(b.children,
                                         [&](auto const &ch) { return evaluate_node(*ch, env); });
            }
            return std::ranges::any_of(b.children,
                                       [&](auto const &ch) { return evaluate_node(*ch, env); });
          },
      },
      n.value);
}

std::string operand_str(operand const &o) {
  return o.is_variable ? o.value : "\"" + o.value + "\"";
}

std::string node_str(marker::node const &n, bool nested) {
  return std::visit(
      match{
          [](comparison const &c) {
            return operand_str(c.lhs) + " " + c.op + " " + operand_str(c.rhs);
          },
          [&](boolean_op const &b) {
            std::vector<std::string> parts;
            for (auto const &ch : b.children) { parts.push_back(node_str(*ch, true)); }
            auto joined{ util_join(parts, b.is_and ? " and " : " or ") };
            return nested ? "(" + joined + ")" : joined;
          },
      },
      n.value);
}

void collect_variables(marker::node const &n, std::vector<std::string> &out) {
  std::visit(match{
                 [&](comparison const &c) {
                   for (auto const *o : { &c.lhs, &c.rhs }) {
                     if (o->is_variable && std::ranges::find(out, o->value) == out.end()) {
                       out.push_back(o->value);
                     }
                   }
                 },
                 [&](boolean_op const &b) {
                   for (auto const &ch : b.children) { collect_variables(*ch, out); }
                 },
             },
             n.value);
}

}  // namespace

marker::marker(std::shared_ptr<node const> root) : root_{ std::move(root) } {}

marker marker::parse(std::string_view text) {
  if (util_trim(text).empty()) { throw std::invalid_argument("empty marker"); }
  return marker{ parser{ tokenize(text), text }.parse() };
}

bool marker::evaluate(marker_environment const &env) const {
  return evaluate_node(*root_, env);
}

bool marker::evaluate_any(std::vector<marker_environment> const &envs) const {
  return std::ranges::any_of(envs, [this](auto const &env) { return evaluate(env); });
}

std::vector<std::string> marker::variables() const {
  std::vector<std::string> out;
  collect_variables(*root_, out);
  return out;
}

std::string marker::str() const { return node_str(*root_, false); }

}  // namespace blext
