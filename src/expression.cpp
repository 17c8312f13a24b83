#include "applogic/expression.hpp"

// Parser architecture:
//
//   Lexer        source text -> flat token vector (offsets preserved).
//   Parser       precedence climbing over the binary levels, recursive descent
//                for unary / postfix / primary. Template strings are re-entered
//                through parse_template_text(), which parses each embedded
//                expression with a nested Parser whose offsets are shifted to
//                the enclosing source.
//
// Both follow the same error discipline: the first error is recorded in
// `err`, every loop checks it, and the partially built tree is discarded.

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace applogic {

namespace {

enum class Tok { number, string, templ, ident, punct, end };

struct Token {
  Tok         kind{Tok::end};
  std::string text;
  double      number{0.0};
  std::size_t offset{0};
};

bool is_ident_start(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool is_ident_char(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

// True when the token can end an operand, so a following '.' is member access.
bool ends_operand(const Token& t) {
  if (t.kind == Tok::punct) return t.text == ")" || t.text == "]" || t.text == "}";
  return t.kind != Tok::end;
}

struct Lexer {
  std::string_view s;
  std::size_t base{0};
  std::size_t i{0};
  std::optional<ParseError> err;

  void fail(const std::string& msg, std::size_t at) {
    if (!err) err = ParseError{msg, base + at};
  }

  // Reads a quoted body starting after the opening quote. Escapes are
  // decoded; the closing quote is consumed.
  std::string read_quoted(char quote, std::size_t start) {
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == quote) return o;
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      if (n == 'n') o += '\n';
      else if (n == 't') o += '\t';
      else if (n == 'r') o += '\r';
      else o += n;
    }
    fail("unterminated string literal", start);
    return {};
  }

  std::vector<Token> run() {
    std::vector<Token> out;
    while (!err) {
      while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
      if (i >= s.size()) break;
      const std::size_t start = i;
      const char c = s[i];
      Token t;
      t.offset = base + start;

      const bool leading_dot = c == '.' && i + 1 < s.size() &&
                               std::isdigit(static_cast<unsigned char>(s[i + 1])) &&
                               (out.empty() || !ends_operand(out.back()));
      if (std::isdigit(static_cast<unsigned char>(c)) || leading_dot) {
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i + 1 < s.size() && s[i] == '.' && std::isdigit(static_cast<unsigned char>(s[i + 1]))) {
          ++i;
          while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
          std::size_t j = i + 1;
          if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;
          if (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
            i = j;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
          }
        }
        t.kind = Tok::number;
        t.text = std::string(s.substr(start, i - start));
        t.number = std::strtod(t.text.c_str(), nullptr);
        if (!std::isfinite(t.number)) {
          fail("numeric literal out of range: " + t.text, start);
          break;
        }
      } else if (c == '"' || c == '\'') {
        ++i;
        t.kind = Tok::string;
        t.text = read_quoted(c, start);
      } else if (c == '`') {
        ++i;
        t.kind = Tok::templ;
        t.text = read_quoted('`', start);
        // Offset of the template body, used to shift embedded-expression errors.
        t.number = static_cast<double>(base + start + 1);
      } else if (is_ident_start(c)) {
        while (i < s.size() && is_ident_char(s[i])) ++i;
        t.kind = Tok::ident;
        t.text = std::string(s.substr(start, i - start));
      } else {
        static const char* const kTwoChar[] = {"<=", ">=", "==", "!=", "&&", "||"};
        t.kind = Tok::punct;
        for (const char* op : kTwoChar) {
          if (s.compare(i, 2, op) == 0) {
            t.text = op;
            i += 2;
            break;
          }
        }
        if (t.text.empty()) {
          static const std::string kOneChar = "+-*/!<>()[]{}.,:";
          if (kOneChar.find(c) == std::string::npos) {
            fail(std::string("unexpected character '") + c + "'", start);
            break;
          }
          t.text = std::string(1, c);
          ++i;
        }
      }
      out.push_back(std::move(t));
    }
    Token end;
    end.kind = Tok::end;
    end.offset = base + s.size();
    out.push_back(std::move(end));
    return out;
  }
};

std::shared_ptr<Expr> make_node(ExprKind kind, std::size_t offset) {
  auto e = std::make_shared<Expr>();
  e->kind = kind;
  e->offset = offset;
  return e;
}

std::shared_ptr<Expr> make_literal(Value v, std::size_t offset) {
  auto e = make_node(ExprKind::literal, offset);
  e->literal = std::move(v);
  return e;
}

std::shared_ptr<Expr> parse_template_text(std::string_view text, std::size_t base,
                                          const ParseOptions& options,
                                          std::optional<ParseError>* error);

struct BinaryLevel {
  const char* op;
  BinaryOp    bop;
  int         prec;
};

// Lowest precedence first.
constexpr BinaryLevel kBinaryOps[] = {
  {"||", BinaryOp::logical_or, 1},
  {"&&", BinaryOp::logical_and, 2},
  {"==", BinaryOp::eq, 3},
  {"!=", BinaryOp::ne, 3},
  {"<", BinaryOp::lt, 4},
  {">", BinaryOp::gt, 4},
  {"<=", BinaryOp::le, 4},
  {">=", BinaryOp::ge, 4},
  {"+", BinaryOp::add, 5},
  {"-", BinaryOp::sub, 5},
  {"*", BinaryOp::mul, 6},
  {"/", BinaryOp::div, 6},
};

struct Parser {
  const std::vector<Token>& toks;
  const ParseOptions& options;
  std::size_t pos{0};
  std::optional<ParseError> err;
  int depth{0};

  // Guards the native stack against pathological nesting like "((((...".
  static constexpr int kMaxNesting = 200;

  const Token& peek() const { return toks[pos]; }
  bool at_punct(const char* p) const { return peek().kind == Tok::punct && peek().text == p; }
  bool eat_punct(const char* p) {
    if (!at_punct(p)) return false;
    ++pos;
    return true;
  }
  void fail(const std::string& msg) {
    if (!err) err = ParseError{msg, peek().offset};
  }
  void expect_punct(const char* p) {
    if (!eat_punct(p)) fail(std::string("expected '") + p + "'" + describe_found());
  }
  std::string describe_found() const {
    const Token& t = peek();
    if (t.kind == Tok::end) return " but reached end of expression";
    return " but found '" + t.text + "'";
  }

  const BinaryLevel* binary_at() const {
    if (peek().kind != Tok::punct) return nullptr;
    for (const auto& level : kBinaryOps) {
      if (peek().text == level.op) return &level;
    }
    return nullptr;
  }

  std::shared_ptr<Expr> parse_expr() { return parse_binary(1); }

  std::shared_ptr<Expr> parse_binary(int min_prec) {
    auto lhs = parse_unary();
    while (!err) {
      const BinaryLevel* level = binary_at();
      if (!level || level->prec < min_prec) break;
      const std::size_t at = peek().offset;
      ++pos;
      auto rhs = parse_binary(level->prec + 1);
      if (err) break;
      auto node = make_node(ExprKind::binary, at);
      node->binary_op = level->bop;
      node->operands.push_back(std::move(lhs));
      node->operands.push_back(std::move(rhs));
      lhs = std::move(node);
    }
    return lhs;
  }

  std::shared_ptr<Expr> parse_unary() {
    if (at_punct("!") || at_punct("-")) {
      const std::size_t at = peek().offset;
      const bool is_not = peek().text == "!";
      ++pos;
      if (++depth > kMaxNesting) { fail("expression nested too deeply"); return nullptr; }
      auto operand = parse_unary();
      --depth;
      if (err) return nullptr;
      auto node = make_node(ExprKind::unary, at);
      node->unary_op = is_not ? UnaryOp::logical_not : UnaryOp::negate;
      node->operands.push_back(std::move(operand));
      return node;
    }
    return parse_postfix();
  }

  std::shared_ptr<Expr> parse_postfix() {
    auto base = parse_primary();
    while (!err) {
      if (at_punct(".")) {
        const std::size_t at = peek().offset;
        ++pos;
        if (peek().kind != Tok::ident) { fail("expected field name after '.'" + describe_found()); break; }
        auto node = make_node(ExprKind::member, at);
        node->name = peek().text;
        ++pos;
        node->operands.push_back(std::move(base));
        base = std::move(node);
      } else if (at_punct("[")) {
        const std::size_t at = peek().offset;
        ++pos;
        auto index = parse_nested();
        if (err) break;
        expect_punct("]");
        if (err) break;
        auto node = make_node(ExprKind::index, at);
        node->operands.push_back(std::move(base));
        node->operands.push_back(std::move(index));
        base = std::move(node);
      } else if (at_punct("(")) {
        if (base->kind != ExprKind::identifier) { fail("only named functions can be called"); break; }
        ++pos;
        auto node = make_node(ExprKind::call, base->offset);
        node->name = base->name;
        if (!eat_punct(")")) {
          while (!err) {
            node->operands.push_back(parse_nested());
            if (err) break;
            if (eat_punct(")")) break;
            expect_punct(",");
            if (at_punct(")")) { ++pos; break; }
          }
        }
        if (err) break;
        base = std::move(node);
      } else {
        break;
      }
    }
    if (err) return nullptr;
    return base;
  }

  std::shared_ptr<Expr> parse_nested() {
    if (++depth > kMaxNesting) { fail("expression nested too deeply"); return nullptr; }
    auto e = parse_expr();
    --depth;
    return e;
  }

  std::shared_ptr<Expr> parse_primary() {
    const Token& t = peek();
    switch (t.kind) {
      case Tok::number:
        ++pos;
        return make_literal(Value{t.number}, t.offset);
      case Tok::string:
        ++pos;
        return make_literal(Value{t.text}, t.offset);
      case Tok::templ: {
        ++pos;
        std::optional<ParseError> sub;
        auto node = parse_template_text(t.text, static_cast<std::size_t>(t.number), options, &sub);
        if (sub) { err = sub; return nullptr; }
        return node;
      }
      case Tok::ident: {
        ++pos;
        if (t.text == "true") return make_literal(Value{true}, t.offset);
        if (t.text == "false") return make_literal(Value{false}, t.offset);
        if (t.text == "null") return make_literal(Value{nullptr}, t.offset);
        auto node = make_node(ExprKind::identifier, t.offset);
        node->name = t.text;
        return node;
      }
      case Tok::punct:
        if (t.text == "(") {
          ++pos;
          auto inner = parse_nested();
          if (err) return nullptr;
          expect_punct(")");
          if (err) return nullptr;
          return inner;
        }
        if (t.text == "[") return parse_list();
        if (t.text == "{") return parse_map();
        fail("unexpected '" + t.text + "'");
        return nullptr;
      case Tok::end:
        fail("unexpected end of expression");
        return nullptr;
    }
    fail("unexpected token");
    return nullptr;
  }

  std::shared_ptr<Expr> parse_list() {
    auto node = make_node(ExprKind::list, peek().offset);
    ++pos;
    if (eat_punct("]")) return node;
    while (!err) {
      node->operands.push_back(parse_nested());
      if (err) break;
      if (eat_punct("]")) break;
      expect_punct(",");
      if (eat_punct("]")) break;
    }
    if (err) return nullptr;
    return node;
  }

  std::shared_ptr<Expr> parse_map() {
    auto node = make_node(ExprKind::map, peek().offset);
    ++pos;
    if (eat_punct("}")) return node;
    while (!err) {
      const Token& k = peek();
      if (k.kind != Tok::ident && k.kind != Tok::string) { fail("expected map key" + describe_found()); break; }
      for (const auto& existing : node->keys) {
        if (existing == k.text) { fail("duplicate map key '" + k.text + "'"); break; }
      }
      if (err) break;
      node->keys.push_back(k.text);
      ++pos;
      expect_punct(":");
      if (err) break;
      node->operands.push_back(parse_nested());
      if (err) break;
      if (eat_punct("}")) break;
      expect_punct(",");
      if (eat_punct("}")) break;
    }
    if (err) return nullptr;
    return node;
  }
};

std::shared_ptr<Expr> parse_source(std::string_view source, std::size_t base,
                                   const ParseOptions& options,
                                   std::optional<ParseError>* error) {
  Lexer lx{source, base};
  auto toks = lx.run();
  if (lx.err) {
    *error = lx.err;
    return nullptr;
  }
  Parser p{toks, options};
  if (p.peek().kind == Tok::end) {
    *error = ParseError{"empty expression", base};
    return nullptr;
  }
  auto root = p.parse_expr();
  if (!p.err && p.peek().kind != Tok::end) p.fail("unexpected '" + p.peek().text + "' after expression");
  if (p.err) {
    *error = p.err;
    return nullptr;
  }
  return root;
}

// Finds the close delimiter that ends an embedded expression starting at
// `from`, skipping quoted strings and balanced brackets.
std::size_t find_close(std::string_view text, std::size_t from, const std::string& close) {
  int nest = 0;
  std::size_t i = from;
  while (i < text.size()) {
    if (nest == 0 && text.compare(i, close.size(), close) == 0) return i;
    const char c = text[i];
    if (c == '"' || c == '\'' || c == '`') {
      ++i;
      while (i < text.size() && text[i] != c) {
        if (text[i] == '\\') ++i;
        ++i;
      }
      ++i;
      continue;
    }
    if (c == '(' || c == '[' || c == '{') ++nest;
    else if ((c == ')' || c == ']' || c == '}') && nest > 0) --nest;
    ++i;
  }
  return std::string_view::npos;
}

std::shared_ptr<Expr> parse_template_text(std::string_view text, std::size_t base,
                                          const ParseOptions& options,
                                          std::optional<ParseError>* error) {
  auto node = make_node(ExprKind::interpolation, base);
  const std::string& open = options.interpolation_open;
  const std::string& close = options.interpolation_close;

  std::string pending;
  std::size_t pending_at = base;
  std::size_t i = 0;
  auto flush = [&]() {
    if (!pending.empty()) node->operands.push_back(make_literal(Value{pending}, pending_at));
    pending.clear();
  };

  while (i < text.size()) {
    if (!open.empty() && text.compare(i, open.size(), open) == 0) {
      const std::size_t expr_start = i + open.size();
      const std::size_t expr_end = find_close(text, expr_start, close);
      if (expr_end == std::string_view::npos) {
        *error = ParseError{"unterminated interpolation, expected '" + close + "'", base + i};
        return nullptr;
      }
      flush();
      auto inner = parse_source(text.substr(expr_start, expr_end - expr_start), base + expr_start,
                                options, error);
      if (!inner) return nullptr;
      node->operands.push_back(std::move(inner));
      i = expr_end + close.size();
      pending_at = base + i;
      continue;
    }
    if (pending.empty()) pending_at = base + i;
    pending += text[i];
    ++i;
  }
  flush();
  return node;
}

void visit_references(const Expr& e, std::vector<Reference>& out);

void visit_children(const Expr& e, std::vector<Reference>& out) {
  for (const auto& child : e.operands) {
    if (child) visit_references(*child, out);
  }
}

void visit_references(const Expr& e, std::vector<Reference>& out) {
  switch (e.kind) {
    case ExprKind::identifier:
      out.push_back(Reference{e.name, std::nullopt, false, e.offset});
      return;
    case ExprKind::member: {
      const Expr& obj = *e.operands[0];
      if (obj.kind == ExprKind::identifier) {
        out.push_back(Reference{obj.name, e.name, false, obj.offset});
        return;
      }
      if (obj.kind == ExprKind::index && obj.operands[0]->kind == ExprKind::identifier) {
        out.push_back(Reference{obj.operands[0]->name, e.name, true, obj.operands[0]->offset});
        visit_references(*obj.operands[1], out);
        return;
      }
      visit_children(e, out);
      return;
    }
    case ExprKind::index: {
      const Expr& obj = *e.operands[0];
      if (obj.kind == ExprKind::identifier) {
        out.push_back(Reference{obj.name, std::nullopt, true, obj.offset});
        visit_references(*e.operands[1], out);
        return;
      }
      visit_children(e, out);
      return;
    }
    default:
      visit_children(e, out);
      return;
  }
}

void visit_calls(const Expr& e, std::vector<std::string>& out) {
  if (e.kind == ExprKind::call) out.push_back(e.name);
  for (const auto& child : e.operands) {
    if (child) visit_calls(*child, out);
  }
}

}  // namespace

std::string to_string(UnaryOp op) {
  switch (op) {
    case UnaryOp::logical_not: return "!";
    case UnaryOp::negate:      return "-";
  }
  return "?";
}

std::string to_string(BinaryOp op) {
  switch (op) {
    case BinaryOp::mul:         return "*";
    case BinaryOp::div:         return "/";
    case BinaryOp::add:         return "+";
    case BinaryOp::sub:         return "-";
    case BinaryOp::lt:          return "<";
    case BinaryOp::gt:          return ">";
    case BinaryOp::le:          return "<=";
    case BinaryOp::ge:          return ">=";
    case BinaryOp::eq:          return "==";
    case BinaryOp::ne:          return "!=";
    case BinaryOp::logical_and: return "&&";
    case BinaryOp::logical_or:  return "||";
  }
  return "?";
}

ExprPtr parse_expression(std::string_view source, const ParseOptions& options,
                         std::optional<ParseError>* error) {
  std::optional<ParseError> err;
  auto root = parse_source(source, 0, options, &err);
  if (error) *error = err;
  if (err) return nullptr;
  return ExprPtr(std::move(root));
}

ExprPtr parse_template(std::string_view text, const ParseOptions& options,
                       std::optional<ParseError>* error) {
  std::optional<ParseError> err;
  if (options.interpolation_open.empty() || options.interpolation_close.empty()) {
    err = ParseError{"interpolation delimiters must not be empty", 0};
  }
  std::shared_ptr<Expr> root;
  if (!err) root = parse_template_text(text, 0, options, &err);
  if (error) *error = err;
  if (err) return nullptr;
  return ExprPtr(std::move(root));
}

std::vector<Reference> collect_references(const Expr& expr) {
  std::vector<Reference> out;
  visit_references(expr, out);
  return out;
}

std::vector<std::string> collect_calls(const Expr& expr) {
  std::vector<std::string> out;
  visit_calls(expr, out);
  return out;
}

bool decompose_chain(const Expr& expr, std::string* root, std::vector<ChainStep>* steps) {
  std::vector<ChainStep> reversed;
  const Expr* cur = &expr;
  while (cur->kind == ExprKind::member || cur->kind == ExprKind::index) {
    ChainStep step;
    if (cur->kind == ExprKind::member) step.key = cur->name;
    else step.index = cur->operands[1].get();
    reversed.push_back(std::move(step));
    cur = cur->operands[0].get();
  }
  if (cur->kind != ExprKind::identifier) return false;
  *root = cur->name;
  steps->assign(reversed.rbegin(), reversed.rend());
  return true;
}

}  // namespace applogic
