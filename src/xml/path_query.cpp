#include <arxml/xml/path_query.h>
#include <arxml/xml/utils.h>
#include <arxml/errors.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace arxml {
namespace xml {

namespace {

bool is_name_start(unsigned char c)
{
  return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool is_name_char(unsigned char c)
{
  return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
}

bool is_ncname(const std::string& s)
{
  if (s.empty() || !is_name_start(static_cast<unsigned char>(s.front())))
    return false;
  return std::all_of(s.begin(), s.end(), [](char c) { return is_name_char(static_cast<unsigned char>(c)); });
}

std::string strip_spaces(const std::string& s)
{
  std::string out;
  for (char c : s)
    if (!std::isspace(static_cast<unsigned char>(c)))
      out.push_back(c);
  return out;
}

void check_balanced(const std::string& path)
{
  int depth = 0;
  char quote = 0;
  for (char c : path)
  {
    if (quote)
    {
      if (c == quote)
        quote = 0;
      continue;
    }
    if (c == '\'' || c == '"')
      quote = c;
    else if (c == '[')
      ++depth;
    else if (c == ']' && --depth < 0)
      throw QueryError(path, "unbalanced ']'");
  }
  if (quote)
    throw QueryError(path, "unterminated string literal");
  if (depth != 0)
    throw QueryError(path, "unbalanced '['");
}

// Position of the first `c` outside quotes, npos if none.
std::size_t find_unquoted(const std::string& s, char c, std::size_t from = 0)
{
  char quote = 0;
  for (std::size_t i = from; i < s.size(); ++i)
  {
    if (quote)
    {
      if (s[i] == quote)
        quote = 0;
      continue;
    }
    if (s[i] == '\'' || s[i] == '"')
      quote = s[i];
    else if (s[i] == c)
      return i;
  }
  return std::string::npos;
}

NameTest parse_name_test(const std::string& path, const std::string& name)
{
  NameTest t;
  if (name == "*")
  {
    t.local = "*";
    t.any_namespace = true;
    return t;
  }

  std::string local = name;
  auto colon = name.find(':');
  if (colon != std::string::npos)
  {
    t.prefix = name.substr(0, colon);
    local = name.substr(colon + 1);
    if (!is_ncname(t.prefix))
      throw QueryError(path, "invalid namespace prefix in '" + name + "'");
  }
  if (local == "*" && !t.prefix.empty())
  {
    t.local = "*";
    return t;
  }
  if (!is_ncname(local))
    throw QueryError(path, "invalid name test '" + name + "'");
  t.local = local;
  return t;
}

std::string parse_literal(const std::string& path, const std::string& raw)
{
  std::string s = trim_copy(raw);
  if (s.size() < 2 || (s.front() != '\'' && s.front() != '"') || s.back() != s.front())
    throw QueryError(path, "expected a quoted string, got '" + s + "'");
  return s.substr(1, s.size() - 2);
}

Operand parse_operand(const std::string& path, const std::string& raw)
{
  Operand o;
  const std::string s = strip_spaces(raw);
  if (s == "local-name()")
  {
    o.kind = Operand::Kind::LOCAL_NAME;
  }
  else if (s == "text()")
  {
    o.kind = Operand::Kind::TEXT;
  }
  else if (!s.empty() && s.front() == '@')
  {
    o.kind = Operand::Kind::ATTRIBUTE;
    o.attribute = s.substr(1);
    if (o.attribute.empty() || o.attribute.find_first_of("()'\"[]=") != std::string::npos)
      throw QueryError(path, "invalid attribute name '" + s + "'");
  }
  else
  {
    o.kind = Operand::Kind::CHILD;
    o.child = parse_name_test(path, s);
  }
  return o;
}

Predicate parse_predicate(const std::string& path, const std::string& body)
{
  Predicate p;
  if (body.empty())
    throw QueryError(path, "empty predicate");

  if (std::all_of(body.begin(), body.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
  {
    if (body.size() > 9)
      throw QueryError(path, "position out of range: " + body);
    p.kind = Predicate::Kind::POSITION;
    p.position = std::stoi(body);
    if (p.position < 1)
      throw QueryError(path, "positions start at 1");
    return p;
  }

  if (strip_spaces(body) == "last()")
  {
    p.kind = Predicate::Kind::LAST;
    return p;
  }

  struct Fn
  {
    const char* name;
    Predicate::Op op;
  };
  static const Fn functions[] = { { "contains", Predicate::Op::CONTAINS },
                                  { "starts-with", Predicate::Op::STARTS_WITH } };
  for (const auto& fn : functions)
  {
    const std::string name = fn.name;
    if (body.compare(0, name.size(), name) != 0)
      continue;
    std::string rest = trim_copy(body.substr(name.size()));
    if (rest.empty() || rest.front() != '(')
      continue;
    if (rest.back() != ')')
      throw QueryError(path, "missing ')' in " + name + "()");
    const std::string args = rest.substr(1, rest.size() - 2);
    auto comma = find_unquoted(args, ',');
    if (comma == std::string::npos || find_unquoted(args, ',', comma + 1) != std::string::npos)
      throw QueryError(path, name + "() takes exactly two arguments");
    p.kind = Predicate::Kind::COMPARE;
    p.op = fn.op;
    p.operand = parse_operand(path, args.substr(0, comma));
    p.value = parse_literal(path, args.substr(comma + 1));
    return p;
  }

  auto eq = find_unquoted(body, '=');
  if (eq != std::string::npos)
  {
    std::size_t lhs_end = eq;
    p.op = Predicate::Op::EQUALS;
    if (eq > 0 && body[eq - 1] == '!')
    {
      p.op = Predicate::Op::NOT_EQUALS;
      lhs_end = eq - 1;
    }
    p.kind = Predicate::Kind::COMPARE;
    p.operand = parse_operand(path, body.substr(0, lhs_end));
    p.value = parse_literal(path, body.substr(eq + 1));
    return p;
  }

  if (body.find('(') != std::string::npos)
    throw QueryError(path, "unsupported predicate [" + body + "]");

  p.kind = Predicate::Kind::EXISTS;
  p.operand = parse_operand(path, body);
  return p;
}

Step parse_step(const std::string& path, const std::string& seg)
{
  Step st;
  const auto br = seg.find('[');
  const std::string name = trim_copy(seg.substr(0, br));

  if (name.empty())
    throw QueryError(path, "missing name test before '['");
  if (name == ".")
    st.axis = Step::Axis::SELF;
  else if (name == "..")
    st.axis = Step::Axis::PARENT;
  else if (name.front() == '@')
    throw QueryError(path, "attribute steps do not select elements");
  else
    st.test = parse_name_test(path, name);

  std::size_t i = br;
  while (i != std::string::npos && i < seg.size())
  {
    if (std::isspace(static_cast<unsigned char>(seg[i])))
    {
      ++i;
      continue;
    }
    if (seg[i] != '[')
      throw QueryError(path, "unexpected text after predicate in '" + seg + "'");

    // matching ']' honoring quotes and nesting
    int depth = 0;
    char quote = 0;
    std::size_t j = i;
    for (; j < seg.size(); ++j)
    {
      char c = seg[j];
      if (quote)
      {
        if (c == quote)
          quote = 0;
        continue;
      }
      if (c == '\'' || c == '"')
        quote = c;
      else if (c == '[')
        ++depth;
      else if (c == ']' && --depth == 0)
        break;
    }
    if (j >= seg.size())
      throw QueryError(path, "unbalanced '['");

    st.preds.push_back(parse_predicate(path, trim_copy(seg.substr(i + 1, j - i - 1))));
    i = j + 1;
  }

  if (st.axis != Step::Axis::CHILD && !st.preds.empty())
    throw QueryError(path, "predicates on '.' or '..' are not supported");
  return st;
}

class Evaluator
{
public:
  Evaluator(const PathExpr& expr, const NamespaceMap& namespaces) : expr_(expr), namespaces_(namespaces)
  {
    // Fail on undeclared prefixes whether or not anything would be visited.
    for (const auto& st : expr_.steps)
    {
      checkPrefix(st.test);
      for (const auto& p : st.preds)
        if (p.operand.kind == Operand::Kind::CHILD)
          checkPrefix(p.operand.child);
    }
  }

  std::vector<const tinyxml2::XMLElement*> run(const tinyxml2::XMLNode* context)
  {
    std::vector<const tinyxml2::XMLNode*> ctx;
    if (!context)
      return {};
    ctx.push_back(expr_.absolute ? context->GetDocument() : context);

    bool unordered = false;
    for (const auto& st : expr_.steps)
    {
      if (st.descendant)
        ctx = descendantsOrSelf(ctx);

      std::vector<const tinyxml2::XMLNode*> next;
      std::unordered_set<const tinyxml2::XMLNode*> seen;
      for (const auto* node : ctx)
      {
        std::vector<const tinyxml2::XMLNode*> cands;
        switch (st.axis)
        {
          case Step::Axis::SELF:
            cands.push_back(node);
            break;
          case Step::Axis::PARENT:
            if (node->Parent())
              cands.push_back(node->Parent());
            break;
          case Step::Axis::CHILD:
            for (const auto* c = node->FirstChildElement(); c; c = c->NextSiblingElement())
              if (matches(c, st.test))
                cands.push_back(c);
            applyPredicates(cands, st.preds);
            break;
        }
        for (const auto* c : cands)
          if (seen.insert(c).second)
            next.push_back(c);
      }

      unordered = unordered || st.descendant || st.axis == Step::Axis::PARENT;
      if (unordered && next.size() > 1)
        sortDocumentOrder(next);

      ctx.swap(next);
      if (ctx.empty())
        break;
    }

    std::vector<const tinyxml2::XMLElement*> out;
    out.reserve(ctx.size());
    for (const auto* n : ctx)
      if (const auto* e = n->ToElement())
        out.push_back(e);
    return out;
  }

private:
  void checkPrefix(const NameTest& t) const
  {
    if (!t.prefix.empty() && namespaces_.find(t.prefix) == namespaces_.end())
      throw QueryError(expr_.source, "undeclared namespace prefix '" + t.prefix + "'");
  }

  const std::string& uriOf(const tinyxml2::XMLElement* e)
  {
    auto it = uri_cache_.find(e);
    if (it == uri_cache_.end())
      it = uri_cache_.emplace(e, namespace_uri(e)).first;
    return it->second;
  }

  bool matches(const tinyxml2::XMLElement* e, const NameTest& t)
  {
    if (t.local != "*" && local_name(e) != t.local)
      return false;
    if (t.any_namespace)
      return true;
    if (t.prefix.empty())
      return uriOf(e).empty();
    return uriOf(e) == namespaces_.at(t.prefix);
  }

  bool compare(const std::string& v, const Predicate& p) const
  {
    switch (p.op)
    {
      case Predicate::Op::EQUALS:
        return v == p.value;
      case Predicate::Op::NOT_EQUALS:
        return v != p.value;
      case Predicate::Op::CONTAINS:
        return v.find(p.value) != std::string::npos;
      case Predicate::Op::STARTS_WITH:
        return v.compare(0, p.value.size(), p.value) == 0;
    }
    return false;
  }

  bool test(const tinyxml2::XMLNode* n, const Predicate& p)
  {
    const auto* e = n->ToElement();
    if (!e)
      return false;

    switch (p.operand.kind)
    {
      case Operand::Kind::LOCAL_NAME:
        return p.kind == Predicate::Kind::COMPARE && compare(std::string(local_name(e)), p);
      case Operand::Kind::TEXT:
        return p.kind == Predicate::Kind::COMPARE && compare(element_text(e), p);
      case Operand::Kind::ATTRIBUTE:
      {
        const char* v = e->Attribute(p.operand.attribute.c_str());
        if (!v)
          return false;
        return p.kind == Predicate::Kind::EXISTS || compare(v, p);
      }
      case Operand::Kind::CHILD:
        for (const auto* c = e->FirstChildElement(); c; c = c->NextSiblingElement())
        {
          if (!matches(c, p.operand.child))
            continue;
          if (p.kind == Predicate::Kind::EXISTS || compare(element_text(c), p))
            return true;
        }
        return false;
    }
    return false;
  }

  void applyPredicates(std::vector<const tinyxml2::XMLNode*>& cands, const std::vector<Predicate>& preds)
  {
    for (const auto& p : preds)
    {
      if (p.kind == Predicate::Kind::POSITION)
      {
        if (static_cast<std::size_t>(p.position) <= cands.size())
          cands = { cands[p.position - 1] };
        else
          cands.clear();
      }
      else if (p.kind == Predicate::Kind::LAST)
      {
        if (!cands.empty())
          cands = { cands.back() };
      }
      else
      {
        cands.erase(std::remove_if(cands.begin(), cands.end(), [&](const auto* n) { return !test(n, p); }),
                    cands.end());
      }
    }
  }

  static void collect(const tinyxml2::XMLNode* n, std::vector<const tinyxml2::XMLNode*>& out,
                      std::unordered_set<const tinyxml2::XMLNode*>& seen)
  {
    if (!seen.insert(n).second)
      return;
    out.push_back(n);
    for (const auto* c = n->FirstChildElement(); c; c = c->NextSiblingElement())
      collect(c, out, seen);
  }

  static std::vector<const tinyxml2::XMLNode*> descendantsOrSelf(const std::vector<const tinyxml2::XMLNode*>& ctx)
  {
    std::vector<const tinyxml2::XMLNode*> out;
    std::unordered_set<const tinyxml2::XMLNode*> seen;
    for (const auto* n : ctx)
      collect(n, out, seen);
    return out;
  }

  void sortDocumentOrder(std::vector<const tinyxml2::XMLNode*>& nodes)
  {
    if (order_.empty())
    {
      std::vector<const tinyxml2::XMLNode*> all;
      std::unordered_set<const tinyxml2::XMLNode*> seen;
      collect(nodes.front()->GetDocument(), all, seen);
      for (std::size_t i = 0; i < all.size(); ++i)
        order_[all[i]] = i;
    }
    std::stable_sort(nodes.begin(), nodes.end(),
                     [this](const auto* a, const auto* b) { return order_[a] < order_[b]; });
  }

  const PathExpr& expr_;
  const NamespaceMap& namespaces_;
  std::unordered_map<const tinyxml2::XMLElement*, std::string> uri_cache_;
  std::unordered_map<const tinyxml2::XMLNode*, std::size_t> order_;
};

}  // namespace

std::vector<std::string> split_path_segments(std::string_view path)
{
  std::vector<std::string> out;
  std::string cur;
  int bracket_depth = 0;
  char quote = 0;

  for (char c : path)
  {
    if (quote)
    {
      cur.push_back(c);
      if (c == quote)
        quote = 0;
      continue;
    }
    if (c == '\'' || c == '"')
    {
      quote = c;
      cur.push_back(c);
      continue;
    }
    if (c == '[')
    {
      ++bracket_depth;
      cur.push_back(c);
      continue;
    }
    if (c == ']')
    {
      if (bracket_depth > 0)
        --bracket_depth;
      cur.push_back(c);
      continue;
    }
    if (c == '/' && bracket_depth == 0)
    {
      out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  out.push_back(cur);
  return out;
}

PathExpr compile_path(const std::string& path)
{
  PathExpr expr;
  expr.source = path;

  const std::string p = trim_copy(path);
  if (p.empty())
    throw QueryError(path, "empty path");
  check_balanced(p);

  const auto segs = split_path_segments(p);
  std::size_t i = 0;
  if (segs.front().empty())
  {
    expr.absolute = true;
    i = 1;
  }

  bool descendant = false;
  for (; i < segs.size(); ++i)
  {
    const std::string seg = trim_copy(segs[i]);
    if (seg.empty())
    {
      if (descendant)
        throw QueryError(path, "empty step");
      descendant = true;
      continue;
    }
    Step st = parse_step(path, seg);
    st.descendant = descendant;
    descendant = false;
    expr.steps.push_back(std::move(st));
  }

  if (descendant || expr.steps.empty())
    throw QueryError(path, "path must end with a name test");
  return expr;
}

std::vector<const tinyxml2::XMLElement*> evaluate_path(const tinyxml2::XMLNode* context, const PathExpr& expr,
                                                       const NamespaceMap& namespaces)
{
  Evaluator eval(expr, namespaces);
  return eval.run(context);
}

}  // namespace xml
}  // namespace arxml
