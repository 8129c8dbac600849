#ifndef ARXML_XML_PATH_QUERY_H_
#define ARXML_XML_PATH_QUERY_H_

#include <string>
#include <string_view>
#include <vector>
#include <tinyxml2.h>

#include <arxml/xml/namespace_resolver.h>

namespace arxml {
namespace xml {

// Name test of a step or of a predicate operand: "NAME", "p:NAME", "*", "p:*".
struct NameTest
{
  std::string prefix;  // empty: no namespace (or any namespace when wildcard)
  std::string local;   // "*" for wildcard
  bool any_namespace = false;  // plain "*"
};

// Left-hand side of a predicate.
struct Operand
{
  enum class Kind
  {
    LOCAL_NAME,  // local-name()
    TEXT,        // text()
    ATTRIBUTE,   // @name
    CHILD,       // NAME (text of the first matching child)
  };
  Kind kind = Kind::LOCAL_NAME;
  std::string attribute;
  NameTest child;
};

struct Predicate
{
  enum class Kind
  {
    POSITION,  // [3]
    LAST,      // [last()]
    EXISTS,    // [@id], [SHORT-NAME]
    COMPARE,   // [@id='x'], [contains(local-name(),'X')], ...
  };
  enum class Op
  {
    EQUALS,
    NOT_EQUALS,
    CONTAINS,
    STARTS_WITH,
  };
  Kind kind = Kind::EXISTS;
  int position = 0;  // 1-based
  Operand operand;
  Op op = Op::EQUALS;
  std::string value;
};

struct Step
{
  enum class Axis
  {
    CHILD,
    SELF,    // "."
    PARENT,  // ".."
  };
  Axis axis = Axis::CHILD;
  bool descendant = false;  // preceded by "//"
  NameTest test;
  std::vector<Predicate> preds;
};

struct PathExpr
{
  std::string source;
  bool absolute = false;
  std::vector<Step> steps;
};

/// Split on '/' outside brackets and quotes. Empty segments are kept ("a//b" -> a,"",b).
std::vector<std::string> split_path_segments(std::string_view path);

/// Parse an expression like "AR-PACKAGES/ar:AR-PACKAGE[SHORT-NAME='Demo']".
/// @throws QueryError on malformed or unsupported syntax
PathExpr compile_path(const std::string& path);

/// Evaluate `expr` from `context` (an element or a document), results in document order.
/// @throws QueryError when a prefix is not declared in `namespaces`
std::vector<const tinyxml2::XMLElement*> evaluate_path(const tinyxml2::XMLNode* context, const PathExpr& expr,
                                                       const NamespaceMap& namespaces);

}  // namespace xml
}  // namespace arxml

#endif  // ARXML_XML_PATH_QUERY_H_
