#include <arxml/xml/query_helper.h>
#include <arxml/xml/utils.h>

namespace arxml {
namespace xml {

std::string qualify_path(const std::string& path, const std::string& prefix)
{
  if (prefix.empty())
    return path;

  auto segs = split_path_segments(path);
  std::string out;
  for (std::size_t i = 0; i < segs.size(); ++i)
  {
    std::string seg = segs[i];
    const std::string t = trim_copy(seg);
    if (!t.empty() && t.front() != '@' && t.front() != '*' && t.front() != '.')
    {
      const auto br = t.find('[');
      const std::string name = trim_copy(t.substr(0, br));
      if (!name.empty() && name.find(':') == std::string::npos && name.find('(') == std::string::npos)
        seg = prefix + ":" + name + (br == std::string::npos ? std::string() : t.substr(br));
    }
    if (i > 0)
      out.push_back('/');
    out += seg;
  }
  return out;
}

QueryHelper::QueryHelper(const NamespaceResolver& resolver, Logger logger)
  : namespaces_(resolver.namespaces())
  , qualify_prefix_(resolver.hasPrimaryNamespace() ? resolver.primaryPrefix() : std::string())
  , logger_(logger)
{
}

std::string QueryHelper::preparePath(const std::string& path) const
{
  return qualify_path(path, qualify_prefix_);
}

const PathExpr& QueryHelper::compiled(const std::string& path) const
{
  auto it = cache_.find(path);
  if (it == cache_.end())
    it = cache_.emplace(path, compile_path(preparePath(path))).first;
  return it->second;
}

QueryResult QueryHelper::tryFindElements(const tinyxml2::XMLNode* parent, const std::string& path) const
{
  try
  {
    return evaluate_path(parent, compiled(path), namespaces_);
  }
  catch (const QueryError& e)
  {
    return e;
  }
}

std::vector<const tinyxml2::XMLElement*> QueryHelper::findElements(const tinyxml2::XMLNode* parent,
                                                                   const std::string& path) const
{
  QueryResult r = tryFindElements(parent, path);
  if (const auto* err = std::get_if<QueryError>(&r))
  {
    logger_.debug(std::string("Path query failed: ") + err->what());
    return {};
  }
  return std::get<std::vector<const tinyxml2::XMLElement*>>(std::move(r));
}

const tinyxml2::XMLElement* QueryHelper::findElement(const tinyxml2::XMLNode* parent, const std::string& path) const
{
  auto hits = findElements(parent, path);
  return hits.empty() ? nullptr : hits.front();
}

std::string QueryHelper::getText(const tinyxml2::XMLNode* parent, const std::string& path,
                                 const std::string& fallback) const
{
  std::string text = element_text(findElement(parent, path));
  return text.empty() ? fallback : text;
}

std::string QueryHelper::getAttribute(const tinyxml2::XMLNode* parent, const std::string& path,
                                      const std::string& attr_name, const std::string& fallback) const
{
  const auto* e = findElement(parent, path);
  if (!e)
    return fallback;
  const char* v = e->Attribute(attr_name.c_str());
  return v ? std::string(v) : fallback;
}

}  // namespace xml
}  // namespace arxml
