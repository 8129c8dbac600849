#include <string>

#include <arxml/xml/namespace_resolver.h>

#include <gtest/gtest.h>

using namespace arxml::xml;

namespace {

const tinyxml2::XMLElement* parseRoot(tinyxml2::XMLDocument& doc, const char* text)
{
  EXPECT_EQ(doc.Parse(text), tinyxml2::XML_SUCCESS);
  return doc.RootElement();
}

}  // namespace

TEST(NamespaceResolver, DefaultNamespaceGetsSyntheticPrefix)
{
  tinyxml2::XMLDocument doc;
  const auto* root = parseRoot(doc, R"(<AUTOSAR xmlns="http://autosar.org/schema/r4.0"
      xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance"/>)");

  NamespaceResolver resolver;
  resolver.extractNamespaces(root);

  const auto& ns = resolver.namespaces();
  ASSERT_EQ(ns.size(), 3u);
  EXPECT_EQ(ns.at(""), "http://autosar.org/schema/r4.0");
  EXPECT_EQ(ns.at("ar"), "http://autosar.org/schema/r4.0");
  EXPECT_EQ(ns.at("xsi"), "http://www.w3.org/2001/XMLSchema-instance");

  EXPECT_EQ(resolver.defaultNamespace(), "http://autosar.org/schema/r4.0");
  EXPECT_TRUE(resolver.hasPrimaryNamespace());
  EXPECT_EQ(resolver.primaryPrefix(), "ar");
}

TEST(NamespaceResolver, NoDeclarations)
{
  tinyxml2::XMLDocument doc;
  const auto* root = parseRoot(doc, "<AUTOSAR><AR-PACKAGES/></AUTOSAR>");

  NamespaceResolver resolver;
  resolver.extractNamespaces(root);

  EXPECT_TRUE(resolver.namespaces().empty());
  EXPECT_FALSE(resolver.hasPrimaryNamespace());
  EXPECT_TRUE(resolver.defaultNamespace().empty());
  EXPECT_FALSE(resolver.uriForPrefix("ar").has_value());
}

TEST(NamespaceResolver, NullRoot)
{
  NamespaceResolver resolver;
  resolver.extractNamespaces(nullptr);
  EXPECT_TRUE(resolver.namespaces().empty());
}

TEST(NamespaceResolver, PrefixedRootBecomesPrimary)
{
  tinyxml2::XMLDocument doc;
  const auto* root = parseRoot(doc, R"(<as:AUTOSAR xmlns:as="http://autosar.org/schema/r4.0"/>)");

  NamespaceResolver resolver;
  resolver.extractNamespaces(root);

  EXPECT_TRUE(resolver.defaultNamespace().empty());
  EXPECT_EQ(resolver.primaryNamespace(), "http://autosar.org/schema/r4.0");
  EXPECT_EQ(resolver.primaryPrefix(), "ar");
  EXPECT_EQ(resolver.uriForPrefix("as"), std::optional<std::string>("http://autosar.org/schema/r4.0"));
  EXPECT_EQ(resolver.uriForPrefix("ar"), std::optional<std::string>("http://autosar.org/schema/r4.0"));
}

TEST(NamespaceResolver, PrefixAlreadyBoundToSameUri)
{
  tinyxml2::XMLDocument doc;
  const auto* root = parseRoot(doc, R"(<ar:AUTOSAR xmlns:ar="urn:autosar"/>)");

  NamespaceResolver resolver;
  resolver.extractNamespaces(root);

  EXPECT_EQ(resolver.namespaces().size(), 1u);
  EXPECT_EQ(resolver.primaryPrefix(), "ar");
}

TEST(NamespaceResolver, SyntheticPrefixConflict)
{
  tinyxml2::XMLDocument doc;
  const auto* root = parseRoot(doc, R"(<AUTOSAR xmlns="urn:autosar" xmlns:ar="urn:other" xmlns:ar0="urn:third"/>)");

  NamespaceResolver resolver;
  resolver.extractNamespaces(root);

  // the declared bindings are left alone
  EXPECT_EQ(resolver.namespaces().at("ar"), "urn:other");
  EXPECT_EQ(resolver.namespaces().at("ar0"), "urn:third");
  EXPECT_EQ(resolver.primaryPrefix(), "ar1");
  EXPECT_EQ(resolver.namespaces().at("ar1"), "urn:autosar");
}

TEST(NamespaceResolver, CustomSyntheticPrefix)
{
  tinyxml2::XMLDocument doc;
  const auto* root = parseRoot(doc, R"(<AUTOSAR xmlns="urn:autosar"/>)");

  NamespaceResolver resolver("autosar");
  resolver.extractNamespaces(root);
  EXPECT_EQ(resolver.primaryPrefix(), "autosar");
  EXPECT_FALSE(resolver.uriForPrefix("ar").has_value());
}

TEST(NamespaceResolver, ReuseClearsPreviousDocument)
{
  tinyxml2::XMLDocument a, b;
  const auto* root_a = parseRoot(a, R"(<AUTOSAR xmlns="urn:a" xmlns:x="urn:x"/>)");
  const auto* root_b = parseRoot(b, "<AUTOSAR/>");

  NamespaceResolver resolver;
  resolver.extractNamespaces(root_a);
  ASSERT_TRUE(resolver.hasPrimaryNamespace());

  resolver.extractNamespaces(root_b);
  EXPECT_FALSE(resolver.hasPrimaryNamespace());
  EXPECT_TRUE(resolver.namespaces().empty());
}

TEST(NamespaceResolver, DeclaredNamespacesOnly)
{
  tinyxml2::XMLDocument doc;
  const auto* root = parseRoot(doc, R"(<A xmlns="urn:a" xmlns:b="urn:b" xmlnsfoo="nope" id="1"><C xmlns:c="urn:c"/></A>)");

  auto ns = declared_namespaces(root);
  EXPECT_EQ(ns.size(), 2u);
  EXPECT_EQ(ns.count("c"), 0u);
}
