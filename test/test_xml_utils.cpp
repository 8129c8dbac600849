#include <string>

#include <arxml/xml/utils.h>

#include <gtest/gtest.h>

using namespace arxml::xml;

TEST(XmlUtils, TrimAndLower)
{
  EXPECT_EQ(trim_copy("  a b \n\t"), "a b");
  EXPECT_EQ(trim_copy("   "), "");
  EXPECT_EQ(to_lower_copy("AUTOSAR.org"), "autosar.org");
}

TEST(XmlUtils, LastRefSegment)
{
  EXPECT_EQ(last_ref_segment("/Pkg/Comp/Port"), "Port");
  EXPECT_EQ(last_ref_segment("Port"), "Port");
  EXPECT_EQ(last_ref_segment(" /Pkg/Comp/ "), "Comp");
  EXPECT_EQ(last_ref_segment(""), "");
}

TEST(XmlUtils, NamesAndNamespaces)
{
  const char* text = R"(<ar:AUTOSAR xmlns:ar="urn:a" xmlns="urn:default">
      <ar:AR-PACKAGES><PLAIN><INNER xmlns="urn:inner"/></PLAIN></ar:AR-PACKAGES>
    </ar:AUTOSAR>)";
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse(text), tinyxml2::XML_SUCCESS);

  const auto* root = doc.RootElement();
  EXPECT_EQ(local_name(root), "AUTOSAR");
  EXPECT_EQ(name_prefix(root), "ar");
  EXPECT_EQ(namespace_uri(root), "urn:a");

  const auto* packages = root->FirstChildElement();
  EXPECT_EQ(namespace_uri(packages), "urn:a");

  const auto* plain = packages->FirstChildElement("PLAIN");
  EXPECT_EQ(name_prefix(plain), "");
  EXPECT_EQ(namespace_uri(plain), "urn:default");

  // the nearest declaration wins
  EXPECT_EQ(namespace_uri(plain->FirstChildElement("INNER")), "urn:inner");
}

TEST(XmlUtils, ElementText)
{
  tinyxml2::XMLDocument doc;
  ASSERT_EQ(doc.Parse("<A><B>  value \n</B><C/></A>"), tinyxml2::XML_SUCCESS);
  EXPECT_EQ(element_text(doc.RootElement()->FirstChildElement("B")), "value");
  EXPECT_EQ(element_text(doc.RootElement()->FirstChildElement("C")), "");
  EXPECT_EQ(element_text(nullptr), "");
}
