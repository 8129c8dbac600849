#include <filesystem>
#include <fstream>
#include <string>

#include <arxml/xml/validator.h>

#include <gtest/gtest.h>

using namespace arxml::xml;
namespace fs = std::filesystem;

static std::string writeTempFile(const std::string& filename, const std::string& contents)
{
  fs::path dir = fs::temp_directory_path() / "arxml_validator_tests";
  fs::create_directories(dir);
  fs::path p = dir / filename;
  std::ofstream(p.string()) << contents;
  return p.string();
}

static const std::string kDemo = std::string(ARXML_TEST_FOLDER) + "/demo.arxml";

TEST(XmlValidator, DemoFile)
{
  EXPECT_TRUE(isValidXml(kDemo));
  EXPECT_TRUE(isAutosarXml(kDemo));

  XmlInfo info = getXmlInfo(kDemo);
  ASSERT_TRUE(info.valid) << info.error;
  EXPECT_TRUE(info.error.empty());
  EXPECT_EQ(info.root_element, "AUTOSAR");
  EXPECT_EQ(info.namespace_uri, "http://autosar.org/schema/r4.0");
  EXPECT_EQ(info.xml_version, "1.0");
  EXPECT_EQ(info.encoding, "UTF-8");
  EXPECT_EQ(info.namespaces.size(), 2u);
  EXPECT_EQ(info.namespaces.at("xsi"), "http://www.w3.org/2001/XMLSchema-instance");
  EXPECT_EQ(info.element_count, 79u);
}

TEST(XmlValidator, MissingFile)
{
  const std::string path = (fs::temp_directory_path() / "arxml_no_such_file.arxml").string();
  EXPECT_FALSE(isValidXml(path));
  EXPECT_FALSE(isAutosarXml(path));

  XmlInfo info = getXmlInfo(path);
  EXPECT_FALSE(info.valid);
  EXPECT_FALSE(info.error.empty());
  EXPECT_TRUE(info.root_element.empty());
}

TEST(XmlValidator, MalformedFile)
{
  const std::string path = writeTempFile("broken.arxml", "<AUTOSAR><AR-PACKAGES></AUTOSAR>");
  EXPECT_FALSE(isValidXml(path));
  EXPECT_FALSE(isAutosarXml(path));

  XmlInfo info = getXmlInfo(path);
  EXPECT_FALSE(info.valid);
  EXPECT_FALSE(info.error.empty());
}

TEST(XmlValidator, EmptyFile)
{
  const std::string path = writeTempFile("empty.arxml", "");
  EXPECT_FALSE(isValidXml(path));
  EXPECT_FALSE(getXmlInfo(path).valid);
}

TEST(XmlValidator, AutosarDetection)
{
  // root name alone
  EXPECT_TRUE(isAutosarXml(writeTempFile("plain.arxml", "<AUTOSAR/>")));
  EXPECT_TRUE(isAutosarXml(writeTempFile("msrsw.arxml", "<MSRSW/>")));

  // prefixed root
  EXPECT_TRUE(isAutosarXml(writeTempFile("prefixed.arxml", R"(<ar:AUTOSAR xmlns:ar="urn:x"/>)")));

  // namespace mentioning autosar, any case
  EXPECT_TRUE(isAutosarXml(writeTempFile("ns.xml", R"(<Project xmlns:a="http://AUTOSAR.org/schema"/>)")));

  EXPECT_FALSE(isAutosarXml(writeTempFile("other.xml", R"(<root xmlns="urn:something"><AUTOSAR/></root>)")));
}

TEST(XmlValidator, UndeclaredProlog)
{
  const std::string path = writeTempFile("noprolog.xml", "<AUTOSAR><A/><B><C/></B></AUTOSAR>");
  XmlInfo info = getXmlInfo(path);
  ASSERT_TRUE(info.valid);
  EXPECT_TRUE(info.xml_version.empty());
  EXPECT_TRUE(info.encoding.empty());
  EXPECT_TRUE(info.namespace_uri.empty());
  EXPECT_TRUE(info.namespaces.empty());
  EXPECT_EQ(info.element_count, 4u);
}

TEST(XmlValidator, SingleQuotedDeclaration)
{
  const std::string path = writeTempFile("quoted.xml", "<?xml version='1.1' encoding='ISO-8859-1'?>\n<AUTOSAR/>");
  XmlInfo info = getXmlInfo(path);
  ASSERT_TRUE(info.valid);
  EXPECT_EQ(info.xml_version, "1.1");
  EXPECT_EQ(info.encoding, "ISO-8859-1");
}
