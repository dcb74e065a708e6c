#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

#include <blueprint/uri_resolver.h>

namespace fs = std::filesystem;

namespace {

#ifdef _WIN32
constexpr char SEP = ';';
#else
constexpr char SEP = ':';
#endif

fs::path makeSchema(const fs::path& dir, const std::string& name)
{
  fs::create_directories(dir);
  fs::path p = dir / name;
  std::ofstream(p.string()) << "<xsd:schema xmlns:xsd=\"http://www.w3.org/2001/XMLSchema\"/>\n";
  return p;
}

}  // namespace

TEST(URIResolver, LocalFile_AbsolutePath_NoScheme)
{
  fs::path dir = fs::temp_directory_path() / "blueprint_schema_test_abs";
  fs::path schema = makeSchema(dir, "local.xsd");

  auto resolved = blueprint::resolve_schema_location(schema.string());
  EXPECT_EQ(fs::weakly_canonical(schema).string(), resolved.local_path);
  EXPECT_TRUE(resolved.source_root.empty());

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(URIResolver, LocalFile_FileScheme)
{
  fs::path dir = fs::temp_directory_path() / "blueprint_schema_test_file_scheme";
  fs::path schema = makeSchema(dir, "scheme.xsd");

  auto resolved = blueprint::resolve_schema_location("file://" + fs::absolute(schema).generic_string());
  EXPECT_EQ(fs::weakly_canonical(schema).string(), resolved.local_path);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(URIResolver, LocalFile_RelativePath_WithCurrentDir)
{
  fs::path dir = fs::temp_directory_path() / "blueprint_schema_test_rel";
  fs::path schema = makeSchema(dir, "relative.xsd");

  auto resolved = blueprint::resolve_schema_location("relative.xsd", /*current_dir=*/dir.string());
  EXPECT_EQ(fs::weakly_canonical(schema).string(), resolved.local_path);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(URIResolver, SchemeSearchesRootsInOrder)
{
  fs::path base = fs::temp_directory_path() / "blueprint_schema_test_roots";
  fs::path missing_root = base / "missing";
  fs::path first_root = base / "first";
  fs::path second_root = base / "second";
  makeSchema(first_root / "vendor", "a.xsd");
  fs::path b = makeSchema(second_root / "vendor", "b.xsd");
  makeSchema(second_root / "vendor", "a.xsd");

  const std::string roots = missing_root.string() + SEP + "https://schemas.example.org" + SEP + first_root.string() +
                            SEP + second_root.string();

  auto a = blueprint::resolve_schema_location("blueprint://vendor/a.xsd", "", roots.c_str());
  EXPECT_EQ(a.source_root, first_root.string());

  auto resolved_b = blueprint::resolve_schema_location("blueprint://vendor/b.xsd", "", roots.c_str());
  EXPECT_EQ(resolved_b.local_path, fs::weakly_canonical(b).string());
  EXPECT_EQ(resolved_b.source_root, second_root.string());

  // ".." cannot climb out of a root
  EXPECT_THROW(blueprint::resolve_schema_location("blueprint://../second/vendor/b.xsd", "", first_root.string().c_str()),
               std::runtime_error);

  std::error_code ec;
  fs::remove_all(base, ec);
}

TEST(URIResolver, Failures)
{
  EXPECT_THROW(blueprint::resolve_schema_location(""), std::runtime_error);
  EXPECT_THROW(blueprint::resolve_schema_location("https://schemas.example.org/a.xsd"), std::runtime_error);
  EXPECT_THROW(blueprint::resolve_schema_location("__no_such_schema__.xsd"), std::runtime_error);
  EXPECT_THROW(blueprint::resolve_schema_location("blueprint://a.xsd", "", ""), std::runtime_error);
  EXPECT_THROW(blueprint::resolve_schema_location("blueprint://nope/a.xsd", "", fs::temp_directory_path().string().c_str()),
               std::runtime_error);
}
