#include <conform/fixture/discovery.h>
#include "test_support.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <system_error>

using namespace conform::fixture;
namespace fs = std::filesystem;

using conform::test::ScratchRoot;

TEST(DiscoveryTest, KindNamesAndExtensions) {
    EXPECT_STREQ(kind_name(FixtureKind::TreeConstruction), "tree-construction");
    EXPECT_STREQ(kind_name(FixtureKind::Tokenizer), "tokenizer");
    EXPECT_STREQ(kind_name(FixtureKind::Serializer), "serializer");
    EXPECT_EQ(kind_extension(FixtureKind::TreeConstruction), ".dat");
    EXPECT_EQ(kind_extension(FixtureKind::Serializer), ".test");
}

TEST(DiscoveryTest, FindsFilesRecursivelyAndSorted) {
    ScratchRoot root("discovery_sorted");
    auto b = root.touch("tree-construction/b.dat");
    auto a = root.touch("tree-construction/a.dat");
    auto nested = root.touch("tree-construction/scripted/c.dat");
    root.touch("tree-construction/README.md");
    root.touch("tree-construction/a.dat.orig");

    auto files = discover_tree_construction_files(root.path());
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0], a);
    EXPECT_EQ(files[1], b);
    EXPECT_EQ(files[2], nested);
}

TEST(DiscoveryTest, JsonSuitesUseTheirOwnDirectories) {
    ScratchRoot root("discovery_json");
    root.touch("tokenizer/test1.test");
    root.touch("tokenizer/test2.test");
    root.touch("serializer/core.test");
    root.touch("tree-construction/tests1.dat");

    EXPECT_EQ(discover_tokenizer_files(root.path()).size(), 2u);
    EXPECT_EQ(discover_serializer_files(root.path()).size(), 1u);
    EXPECT_EQ(discover_tree_construction_files(root.path()).size(), 1u);
}

TEST(DiscoveryTest, MissingSubdirectoryYieldsEmptyList) {
    ScratchRoot root("discovery_missing");
    EXPECT_TRUE(discover_serializer_files(root.path()).empty());
    EXPECT_TRUE(discover_tree_construction_files(root.path() / "nope").empty());
}

TEST(DiscoveryTest, RelativeToRoot) {
    EXPECT_EQ(relative_to_root("/t/tree-construction/a.dat", "/t"),
              fs::path("tree-construction/a.dat"));
    EXPECT_EQ(relative_to_root("/elsewhere/a.dat", "/t"), fs::path("/elsewhere/a.dat"));
}

TEST(DiscoveryTest, ReadFixtureFileReturnsBytes) {
    ScratchRoot root("discovery_read");
    auto file = root.touch("x.dat", std::string("a\r\nb\0c", 6));
    auto content = read_fixture_file(file);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, std::string("a\r\nb\0c", 6));

    std::string error;
    EXPECT_FALSE(read_fixture_file(root.path() / "absent.dat", &error).has_value());
    EXPECT_NE(error.find("absent.dat"), std::string::npos);
    EXPECT_NE(error.find(std::make_error_code(std::errc::no_such_file_or_directory).message()),
              std::string::npos);
}

TEST(DiscoveryTest, ReadFixtureFileRejectsDirectory) {
    ScratchRoot root("discovery_read_dir");
    fs::create_directories(root.path() / "tree-construction");

    std::string error;
    EXPECT_FALSE(read_fixture_file(root.path() / "tree-construction", &error).has_value());
    EXPECT_EQ(error.rfind("cannot open ", 0), 0u);
}
