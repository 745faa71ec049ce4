#include "../libming/include/group_discoverer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace ming;
using namespace ming::test;

class GroupDiscovererTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(GroupDiscovererTest, ClassifiesInputs) {
    const auto root = dir / "root";
    std::filesystem::create_directories(root);
    make_zip(dir / "a.zip", {{"x.png", png_bytes(1, 1)}});
    make_zip(dir / "B.ZIP", {{"x.png", png_bytes(1, 1)}});
    write_file(dir / "notes.txt", garbage_bytes());

    ASSERT_TRUE(classify_input(root).has_value());
    EXPECT_EQ(classify_input(root)->kind, InputKind::Directory);
    ASSERT_TRUE(classify_input(dir / "a.zip").has_value());
    EXPECT_EQ(classify_input(dir / "a.zip")->kind, InputKind::ZipFile);
    ASSERT_TRUE(classify_input(dir / "B.ZIP").has_value());
    EXPECT_EQ(classify_input(dir / "B.ZIP")->kind, InputKind::ZipFile);
    EXPECT_FALSE(classify_input(dir / "notes.txt").has_value());
    EXPECT_FALSE(classify_input(dir / "missing").has_value());
}

TEST_F(GroupDiscovererTest, ExtensionlessZipIsDetectedByContent) {
    make_zip(dir / "download", {{"x.png", png_bytes(1, 1)}});
    const auto item = classify_input(dir / "download");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->kind, InputKind::ZipFile);
}

TEST_F(GroupDiscovererTest, DirectoryRootAndNestedGroups) {
    const auto root = dir / "root";
    write_file(root / "a.png", png_bytes(2, 2));
    write_file(root / "sub" / "b.jpg", jpeg_bytes(2, 2));

    const DiscoveryResult r = GroupDiscoverer::discover_directory(root);
    EXPECT_TRUE(r.errors.empty());
    ASSERT_EQ(r.groups.size(), 2u);

    EXPECT_EQ(r.groups[0].key, "");
    EXPECT_EQ(r.groups[0].output_base_name, "root");
    EXPECT_EQ(r.groups[0].source, GroupSource::Directory);
    ASSERT_EQ(r.groups[0].images.size(), 1u);
    EXPECT_EQ(std::filesystem::path(r.groups[0].images[0]).filename(), "a.png");

    EXPECT_EQ(r.groups[1].key, "sub");
    EXPECT_EQ(r.groups[1].output_base_name, "sub");
    ASSERT_EQ(r.groups[1].images.size(), 1u);
    EXPECT_EQ(std::filesystem::path(r.groups[1].images[0]).filename(), "b.jpg");
    EXPECT_EQ(r.image_count(), 2u);
}

TEST_F(GroupDiscovererTest, NestedKeysAreFlattenedWithUnderscore) {
    const auto root = dir / "root";
    write_file(root / "a" / "b" / "p.png", png_bytes(1, 1));
    const DiscoveryResult r = GroupDiscoverer::discover_directory(root);
    ASSERT_EQ(r.groups.size(), 1u);
    EXPECT_EQ(r.groups[0].key, "a/b");
    EXPECT_EQ(r.groups[0].output_base_name, "a_b");
}

TEST_F(GroupDiscovererTest, ImagesSortedAndJunkIgnored) {
    const auto root = dir / "root";
    write_file(root / "c.png", png_bytes(1, 1));
    write_file(root / "A.png", png_bytes(1, 1));
    write_file(root / "b.GIF", gif_bytes());
    write_file(root / "._c.png", garbage_bytes());
    write_file(root / ".DS_Store", garbage_bytes());
    write_file(root / "desktop.ini", garbage_bytes());
    write_file(root / "readme.txt", garbage_bytes());
    std::filesystem::create_directories(root / "empty");
    write_file(root / "textonly" / "x.txt", garbage_bytes());

    const DiscoveryResult r = GroupDiscoverer::discover_directory(root);
    ASSERT_EQ(r.groups.size(), 1u);
    const auto& images = r.groups[0].images;
    ASSERT_EQ(images.size(), 3u);
    EXPECT_EQ(std::filesystem::path(images[0]).filename(), "A.png");
    EXPECT_EQ(std::filesystem::path(images[1]).filename(), "b.GIF");
    EXPECT_EQ(std::filesystem::path(images[2]).filename(), "c.png");
}

TEST_F(GroupDiscovererTest, GroupsOrderedByRelativePath) {
    const auto root = dir / "root";
    write_file(root / "z" / "1.png", png_bytes(1, 1));
    write_file(root / "a" / "1.png", png_bytes(1, 1));
    write_file(root / "m" / "n" / "1.png", png_bytes(1, 1));
    const DiscoveryResult r = GroupDiscoverer::discover_directory(root);
    ASSERT_EQ(r.groups.size(), 3u);
    EXPECT_EQ(r.groups[0].key, "a");
    EXPECT_EQ(r.groups[1].key, "m/n");
    EXPECT_EQ(r.groups[2].key, "z");
}

TEST_F(GroupDiscovererTest, ZipGroupsInFirstOccurrenceOrder) {
    const auto zip = dir / "photos.zip";
    make_zip(zip, {
        {"trip/z.jpg", jpeg_bytes(2, 2)},
        {"x.png", png_bytes(2, 2)},
        {"trip/y.png", png_bytes(2, 2)},
        {"__MACOSX/trip/._y.png", garbage_bytes()},
        {"trip/._hidden.png", garbage_bytes()},
        {"trip/notes.txt", garbage_bytes()},
    });

    const DiscoveryResult r = GroupDiscoverer::discover_zip(zip);
    EXPECT_TRUE(r.errors.empty());
    ASSERT_EQ(r.groups.size(), 2u);

    EXPECT_EQ(r.groups[0].key, "trip");
    EXPECT_EQ(r.groups[0].output_base_name, "photos_trip");
    EXPECT_EQ(r.groups[0].images, (std::vector<std::string>{"trip/y.png", "trip/z.jpg"}));
    EXPECT_EQ(r.groups[0].source, GroupSource::Zip);
    EXPECT_EQ(r.groups[0].origin, zip);

    EXPECT_EQ(r.groups[1].key, "");
    EXPECT_EQ(r.groups[1].output_base_name, "photos");
    EXPECT_EQ(r.groups[1].images, (std::vector<std::string>{"x.png"}));
}

TEST_F(GroupDiscovererTest, NestedZipKeyFlattened) {
    const auto zip = dir / "book.zip";
    make_zip(zip, {{"vol1/ch2/p.png", png_bytes(1, 1)}});
    const DiscoveryResult r = GroupDiscoverer::discover_zip(zip);
    ASSERT_EQ(r.groups.size(), 1u);
    EXPECT_EQ(r.groups[0].output_base_name, "book_vol1_ch2");
}

TEST_F(GroupDiscovererTest, ZipInsideDirectoryComesFirst) {
    const auto root = dir / "root";
    write_file(root / "a.png", png_bytes(1, 1));
    make_zip(root / "sub" / "inner.zip", {{"p.png", png_bytes(1, 1)}});

    const DiscoveryResult r = GroupDiscoverer::discover_directory(root);
    ASSERT_EQ(r.groups.size(), 2u);
    EXPECT_EQ(r.groups[0].source, GroupSource::Zip);
    EXPECT_EQ(r.groups[0].output_base_name, "inner");
    EXPECT_EQ(r.groups[0].origin, root / "sub" / "inner.zip");
    EXPECT_EQ(r.groups[1].source, GroupSource::Directory);
    EXPECT_EQ(r.groups[1].output_base_name, "root");
}

TEST_F(GroupDiscovererTest, UnreadableZipIsOneArchiveError) {
    const auto zip = dir / "broken.zip";
    write_file(zip, garbage_bytes());
    const DiscoveryResult r = GroupDiscoverer::discover_zip(zip);
    EXPECT_TRUE(r.groups.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::Archive);
    EXPECT_EQ(r.errors[0].path, zip.string());
}

TEST_F(GroupDiscovererTest, JunkEntryRules) {
    EXPECT_TRUE(GroupDiscoverer::is_junk_entry("__MACOSX/a.png"));
    EXPECT_TRUE(GroupDiscoverer::is_junk_entry("x/._a.png"));
    EXPECT_TRUE(GroupDiscoverer::is_junk_entry("._a.png"));
    EXPECT_FALSE(GroupDiscoverer::is_junk_entry("x/a.png"));
    EXPECT_EQ(GroupDiscoverer::zip_group_key("a/b/c.png"), "a/b");
    EXPECT_EQ(GroupDiscoverer::zip_group_key("c.png"), "");
}
