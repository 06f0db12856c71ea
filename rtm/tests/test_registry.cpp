#include <gtest/gtest.h>
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/registry.hpp"
#include "../src/utils.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
const std::string DIGEST_A(64, 'a');
const std::string DIGEST_B = "B94D27B9934D3E08A52E52D7DA7DABFAC484EFE37A5380EE9088F7ACE2EFCDE9";
}

class RegistryTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        init_localization();
        set_quiet_mode(true);
        work_dir = fs::absolute("tmp_registry_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        set_quiet_mode(false);
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }

    fs::path write_index(const std::string& content) {
        fs::path p = work_dir / "index.txt";
        std::ofstream f(p);
        f << content;
        return p;
    }
};

TEST_F(RegistryTest, ParsesEntriesInOrder) {
    std::istringstream in(
        "# published runtimes\n"
        "\n"
        "ge-8.26|https://example.org/ge-8.26.tar.gz|" + DIGEST_A + "|1024\n"
        "ge-9.1|https://example.org/ge-9.1.tar.xz|" + DIGEST_B + "|\n"
        "ge-7.0|https://example.org/ge-7.0.tar.gz||2048\n");
    auto releases = IndexRegistry::parse_index(in);

    ASSERT_EQ(releases.size(), 3u);
    EXPECT_EQ(releases[0].id, "ge-8.26");
    EXPECT_EQ(releases[0].url, "https://example.org/ge-8.26.tar.gz");
    EXPECT_EQ(releases[0].integrity.sha256, DIGEST_A);
    ASSERT_TRUE(releases[0].integrity.size.has_value());
    EXPECT_EQ(*releases[0].integrity.size, 1024u);

    EXPECT_EQ(releases[1].id, "ge-9.1");
    EXPECT_FALSE(releases[1].integrity.sha256.empty());
    EXPECT_FALSE(releases[1].integrity.size.has_value());

    EXPECT_EQ(releases[2].id, "ge-7.0");
    EXPECT_TRUE(releases[2].integrity.sha256.empty());
    EXPECT_EQ(releases[2].integrity.size.value_or(0), 2048u);
}

TEST_F(RegistryTest, SkipsUnusableEntries) {
    std::istringstream in(
        "ge-8.26|https://example.org/a.tar.gz|" + DIGEST_A + "|1\n"
        "not enough fields\n"
        "../evil|https://example.org/b.tar.gz|" + DIGEST_A + "|1\n"
        "ge-9.0|https://example.org/c.tar.gz|deadbeef|1\n"
        "ge-9.1|https://example.org/d.tar.gz|" + DIGEST_A + "|lots\n"
        "ge-9.2|https://example.org/e.tar.gz||\n"
        "ge-8.26|https://example.org/dup.tar.gz|" + DIGEST_A + "|1\n");
    auto releases = IndexRegistry::parse_index(in);

    ASSERT_EQ(releases.size(), 1u);
    EXPECT_EQ(releases[0].id, "ge-8.26");
    EXPECT_EQ(releases[0].url, "https://example.org/a.tar.gz");
}

TEST_F(RegistryTest, LoadsLocalIndexAndFinds) {
    auto index = write_index("ge-8.26|file:///srv/ge-8.26.tar.gz|" + DIGEST_A + "|10\n");

    IndexRegistry by_path(index.string());
    EXPECT_EQ(by_path.list_versions().size(), 1u);

    IndexRegistry by_url("file://" + index.string());
    auto found = by_url.find("ge-8.26");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->url, "file:///srv/ge-8.26.tar.gz");
    EXPECT_FALSE(by_url.find("ge-9.1").has_value());
}

TEST_F(RegistryTest, RefreshRereadsIndex) {
    auto index = write_index("ge-8.26|file:///a|" + DIGEST_A + "|10\n");
    IndexRegistry registry(index.string());
    EXPECT_EQ(registry.list_versions().size(), 1u);

    write_index("ge-8.26|file:///a|" + DIGEST_A + "|10\nge-9.1|file:///b|" + DIGEST_A + "|10\n");
    EXPECT_EQ(registry.list_versions().size(), 1u);
    registry.refresh();
    EXPECT_EQ(registry.list_versions().size(), 2u);
}

TEST_F(RegistryTest, MissingIndexIsConfigError) {
    IndexRegistry registry((work_dir / "absent.txt").string());
    try {
        registry.list_versions();
        FAIL() << "expected RtmException";
    } catch (const RtmException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Config);
    }
}

TEST_F(RegistryTest, StaticRegistryFind) {
    ReleaseAsset a{"ge-8.26", "file:///a", {DIGEST_A, std::nullopt}};
    StaticRegistry registry({a});
    EXPECT_TRUE(registry.find("ge-8.26").has_value());
    EXPECT_FALSE(registry.find("ge-9.1").has_value());
    EXPECT_TRUE(StaticRegistry().list_versions().empty());
}
