#include <gtest/gtest.h>
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path work_dir;

    void SetUp() override {
        init_localization();
        set_quiet_mode(true);
        // Reset to default
        set_cache_dir({});
        set_root_path("/");
        unsetenv("RTM_REGISTRY_URL");
        work_dir = fs::absolute("tmp_config_test");
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
        fs::create_directories(work_dir);
    }

    void TearDown() override {
        set_cache_dir({});
        set_root_path("/");
        unsetenv("RTM_REGISTRY_URL");
        set_quiet_mode(false);
        if (fs::exists(work_dir)) fs::remove_all(work_dir);
    }

    fs::path write_conf(const std::string& content) {
        fs::path p = work_dir / "rtm.conf";
        std::ofstream f(p);
        f << content;
        return p;
    }
};

TEST_F(ConfigTest, DefaultRoot) {
    EXPECT_EQ(ROOT_DIR, "/");
    EXPECT_EQ(CONFIG_DIR, fs::path(RTM_CONF_DIR));
    EXPECT_EQ(CACHE_DIR, fs::path(RTM_CACHE_DEFAULT_DIR));
    EXPECT_EQ(SETTINGS_CONF, fs::path(RTM_CONF_DIR) / "rtm.conf");
}

TEST_F(ConfigTest, CustomRoot) {
    std::string root = "/mnt/new_root";
    set_root_path(root);

    EXPECT_EQ(ROOT_DIR, fs::path(root));
    EXPECT_EQ(CONFIG_DIR, fs::path(root) / fs::path(RTM_CONF_DIR).relative_path());
    EXPECT_EQ(CACHE_DIR, fs::path(root) / fs::path(RTM_CACHE_DEFAULT_DIR).relative_path());
    EXPECT_EQ(REGISTRY_CONF, CONFIG_DIR / "registry.conf");
}

TEST_F(ConfigTest, ExplicitCacheDirSurvivesRootChange) {
    set_cache_dir(work_dir / "cache");
    set_root_path("/mnt/new_root");
    EXPECT_EQ(CACHE_DIR, work_dir / "cache");

    set_cache_dir({});
    EXPECT_EQ(CACHE_DIR, fs::path("/mnt/new_root") / fs::path(RTM_CACHE_DEFAULT_DIR).relative_path());
}

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    Settings s = load_settings(work_dir / "absent.conf");
    EXPECT_TRUE(s.registry_url.empty());
    EXPECT_EQ(s.max_attempts, 3);
    EXPECT_EQ(s.backoff_base, std::chrono::milliseconds(500));
    EXPECT_EQ(s.backoff_max, std::chrono::milliseconds(8000));
    EXPECT_EQ(s.connect_timeout_s, 15);
    EXPECT_EQ(s.low_speed_timeout_s, 30);
    EXPECT_EQ(s.transfer_timeout_s, 1800);
    EXPECT_FALSE(s.system_runtime.has_value());
    EXPECT_EQ(s.keep_versions, 3u);
}

TEST_F(ConfigTest, ParsesAllKeys) {
    auto path = write_conf(
        "# comment\n"
        "registry_url = https://example.org/index.txt\n"
        "max_attempts=5\n"
        "backoff_base_ms=100\n"
        "backoff_max_ms=2000\n"
        "connect_timeout_s=7\n"
        "low_speed_timeout_s=12\n"
        "transfer_timeout_s=600\n"
        "system_runtime=/opt/proton\n"
        "keep_versions=1\n");
    Settings s = load_settings(path);
    EXPECT_EQ(s.registry_url, "https://example.org/index.txt");
    EXPECT_EQ(s.max_attempts, 5);
    EXPECT_EQ(s.backoff_base, std::chrono::milliseconds(100));
    EXPECT_EQ(s.backoff_max, std::chrono::milliseconds(2000));
    EXPECT_EQ(s.connect_timeout_s, 7);
    EXPECT_EQ(s.low_speed_timeout_s, 12);
    EXPECT_EQ(s.transfer_timeout_s, 600);
    ASSERT_TRUE(s.system_runtime.has_value());
    EXPECT_EQ(*s.system_runtime, fs::path("/opt/proton"));
    EXPECT_EQ(s.keep_versions, 1u);
}

TEST_F(ConfigTest, BackoffMaxNeverBelowBase) {
    Settings s = load_settings(write_conf("backoff_base_ms=3000\nbackoff_max_ms=10\n"));
    EXPECT_EQ(s.backoff_max, std::chrono::milliseconds(3000));
}

TEST_F(ConfigTest, InvalidValuesAreConfigErrors) {
    for (const char* content : {"max_attempts=abc\n", "max_attempts=0\n", "keep_versions=-1\n", "no equals sign\n"}) {
        auto path = write_conf(content);
        try {
            load_settings(path);
            FAIL() << "expected Config error for: " << content;
        } catch (const RtmException& e) {
            EXPECT_EQ(e.kind(), ErrorKind::Config);
        }
    }
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    Settings s = load_settings(write_conf("colour=blue\nmax_attempts=2\n"));
    EXPECT_EQ(s.max_attempts, 2);
}

TEST_F(ConfigTest, EnvironmentOverridesRegistry) {
    set_root_path(work_dir.string());
    fs::create_directories(CONFIG_DIR);
    {
        std::ofstream f(SETTINGS_CONF);
        f << "registry_url=file:///from/conf\n";
    }
    EXPECT_EQ(load_settings().registry_url, "file:///from/conf");

    setenv("RTM_REGISTRY_URL", "file:///from/env", 1);
    EXPECT_EQ(load_settings().registry_url, "file:///from/env");
}

TEST_F(ConfigTest, RegistryUrlFallsBackToRegistryConf) {
    set_root_path(work_dir.string());
    Settings s;
    EXPECT_THROW(get_registry_url(s), RtmException);

    fs::create_directories(CONFIG_DIR);
    {
        std::ofstream f(REGISTRY_CONF);
        f << "  https://mirror.example.org/index.txt  \n";
    }
    EXPECT_EQ(get_registry_url(s), "https://mirror.example.org/index.txt");

    s.registry_url = "file:///explicit";
    EXPECT_EQ(get_registry_url(s), "file:///explicit");
}
