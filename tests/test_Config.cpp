#include <gtest/gtest.h>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "core/ConfigManager.h"
#include "support/TestUtils.h"

using json = nlohmann::json;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    Config cfg = Config::defaults();
    EXPECT_FALSE(cfg.enableDebug);
    EXPECT_TRUE(cfg.repair.enabled);
    EXPECT_EQ(cfg.repair.endpoint, "http://127.0.0.1:1234/v1/chat/completions");
    EXPECT_EQ(cfg.repair.timeoutSecs, 10);
    EXPECT_EQ(cfg.jobs.defaultTimeoutSecs, 300u);
    EXPECT_EQ(cfg.jobs.retentionSecs, 86400u);
    EXPECT_EQ(cfg.jobs.pollIntervalMs, 200);
    EXPECT_TRUE(cfg.symbols.treeSitterLanguages.empty());
    EXPECT_EQ(cfg.dataDir, Config::defaultDataDir());
}

TEST(ConfigTest, NestedOverrides) {
    json j = {
        {"data_dir", "/var/lib/cortex"},
        {"enable_debug", true},
        {"repair", {{"enabled", false}, {"endpoint", "https://llm.local/v1/chat/completions"}, {"model", "m"}, {"timeout_secs", 3}}},
        {"jobs", {{"default_timeout_secs", 60}, {"retention_secs", 120}}},
        {"symbols", {{"tree_sitter_languages", {
            {{"name", "python"}, {"extensions", {".py"}}, {"library_path", "/opt/libtree-sitter-python.so"},
             {"symbol", "tree_sitter_python"}, {"node_kinds", {{"function_definition", "function"}}}},
            {{"name", "incomplete"}}}}}}};

    Config cfg = Config::fromJson(j);
    EXPECT_EQ(cfg.dataDir, "/var/lib/cortex");
    EXPECT_TRUE(cfg.enableDebug);
    EXPECT_FALSE(cfg.repair.enabled);
    EXPECT_EQ(cfg.repair.model, "m");
    EXPECT_EQ(cfg.repair.timeoutSecs, 3);
    EXPECT_EQ(cfg.jobs.defaultTimeoutSecs, 60u);
    EXPECT_EQ(cfg.jobs.retentionSecs, 120u);
    EXPECT_EQ(cfg.jobs.pollIntervalMs, 200);
    ASSERT_EQ(cfg.symbols.treeSitterLanguages.size(), 1u);
    EXPECT_EQ(cfg.symbols.treeSitterLanguages[0].symbol, "tree_sitter_python");
    EXPECT_EQ(cfg.symbols.treeSitterLanguages[0].nodeKinds.at("function_definition"), "function");
}

TEST(ConfigTest, RejectsBadValues) {
    EXPECT_THROW(Config::fromJson(json::array()), std::runtime_error);
    EXPECT_THROW(Config::fromJson({{"repair", {{"timeout_secs", 0}}}}), std::runtime_error);
    EXPECT_THROW(Config::fromJson({{"jobs", {{"poll_interval_ms", -5}}}}), std::runtime_error);
    EXPECT_THROW(Config::fromJson({{"enable_debug", "yes"}}), std::runtime_error);
}

TEST(ConfigTest, ExpandsHomePrefix) {
    const char* home = std::getenv("HOME");
    if (!home || !*home) GTEST_SKIP() << "HOME not set";
    EXPECT_EQ(Config::expandHome("~/.cortexast"), std::string(home) + "/.cortexast");
    EXPECT_EQ(Config::expandHome("~"), std::string(home));
    EXPECT_EQ(Config::expandHome("~other/x"), "~other/x");
    EXPECT_EQ(Config::expandHome("/abs/path"), "/abs/path");
}

TEST(ConfigTest, LoadFromFile) {
    fs::path dir = testutil::makeTempDir("config");
    fs::path good = dir / "config.json";
    testutil::writeAll(good, R"({"jobs": {"poll_interval_ms": 25}})");
    EXPECT_EQ(Config::load(good.string()).jobs.pollIntervalMs, 25);

    fs::path broken = dir / "broken.json";
    testutil::writeAll(broken, "{oops");
    EXPECT_THROW(Config::load(broken.string()), std::runtime_error);
    EXPECT_THROW(Config::load((dir / "missing.json").string()), std::runtime_error);

    std::error_code ec;
    fs::remove_all(dir, ec);
}
