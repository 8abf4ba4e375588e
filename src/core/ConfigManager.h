#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>

struct Config {
    std::string dataDir;
    bool enableDebug = false;

    struct Repair {
        bool enabled = true;
        std::string endpoint = "http://127.0.0.1:1234/v1/chat/completions";
        std::string apiKey;
        std::string model;
        int timeoutSecs = 10;
    } repair;

    struct Jobs {
        uint64_t defaultTimeoutSecs = 300;
        uint64_t retentionSecs = 86400;
        int pollIntervalMs = 200;
    } jobs;

    struct Symbols {
        bool fallbackOnEmpty = false;
        struct TreeSitterLanguage {
            std::string name;
            std::vector<std::string> extensions;
            std::string libraryPath;
            std::string symbol;
            std::map<std::string, std::string> nodeKinds;  // node type -> symbol kind label
        };
        std::vector<TreeSitterLanguage> treeSitterLanguages;
    } symbols;

    /** ~/.cortexast, or ./.cortexast when HOME is unset */
    static std::string defaultDataDir() {
        const char* home = std::getenv("HOME");
        std::filesystem::path base = (home && *home) ? std::filesystem::u8path(home) : std::filesystem::path(".");
        return (base / ".cortexast").u8string();
    }

    /** "~/x" -> "$HOME/x"; anything else unchanged */
    static std::string expandHome(const std::string& path) {
        const char* home = std::getenv("HOME");
        if (!home || !*home || path.empty() || path[0] != '~') return path;
        if (path.size() > 1 && path[1] != '/') return path;
        return std::string(home) + path.substr(1);
    }

    static Config defaults() {
        Config cfg;
        cfg.dataDir = defaultDataDir();
        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg = defaults();
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        try {
            cfg.dataDir = expandHome(j.value("data_dir", cfg.dataDir));
            cfg.enableDebug = j.value("enable_debug", false);

            if (j.contains("repair")) {
                const auto& r = j.at("repair");
                cfg.repair.enabled = r.value("enabled", cfg.repair.enabled);
                cfg.repair.endpoint = r.value("endpoint", cfg.repair.endpoint);
                cfg.repair.apiKey = r.value("api_key", "");
                cfg.repair.model = r.value("model", "");
                cfg.repair.timeoutSecs = r.value("timeout_secs", cfg.repair.timeoutSecs);
            }

            if (j.contains("jobs")) {
                const auto& jb = j.at("jobs");
                cfg.jobs.defaultTimeoutSecs = jb.value("default_timeout_secs", cfg.jobs.defaultTimeoutSecs);
                cfg.jobs.retentionSecs = jb.value("retention_secs", cfg.jobs.retentionSecs);
                cfg.jobs.pollIntervalMs = jb.value("poll_interval_ms", cfg.jobs.pollIntervalMs);
            }

            if (j.contains("symbols")) {
                const auto& s = j.at("symbols");
                cfg.symbols.fallbackOnEmpty = s.value("fallback_on_empty", false);
                if (s.contains("tree_sitter_languages")) {
                    for (const auto& item : s["tree_sitter_languages"]) {
                        Symbols::TreeSitterLanguage lang;
                        lang.name = item.value("name", "");
                        lang.extensions = item.value("extensions", std::vector<std::string>{});
                        lang.libraryPath = item.value("library_path", "");
                        lang.symbol = item.value("symbol", "");
                        lang.nodeKinds = item.value("node_kinds", std::map<std::string, std::string>{});
                        if (!lang.name.empty() && !lang.extensions.empty()) {
                            cfg.symbols.treeSitterLanguages.push_back(std::move(lang));
                        }
                    }
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config value: ") + e.what());
        }

        if (cfg.repair.timeoutSecs <= 0) {
            throw std::runtime_error("repair.timeout_secs must be positive");
        }
        if (cfg.jobs.pollIntervalMs <= 0) {
            throw std::runtime_error("jobs.poll_interval_ms must be positive");
        }
        return cfg;
    }
};
