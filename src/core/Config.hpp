#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace docfetch::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Manages engine and CLI settings with:
 * - Type-safe getters with defaults
 * - JSON persistence
 * - Environment overrides (DOCFETCH_*)
 */
class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file and merge it over the current values
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            return file.good();

        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Overlay values taken from the process environment.
     * DOCFETCH_LOG_LEVEL -> logging.level
     */
    void loadEnvironment() {
        if (const char* level = std::getenv("DOCFETCH_LOG_LEVEL"); level && *level) {
            set<std::string>("logging.level", level);
        }
    }

    /**
     * Set default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"downloads", {
                {"userAgents", json::array({
                    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
                    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
                    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36",
                    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:109.0) Gecko/20100101 Firefox/121.0",
                    "curl/8.0.1"
                })},
                {"maxBackoffSeconds", 120.0},
                {"jitterRatio", 0.1},
                {"connectTimeoutSeconds", 30.0},
                {"maxRedirects", 5},
                {"verifySSL", true},
                {"partSuffix", ".part"}
            }},
            {"validation", {
                {"minimumSize", 100},
                {"strictTrailer", true}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.jitterRatio")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Wrong type or malformed key: fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     * @return false if the key cannot address a value
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            return m_config.contains(ptr);
        } catch (const json::exception&) {
            return false;
        }
    }

    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (!m_config.contains(ptr)) {
                return;
            }

            json::json_pointer parent = ptr.parent_pointer();
            std::string leafKey = ptr.back();

            if (parent.empty()) {
                m_config.erase(leafKey);
            } else if (m_config.contains(parent)) {
                m_config.at(parent).erase(leafKey);
            }
        } catch (const json::exception&) {
            // Key doesn't exist or invalid path
        }
    }

    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    void merge(const json& other) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config.merge_patch(other);
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace docfetch::core
