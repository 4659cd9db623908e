#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace Signet {

    /**
     * @brief Layered key=value configuration
     *
     * Files are read line by line; blank lines and lines starting with '#'
     * are skipped. Later layers override earlier ones unless
     * overrideExisting is false. Environment variables with the given
     * prefix can be applied last (SIGNET_OIDC_ISSUER -> oidc.issuer).
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        static Config& instance();

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        size_t applyEnvironment(const std::string& prefix, char** envp);
        void saveToFile(const std::string& path);
        void clear();

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        /**
         * @brief Check every present key against its validator
         * @return Names of keys whose values were rejected
         */
        std::vector<std::string> validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        Config() = default;
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
