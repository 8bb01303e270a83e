#include <Config.hpp>
#include <algorithm>
#include <fstream>
#include <optional>
#include <nlohmann/json.hpp>

namespace NTaskList {

    namespace {

        ELogLevel ParseLevel(const std::string& value, const std::string& origin) {
            auto level = LogLevelFromString(value);
            if (!level) {
                throw TConfigError("Unknown log level '" + value + "' in " + origin);
            }
            return *level;
        }

        std::string StringKey(const nlohmann::json& j, const char* key, const std::filesystem::path& path) {
            const auto& v = j.at(key);
            if (!v.is_string()) {
                throw TConfigError(std::string("Config key '") + key + "' must be a string in " + path.string());
            }
            return v.get<std::string>();
        }

        std::optional<std::string> FlagValue(const std::vector<std::string>& args, const std::string& flag) {
            std::optional<std::string> value;
            for (size_t i = 0; i < args.size(); ++i) {
                if (args[i] != flag) {
                    continue;
                }
                if (i + 1 >= args.size()) {
                    throw TConfigError("Missing value for " + flag);
                }
                value = args[++i];
            }
            return value;
        }

    } // namespace

    void ApplyConfigFile(TConfig& cfg, const std::filesystem::path& path) {
        std::ifstream ifs(path);
        if (!ifs) {
            throw TConfigError("Cannot open config file: " + path.string());
        }
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::exception& ex) {
            throw TConfigError("Config file is not valid JSON: " + path.string() + " (" + ex.what() + ")");
        }
        if (!j.is_object()) {
            throw TConfigError("Config file must hold a JSON object: " + path.string());
        }

        if (j.contains("data_path")) {
            cfg.DataPath = StringKey(j, "data_path", path);
        }
        if (j.contains("log_file")) {
            cfg.LogFile = StringKey(j, "log_file", path);
        }
        if (j.contains("log_level")) {
            cfg.LogLevel = ParseLevel(StringKey(j, "log_level", path), path.string());
        }
    }

    TConfig LoadConfig(const std::vector<std::string>& args, const TEnvLookup& env) {
        static const std::vector<std::string> known = {"--config", "--data", "--log-file", "--log-level"};
        for (size_t i = 0; i < args.size(); ++i) {
            if (std::find(known.begin(), known.end(), args[i]) == known.end()) {
                throw TConfigError("Unknown argument: " + args[i]);
            }
            ++i;
        }

        TConfig cfg;

        auto configPath = FlagValue(args, "--config");
        if (!configPath) {
            if (const char* v = env("TASKLIST_CONFIG"); v && *v) {
                configPath = v;
            }
        }
        if (configPath) {
            ApplyConfigFile(cfg, *configPath);
        }

        if (const char* v = env("TASKLIST_DATA"); v && *v) {
            cfg.DataPath = v;
        }
        if (const char* v = env("TASKLIST_LOG_FILE"); v && *v) {
            cfg.LogFile = v;
        }
        if (const char* v = env("TASKLIST_LOG_LEVEL"); v && *v) {
            cfg.LogLevel = ParseLevel(v, "TASKLIST_LOG_LEVEL");
        }

        if (auto v = FlagValue(args, "--data")) {
            cfg.DataPath = *v;
        }
        if (auto v = FlagValue(args, "--log-file")) {
            cfg.LogFile = *v;
        }
        if (auto v = FlagValue(args, "--log-level")) {
            cfg.LogLevel = ParseLevel(*v, "--log-level");
        }

        if (cfg.DataPath.empty()) {
            throw TConfigError("Data path must not be empty");
        }
        return cfg;
    }

} // namespace NTaskList
