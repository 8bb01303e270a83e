#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "Logger.hpp"
#include "errors.hpp"

namespace NTaskList {

    struct TConfigError: public TTaskListError {
        using TTaskListError::TTaskListError;
    };

    struct TConfig {
        std::filesystem::path DataPath = "data/tasks.json";
        std::string LogFile;
        ELogLevel LogLevel = ELogLevel::Info;
    };

    using TEnvLookup = std::function<const char*(const char*)>;

    // Layers, later wins: defaults, JSON config file (--config or
    // TASKLIST_CONFIG), TASKLIST_* environment, command-line flags.
    TConfig LoadConfig(const std::vector<std::string>& args, const TEnvLookup& env);

    // Applies keys data_path, log_file, log_level from a JSON file.
    void ApplyConfigFile(TConfig& cfg, const std::filesystem::path& path);

} // namespace NTaskList
