#include <Logger.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>

namespace NTaskList {

    const TLogCategory LogCore{"tasklist.core"};
    const TLogCategory LogStorage{"tasklist.storage"};
    const TLogCategory LogCli{"tasklist.cli"};

    namespace {

        std::mutex g_logMutex;
        std::unique_ptr<std::ofstream> g_logFile;
        ELogLevel g_minLevel = ELogLevel::Info;

        std::string Timestamp() {
            using namespace std::chrono;
            auto now = system_clock::now();
            auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
            std::time_t tt = system_clock::to_time_t(now);
            std::tm tm{};
            localtime_r(&tt, &tm);
            std::ostringstream os;
            os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
            return os.str();
        }

    } // namespace

    const char* ToString(ELogLevel level) {
        switch (level) {
        case ELogLevel::Debug: return "debug";
        case ELogLevel::Info: return "info";
        case ELogLevel::Warning: return "warning";
        case ELogLevel::Error: return "error";
        }
        return "unknown";
    }

    std::optional<ELogLevel> LogLevelFromString(const std::string& s) {
        if (s == "debug") {
            return ELogLevel::Debug;
        }
        if (s == "info") {
            return ELogLevel::Info;
        }
        if (s == "warning" || s == "warn") {
            return ELogLevel::Warning;
        }
        if (s == "error") {
            return ELogLevel::Error;
        }
        return std::nullopt;
    }

    void InitLogging(const std::string& filePath, ELogLevel minLevel) {
        bool fileFailed = false;
        bool fileOpened = false;
        {
            std::lock_guard lk(g_logMutex);
            g_minLevel = minLevel;
            g_logFile.reset();
            if (!filePath.empty()) {
                auto file = std::make_unique<std::ofstream>(filePath, std::ios::app);
                if (*file) {
                    g_logFile = std::move(file);
                    fileOpened = true;
                } else {
                    fileFailed = true;
                }
            }
        }

        if (fileFailed) {
            LogWarning(LogCore) << "Failed to open log file: " << filePath;
        }
        LogInfo(LogCore) << "Logging initialized "
                         << (fileOpened ? "-> " + filePath : std::string("(stderr only)"));
    }

    void ShutdownLogging() {
        std::lock_guard lk(g_logMutex);
        if (g_logFile) {
            g_logFile->flush();
        }
        g_logFile.reset();
    }

    bool IsLogEnabled(ELogLevel level) {
        std::lock_guard lk(g_logMutex);
        return level >= g_minLevel;
    }

    void WriteLog(ELogLevel level, const TLogCategory& category, const std::string& message) {
        std::string line = Timestamp() + " [" + ToString(level) + "] " + category.Name + ": " + message + '\n';

        std::lock_guard lk(g_logMutex);
        std::cerr << line;
        if (g_logFile && g_logFile->is_open()) {
            *g_logFile << line;
            g_logFile->flush();
        }
    }

} // namespace NTaskList
