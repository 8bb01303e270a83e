#pragma once
#include <optional>
#include <sstream>
#include <string>

namespace NTaskList {

    enum class ELogLevel {
        Debug,
        Info,
        Warning,
        Error
    };

    struct TLogCategory {
        const char* Name;
    };

    extern const TLogCategory LogCore;
    extern const TLogCategory LogStorage;
    extern const TLogCategory LogCli;

    // Messages go to stderr and, when filePath is set, are appended to that
    // file as well. Safe to call again to reconfigure.
    void InitLogging(const std::string& filePath = std::string(), ELogLevel minLevel = ELogLevel::Info);
    void ShutdownLogging();
    bool IsLogEnabled(ELogLevel level);
    void WriteLog(ELogLevel level, const TLogCategory& category, const std::string& message);

    const char* ToString(ELogLevel level);
    std::optional<ELogLevel> LogLevelFromString(const std::string& s);

    // Collects one line and emits it when destroyed.
    class TLogMessage {
    public:
        TLogMessage(ELogLevel level, const TLogCategory& category)
            : Level(level)
            , Category(category)
            , Enabled(IsLogEnabled(level)) {
        }

        TLogMessage(const TLogMessage&) = delete;
        TLogMessage& operator=(const TLogMessage&) = delete;

        ~TLogMessage() {
            if (Enabled) {
                WriteLog(Level, Category, Stream.str());
            }
        }

        template <typename T>
        TLogMessage& operator<<(const T& value) {
            if (Enabled) {
                Stream << value;
            }
            return *this;
        }

    private:
        ELogLevel Level;
        const TLogCategory& Category;
        bool Enabled;
        std::ostringstream Stream;
    };

    inline TLogMessage LogDebug(const TLogCategory& c) {
        return TLogMessage(ELogLevel::Debug, c);
    }

    inline TLogMessage LogInfo(const TLogCategory& c) {
        return TLogMessage(ELogLevel::Info, c);
    }

    inline TLogMessage LogWarning(const TLogCategory& c) {
        return TLogMessage(ELogLevel::Warning, c);
    }

    inline TLogMessage LogError(const TLogCategory& c) {
        return TLogMessage(ELogLevel::Error, c);
    }

} // namespace NTaskList
