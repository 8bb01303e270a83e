#include <FileJsonStorage.hpp>
#include <Logger.hpp>
#include <fstream>
#include <system_error>

namespace NTaskList {

    TFileJsonStorage::TFileJsonStorage(std::filesystem::path path)
        : Path_(std::move(path)) {
    }

    void TFileJsonStorage::AtomicWrite(const std::filesystem::path& path, const nlohmann::json& j) {
        std::error_code ec;
        auto tmp = path;
        tmp += ".tmp";

        auto discardTmp = [&]() {
            std::error_code rmEc;
            std::filesystem::remove(tmp, rmEc);
            if (rmEc) {
                LogWarning(LogStorage) << "Cannot remove temp file " << tmp.string() << ": " << rmEc.message();
            }
        };

        const std::string text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        {
            std::ofstream ofs(tmp, std::ios::trunc);
            if (!ofs) {
                LogError(LogStorage) << "Cannot open temp file for writing: " << tmp.string();
                throw TStoreWriteError("Cannot open temp file for writing", tmp.string());
            }
            ofs << text << '\n';
            ofs.flush();
            if (!ofs) {
                ofs.close();
                discardTmp();
                LogError(LogStorage) << "Write to temp file failed: " << tmp.string();
                throw TStoreWriteError("Write to temp file failed", tmp.string());
            }
            ofs.close();
            if (ofs.fail()) {
                discardTmp();
                throw TStoreWriteError("Closing temp file failed", tmp.string());
            }
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            discardTmp();
            LogError(LogStorage) << "Atomic rename failed for " << path.string() << ": " << ec.message();
            throw TStoreWriteError("Atomic rename failed (" + ec.message() + ")", path.string());
        }
    }

    void TFileJsonStorage::SaveTasks(const std::vector<TTask>& tasks) {
        if (!Path_.parent_path().empty()) {
            std::error_code ec;
            std::filesystem::create_directories(Path_.parent_path(), ec);
            if (ec) {
                LogError(LogStorage) << "Cannot create directory " << Path_.parent_path().string() << ": " << ec.message();
                throw TStoreWriteError("Cannot create directory (" + ec.message() + ")", Path_.parent_path().string());
            }
        }
        AtomicWrite(Path_, TasksToJson(tasks));
        LogDebug(LogStorage) << "Saved " << tasks.size() << " task(s) to " << Path_.string();
    }

    std::vector<TTask> TFileJsonStorage::LoadTasks() {
        std::error_code ec;
        bool present = std::filesystem::exists(Path_, ec);
        if (ec) {
            throw TCorruptStoreError("Cannot stat task store (" + ec.message() + ")", Path_.string());
        }
        if (!present) {
            return {};
        }

        std::ifstream ifs(Path_);
        if (!ifs) {
            LogError(LogStorage) << "Cannot open task store for reading: " << Path_.string();
            throw TCorruptStoreError("Cannot open task store for reading", Path_.string());
        }
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::exception& ex) {
            LogError(LogStorage) << "Task store is not valid JSON: " << Path_.string() << " (" << ex.what() << ")";
            throw TCorruptStoreError(std::string("Task store is not valid JSON (") + ex.what() + ")", Path_.string());
        }
        return DecodeTasks(j, Path_.string());
    }

} // namespace NTaskList
