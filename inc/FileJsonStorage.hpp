#pragma once
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace NTaskList {

    // Keeps the task set as one JSON array file. Saves go through a
    // temporary sibling and a rename, so readers see either the old or the
    // new file. No locking here: callers serialize writers.
    class TFileJsonStorage: public IStorage {
    public:
        explicit TFileJsonStorage(std::filesystem::path path);

        std::vector<TTask> LoadTasks() override;
        void SaveTasks(const std::vector<TTask>& tasks) override;

        const std::filesystem::path& Path() const {
            return Path_;
        }

    private:
        std::filesystem::path Path_;

        void AtomicWrite(const std::filesystem::path& path, const nlohmann::json& j);
    };

} // namespace NTaskList
