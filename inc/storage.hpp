#pragma once
#include "common.hpp"
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace NTaskList {

    struct IStorage {
        virtual ~IStorage() = default;
        virtual std::vector<TTask> LoadTasks() = 0;
        virtual void SaveTasks(const std::vector<TTask>& tasks) = 0;
    };

    // Decodes a whole snapshot. Anything that is not an array of valid,
    // uniquely numbered tasks is reported as corruption of `source`.
    inline std::vector<TTask> DecodeTasks(const json& snapshot, const std::string& source) {
        if (!snapshot.is_array()) {
            throw TCorruptStoreError("Task store is not a JSON array", source);
        }
        std::vector<TTask> out;
        out.reserve(snapshot.size());
        std::unordered_set<TaskId> seen;
        for (auto const& jt : snapshot) {
            TTask t;
            try {
                FromJSON(jt, t);
            } catch (const std::exception& ex) {
                throw TCorruptStoreError(std::string("Invalid task entry (") + ex.what() + ")", source);
            }
            if (!seen.insert(t.Id).second) {
                throw TCorruptStoreError("Duplicate task id " + std::to_string(t.Id), source);
            }
            out.push_back(std::move(t));
        }
        return out;
    }

    class TMemoryStorage: public IStorage {
    public:
        TMemoryStorage() = default;

        std::vector<TTask> LoadTasks() override {
            std::scoped_lock lk(Mutex_);
            if (Snapshot.is_null()) {
                return {};
            }
            return DecodeTasks(Snapshot, "<memory>");
        }

        void SaveTasks(const std::vector<TTask>& tasks) override {
            json encoded = TasksToJson(tasks);
            std::scoped_lock lk(Mutex_);
            Snapshot = std::move(encoded);
            ++SaveCount;
        }

        // Test hooks.
        void SetRawSnapshot(json snapshot) {
            std::scoped_lock lk(Mutex_);
            Snapshot = std::move(snapshot);
        }

        json RawSnapshot() {
            std::scoped_lock lk(Mutex_);
            return Snapshot;
        }

        size_t Saves() {
            std::scoped_lock lk(Mutex_);
            return SaveCount;
        }

    private:
        json Snapshot; // null until the first save, like a missing file
        size_t SaveCount = 0;
        std::mutex Mutex_;
    };

} // namespace NTaskList
