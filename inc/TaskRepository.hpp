#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common.hpp"
#include "storage.hpp"

namespace NTaskList {

    struct ITaskRepository {
        virtual ~ITaskRepository() = default;
        virtual std::vector<TTask> List() = 0;
        virtual std::optional<TTask> Get(TaskId id) = 0;
        virtual TTask Create(const TTaskPatch& fields) = 0;
        virtual TTask Update(TaskId id, const TTaskPatch& fields) = 0;
        virtual bool Delete(TaskId id) = 0;
    };

    // Every call re-reads the whole set from storage; nothing is cached.
    // Create/Update/Delete hold Mutex_ across load -> mutate -> save so two
    // writers never work from the same stale snapshot.
    class TTaskRepository: public ITaskRepository {
    public:
        explicit TTaskRepository(std::shared_ptr<IStorage> storage);

        std::vector<TTask> List() override;
        std::optional<TTask> Get(TaskId id) override;
        TTask Create(const TTaskPatch& fields) override;
        TTask Update(TaskId id, const TTaskPatch& fields) override;
        bool Delete(TaskId id) override;

    private:
        static void ValidatePatch(const TTaskPatch& fields);
        static void ApplyPatch(TTask& task, const TTaskPatch& fields);
        static TaskId NextId(const std::vector<TTask>& tasks);

    private:
        std::shared_ptr<IStorage> Storage;
        std::mutex Mutex_;
    };

} // namespace NTaskList
