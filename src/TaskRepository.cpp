#include <TaskRepository.hpp>
#include <Logger.hpp>
#include <algorithm>
#include <limits>

namespace NTaskList {

    TTaskRepository::TTaskRepository(std::shared_ptr<IStorage> storage)
        : Storage(std::move(storage)) {
        if (!Storage) {
            throw std::invalid_argument("TTaskRepository requires a storage");
        }
    }

    void TTaskRepository::ValidatePatch(const TTaskPatch& fields) {
        if (fields.Title && Trim(*fields.Title).empty()) {
            throw TValidationError("Task title must not be empty");
        }
        if (fields.Category && Trim(*fields.Category).empty()) {
            throw TValidationError("Task category must not be empty");
        }
        if (!fields.Extra.is_object()) {
            throw TValidationError("Extension fields must be a JSON object");
        }
        for (auto it = fields.Extra.begin(); it != fields.Extra.end(); ++it) {
            if (IsReservedKey(it.key())) {
                throw TValidationError("Extension field collides with core field: " + it.key());
            }
        }
    }

    void TTaskRepository::ApplyPatch(TTask& task, const TTaskPatch& fields) {
        if (fields.Title) {
            task.Title = Trim(*fields.Title);
        }
        if (fields.Completed) {
            task.Completed = *fields.Completed;
        }
        if (fields.Priority) {
            task.Priority = fields.Priority;
        }
        if (fields.Category) {
            task.Category = Trim(*fields.Category);
        }
        for (auto it = fields.Extra.begin(); it != fields.Extra.end(); ++it) {
            task.Extra[it.key()] = it.value();
        }
    }

    TaskId TTaskRepository::NextId(const std::vector<TTask>& tasks) {
        TaskId maxid = 0;
        for (auto const& t : tasks) {
            maxid = std::max(maxid, t.Id);
        }
        if (maxid == std::numeric_limits<TaskId>::max()) {
            throw TValidationError("Cannot assign a new task id: id " + std::to_string(maxid) + " is already taken");
        }
        return maxid + 1;
    }

    std::vector<TTask> TTaskRepository::List() {
        return Storage->LoadTasks();
    }

    std::optional<TTask> TTaskRepository::Get(TaskId id) {
        auto tasks = Storage->LoadTasks();
        auto it = std::find_if(tasks.begin(), tasks.end(), [id](const TTask& t) {
            return t.Id == id;
        });
        if (it == tasks.end()) {
            return std::nullopt;
        }
        return *it;
    }

    TTask TTaskRepository::Create(const TTaskPatch& fields) {
        if (!fields.Title) {
            throw TValidationError("Task title is required");
        }
        ValidatePatch(fields);

        std::lock_guard lk(Mutex_);
        auto tasks = Storage->LoadTasks();

        TTask nt;
        nt.Id = NextId(tasks);
        ApplyPatch(nt, fields);
        tasks.push_back(nt);
        Storage->SaveTasks(tasks);

        LogInfo(LogCore) << "Created task id=" << nt.Id;
        return nt;
    }

    TTask TTaskRepository::Update(TaskId id, const TTaskPatch& fields) {
        ValidatePatch(fields);

        std::lock_guard lk(Mutex_);
        auto tasks = Storage->LoadTasks();
        auto it = std::find_if(tasks.begin(), tasks.end(), [id](const TTask& t) {
            return t.Id == id;
        });
        if (it == tasks.end()) {
            LogDebug(LogCore) << "Update of missing task id=" << id;
            throw TNotFoundError(id);
        }

        ApplyPatch(*it, fields);
        TTask merged = *it;
        Storage->SaveTasks(tasks);

        LogInfo(LogCore) << "Updated task id=" << id;
        return merged;
    }

    bool TTaskRepository::Delete(TaskId id) {
        std::lock_guard lk(Mutex_);
        auto tasks = Storage->LoadTasks();
        const auto before = tasks.size();
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                                   [id](const TTask& t) {
                                       return t.Id == id;
                                   }),
                    tasks.end());
        Storage->SaveTasks(tasks);

        bool removed = tasks.size() < before;
        LogInfo(LogCore) << "Delete task id=" << id << (removed ? " removed" : " not present");
        return removed;
    }

} // namespace NTaskList
