#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace NTaskList {

    struct TTaskListError: public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Caller-supplied data violates a record invariant.
    struct TValidationError: public TTaskListError {
        using TTaskListError::TTaskListError;
    };

    class TNotFoundError: public TTaskListError {
    public:
        explicit TNotFoundError(uint64_t id)
            : TTaskListError("Task not found: id=" + std::to_string(id))
            , Id(id) {
        }

        uint64_t GetId() const {
            return Id;
        }

    private:
        uint64_t Id;
    };

    class TStoreError: public TTaskListError {
    public:
        TStoreError(const std::string& message, std::string path)
            : TTaskListError(message + ": " + path)
            , Path(std::move(path)) {
        }

        const std::string& GetPath() const {
            return Path;
        }

    private:
        std::string Path;
    };

    // The backing file exists but cannot be read or decoded.
    struct TCorruptStoreError: public TStoreError {
        using TStoreError::TStoreError;
    };

    // Persisting failed; the previous file is left as it was.
    struct TStoreWriteError: public TStoreError {
        using TStoreError::TStoreError;
    };

} // namespace NTaskList
