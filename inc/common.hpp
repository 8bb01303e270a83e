#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "errors.hpp"

using json = nlohmann::json;

using TaskId = uint64_t;

namespace NTaskList {

    enum class EPriority {
        Low,
        Medium,
        High
    };

    struct TTask {
        TaskId Id = 0;
        std::string Title;
        bool Completed = false;
        std::optional<EPriority> Priority;
        std::optional<std::string> Category;
        json Extra = json::object(); // extension fields, kept verbatim
    };

    // Partial task: absent fields are left untouched on update.
    struct TTaskPatch {
        std::optional<std::string> Title;
        std::optional<bool> Completed;
        std::optional<EPriority> Priority;
        std::optional<std::string> Category;
        json Extra = json::object();
    };

    inline const char* ToString(EPriority p) {
        switch (p) {
        case EPriority::Low: return "low";
        case EPriority::Medium: return "medium";
        case EPriority::High: return "high";
        }
        return "medium";
    }

    inline std::optional<EPriority> PriorityFromString(const std::string& s) {
        if (s == "low") {
            return EPriority::Low;
        }
        if (s == "medium") {
            return EPriority::Medium;
        }
        if (s == "high") {
            return EPriority::High;
        }
        return std::nullopt;
    }

    inline std::string Trim(const std::string& s) {
        const char* ws = " \t\r\n\f\v";
        auto first = s.find_first_not_of(ws);
        if (first == std::string::npos) {
            return {};
        }
        auto last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }

    // Accepts only a plain positive decimal number that fits TaskId.
    inline std::optional<TaskId> ParseTaskId(const std::string& s) {
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        TaskId id = 0;
        try {
            id = std::stoull(s);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        if (id == 0) {
            return std::nullopt;
        }
        return id;
    }

    inline bool IsReservedKey(const std::string& key) {
        return key == "id" || key == "title" || key == "completed" ||
               key == "priority" || key == "category";
    }

    inline void ToJSON(json& j, TTask const& t) {
        j = t.Extra.is_object() ? t.Extra : json::object();
        j["id"] = t.Id;
        j["title"] = t.Title;
        j["completed"] = t.Completed;
        if (t.Priority) {
            j["priority"] = ToString(*t.Priority);
        }
        if (t.Category) {
            j["category"] = *t.Category;
        }
    }

    // Throws std::invalid_argument on a malformed entry; the storage layer
    // turns that into a corrupt store error.
    inline void FromJSON(json const& j, TTask& t) {
        if (!j.is_object()) {
            throw std::invalid_argument("task entry is not an object");
        }
        if (!j.contains("id") || !j.at("id").is_number_integer()) {
            throw std::invalid_argument("task entry has no integer 'id'");
        }
        if (j.at("id").is_number_unsigned()) {
            t.Id = j.at("id").get<TaskId>();
        } else {
            auto signedId = j.at("id").get<long long>();
            if (signedId <= 0) {
                throw std::invalid_argument("task id must be positive");
            }
            t.Id = static_cast<TaskId>(signedId);
        }
        if (t.Id == 0) {
            throw std::invalid_argument("task id must be positive");
        }
        if (!j.contains("title") || !j.at("title").is_string()) {
            throw std::invalid_argument("task " + std::to_string(t.Id) + " has no string 'title'");
        }
        t.Title = j.at("title").get<std::string>();
        if (!j.contains("completed") || !j.at("completed").is_boolean()) {
            throw std::invalid_argument("task " + std::to_string(t.Id) + " has no boolean 'completed'");
        }
        t.Completed = j.at("completed").get<bool>();

        t.Priority.reset();
        if (j.contains("priority")) {
            const auto& p = j.at("priority");
            auto parsed = p.is_string() ? PriorityFromString(p.get<std::string>()) : std::nullopt;
            if (!parsed) {
                throw std::invalid_argument("task " + std::to_string(t.Id) + " has invalid 'priority'");
            }
            t.Priority = parsed;
        }

        t.Category.reset();
        if (j.contains("category")) {
            if (!j.at("category").is_string()) {
                throw std::invalid_argument("task " + std::to_string(t.Id) + " has non-string 'category'");
            }
            t.Category = j.at("category").get<std::string>();
        }

        t.Extra = json::object();
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!IsReservedKey(it.key())) {
                t.Extra[it.key()] = it.value();
            }
        }
    }

    inline json TasksToJson(const std::vector<TTask>& tasks) {
        json arr = json::array();
        for (auto const& t : tasks) {
            json j;
            ToJSON(j, t);
            arr.push_back(std::move(j));
        }
        return arr;
    }

} // namespace NTaskList
