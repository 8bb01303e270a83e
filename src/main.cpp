#include <Config.hpp>
#include <FileJsonStorage.hpp>
#include <Logger.hpp>
#include <TaskRepository.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

using namespace NTaskList;

static void PrintTask(const TTask& t) {
    std::cout << "[" << (t.Completed ? "x" : " ") << "] id=" << t.Id << " title=\"" << t.Title << "\"";
    if (t.Priority) {
        std::cout << " priority=" << ToString(*t.Priority);
    }
    if (t.Category) {
        std::cout << " category=" << *t.Category;
    }
    if (!t.Extra.empty()) {
        std::cout << " extra=" << t.Extra.dump();
    }
    std::cout << "\n";
}

static std::string RestOfLine(std::istringstream& iss) {
    std::string rest;
    std::getline(iss, rest);
    return Trim(rest);
}

static void PrintHelp() {
    std::cout << "Task list CLI. Commands:\n"
              << "  list\n"
              << "  show <id>\n"
              << "  add <title>\n"
              << "  rename <id> <title>\n"
              << "  done <id>\n"
              << "  undone <id>\n"
              << "  priority <id> <low|medium|high>\n"
              << "  category <id> <name>\n"
              << "  delete <id>\n"
              << "  help\n"
              << "  exit\n";
}

int main(int argc, char** argv) {
    TConfig cfg;
    try {
        cfg = LoadConfig(std::vector<std::string>(argv + 1, argv + argc), [](const char* name) {
            return std::getenv(name);
        });
    } catch (const TConfigError& ex) {
        std::cerr << "Configuration error: " << ex.what() << "\n"
                  << "Usage: tasklist [--config <file>] [--data <path>] [--log-file <path>] [--log-level <level>]\n";
        return 2;
    }

    InitLogging(cfg.LogFile, cfg.LogLevel);
    LogInfo(LogCli) << "Using task store " << cfg.DataPath.string();

    auto storage = std::make_shared<TFileJsonStorage>(cfg.DataPath);
    TTaskRepository repo(storage);

    PrintHelp();

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream iss(line);
        std::string cmd;
        if (!(iss >> cmd)) {
            continue;
        }
        if (cmd == "exit") {
            break;
        }

        try {
            if (cmd == "help") {
                PrintHelp();
                continue;
            }

            if (cmd == "list") {
                auto tasks = repo.List();
                if (tasks.empty()) {
                    std::cout << "No tasks\n";
                }
                for (auto const& t : tasks) {
                    PrintTask(t);
                }
                continue;
            }

            if (cmd == "add") {
                TTaskPatch fields;
                fields.Title = RestOfLine(iss);
                auto t = repo.Create(fields);
                std::cout << "Created task with id=" << t.Id << "\n";
                continue;
            }

            std::string idToken;
            iss >> idToken;
            auto parsedId = ParseTaskId(idToken);
            if (!parsedId) {
                std::cout << "Usage: " << cmd << " <id> ...\n";
                continue;
            }
            const TaskId id = *parsedId;

            if (cmd == "show") {
                auto t = repo.Get(id);
                if (t) {
                    PrintTask(*t);
                } else {
                    std::cout << "Not found id=" << id << "\n";
                }
                continue;
            }

            if (cmd == "delete") {
                bool ok = repo.Delete(id);
                std::cout << (ok ? "Deleted" : "Not found") << " id=" << id << "\n";
                continue;
            }

            TTaskPatch fields;
            if (cmd == "rename") {
                fields.Title = RestOfLine(iss);
            } else if (cmd == "done") {
                fields.Completed = true;
            } else if (cmd == "undone") {
                fields.Completed = false;
            } else if (cmd == "priority") {
                auto p = PriorityFromString(RestOfLine(iss));
                if (!p) {
                    std::cout << "Usage: priority <id> <low|medium|high>\n";
                    continue;
                }
                fields.Priority = p;
            } else if (cmd == "category") {
                fields.Category = RestOfLine(iss);
            } else {
                std::cout << "Unknown command\n";
                continue;
            }
            PrintTask(repo.Update(id, fields));
        } catch (const TValidationError& ex) {
            std::cout << "Invalid: " << ex.what() << "\n";
        } catch (const TNotFoundError& ex) {
            std::cout << "Not found: " << ex.what() << "\n";
        } catch (const TStoreError& ex) {
            LogError(LogCli) << ex.what();
            std::cout << "Error: " << ex.what() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    ShutdownLogging();
    return 0;
}
