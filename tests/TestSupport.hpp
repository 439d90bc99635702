#pragma once
#include "keel/Subprocess.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <thread>
#include <chrono>
#include <string>
#include <vector>
#include <unistd.h>

namespace keel::test {
    // Scratch directory removed with everything in it.
    struct TmpDir {
        std::filesystem::path path;

        explicit TmpDir(const std::string &name)
            : path(std::filesystem::temp_directory_path() / (name + "_" + std::to_string(getpid()))) {
            std::filesystem::remove_all(path);
            std::filesystem::create_directories(path);
        }

        ~TmpDir() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }

        [[nodiscard]] std::string file(const std::string &name, const std::string &content) const {
            const auto p = path / name;
            std::filesystem::create_directories(p.parent_path());
            std::ofstream o(p);
            o << content;
            return p.string();
        }
    };

    // Command runner that records every line and answers from a table (default 0).
    // Commands listed in delay_ms take that long before answering.
    struct FakeRunner {
        std::map<std::string, int> exit_codes;
        std::map<std::string, int> delay_ms;
        std::vector<std::string> commands;
        std::vector<EnvPairs> exports;
        std::mutex mutex;

        int operator()(const std::string &cmd, const EnvPairs &env) {
            if (const auto d = delay_ms.find(cmd); d != delay_ms.end()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(d->second));
            }
            std::lock_guard lock(mutex);
            commands.push_back(cmd);
            exports.push_back(env);
            const auto it = exit_codes.find(cmd);
            return it == exit_codes.end() ? 0 : it->second;
        }

        // Copyable handle for Executor's CommandRunner parameter.
        auto runner() {
            return [this](const std::string &cmd, const EnvPairs &env) { return (*this)(cmd, env); };
        }

        [[nodiscard]] long index_of(const std::string &cmd) const {
            for (size_t i = 0; i < commands.size(); ++i) if (commands[i] == cmd) return static_cast<long>(i);
            return -1;
        }

        [[nodiscard]] size_t count(const std::string &cmd) const {
            size_t n = 0;
            for (const auto &c: commands) if (c == cmd) ++n;
            return n;
        }
    };
} // namespace keel::test
