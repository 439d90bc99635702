#pragma once
#include "keel/Console.hpp"
#include "keel/Environment.hpp"
#include "keel/Registry.hpp"
#include "keel/Resolver.hpp"
#include "keel/Subprocess.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace keel {
    // Runs one expanded command line; returns its exit status.
    using CommandRunner = std::function<int(const std::string &cmd, const EnvPairs &exports)>;

    struct ExecutionReport {
        enum class Status { Success, Failure, Cancelled };

        Status status = Status::Success;
        std::vector<std::string> completed; // successfully finished targets, in completion order
        std::string failed_target;
        std::string failed_command;
        int exit_code = 0;
        std::size_t commands_run = 0;
        std::size_t suppressed_failures = 0;

        [[nodiscard]] bool ok() const { return status == Status::Success; }
    };

    struct TargetEvent {
        enum class Kind { Started, Finished, Failed };

        Kind kind;
        std::string target;
    };

    using TargetObserver = std::function<void(const TargetEvent &)>;

    struct ExecutorOptions {
        std::size_t jobs = 1; // > 1 runs independent targets concurrently
        bool dry_run = false; // echo commands without running them
    };

    /**
     * @brief Runs an execution plan, one subprocess per command line.
     *
     * The first command that exits non-zero without being marked suppress_failure
     * stops the run: no further command or target is started, including the next
     * command of a target already running on another worker. Variable errors
     * raised while expanding a command propagate out of execute().
     */
    class Executor {
    public:
        Executor(const Registry &registry, Environment &env, Console &console, ExecutorOptions options = {},
                 CommandRunner runner = run_shell);

        Executor(const Executor &) = delete;

        Executor &operator=(const Executor &) = delete;

        ExecutionReport execute(const ExecutionPlan &plan);

        // Stop before the next command. Only stores an atomic flag, so it may be
        // called from a signal handler.
        void cancel() noexcept { cancelled_.store(true); }

        [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

        void set_observer(TargetObserver observer) { observer_ = std::move(observer); }

    private:
        struct Outcome {
            ExecutionReport::Status status = ExecutionReport::Status::Success;
            std::string command;
            int exit_code = 0;
            std::size_t commands_run = 0;
            std::size_t suppressed = 0;
            bool stopped = false; // another target failed first
        };

        Outcome run_target(const Target &target);

        ExecutionReport execute_sequential(const ExecutionPlan &plan);

        ExecutionReport execute_parallel(const ExecutionPlan &plan);

        void notify(TargetEvent::Kind kind, const std::string &target);

        // Folds one target's outcome into the report; false when the run must stop.
        bool merge(ExecutionReport &report, const std::string &target, const Outcome &outcome);

        const Registry &registry_;
        Environment &env_;
        Console &console_;
        ExecutorOptions options_;
        CommandRunner runner_;
        TargetObserver observer_;
        std::mutex observer_mutex_;
        std::atomic<bool> cancelled_{false};
        // Set by the first unsuppressed failure; running targets start no further command.
        std::atomic<bool> failed_{false};
    };
} // namespace keel
