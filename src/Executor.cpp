#include "keel/Executor.hpp"
#include "keel/Errors.hpp"

#include <condition_variable>
#include <exception>
#include <future>
#include <set>
#include <unordered_map>

using namespace keel;

Executor::Executor(const Registry &registry, Environment &env, Console &console, const ExecutorOptions options,
                   CommandRunner runner)
    : registry_(registry), env_(env), console_(console), options_(options), runner_(std::move(runner)) {
    if (options_.jobs == 0) options_.jobs = 1;
}

void Executor::notify(const TargetEvent::Kind kind, const std::string &target) {
    if (!observer_) return;
    std::lock_guard lock(observer_mutex_);
    observer_(TargetEvent{kind, target});
}

Executor::Outcome Executor::run_target(const Target &target) {
    Outcome out;
    notify(TargetEvent::Kind::Started, target.name);

    for (const auto &cmd: target.commands) {
        if (cancelled()) {
            out.status = ExecutionReport::Status::Cancelled;
            break;
        }
        if (failed_.load()) {
            out.stopped = true;
            break;
        }
        const std::string line = cmd.expand ? env_.expand(cmd.text) : cmd.text;
        if (!cmd.silent || options_.dry_run) console_.command(line);
        if (options_.dry_run) continue;
        const EnvPairs exports = env_.exports_for(cmd.text);

        const int rc = runner_(line, exports);
        ++out.commands_run;
        if (rc == 0) continue;
        if (cancelled()) {
            out.status = ExecutionReport::Status::Cancelled;
            out.command = line;
            out.exit_code = rc;
            break;
        }
        if (cmd.suppress_failure) {
            ++out.suppressed;
            continue;
        }
        failed_.store(true);
        out.status = ExecutionReport::Status::Failure;
        out.command = line;
        out.exit_code = rc;
        break;
    }

    if (out.stopped) {
        console_.status(target.name, _("stopped"), true);
        notify(TargetEvent::Kind::Failed, target.name);
        return out;
    }
    switch (out.status) {
        case ExecutionReport::Status::Success:
            console_.status(target.name, "ok");
            notify(TargetEvent::Kind::Finished, target.name);
            break;
        case ExecutionReport::Status::Failure:
            console_.status(target.name, "!!", true);
            notify(TargetEvent::Kind::Failed, target.name);
            break;
        case ExecutionReport::Status::Cancelled:
            console_.status(target.name, _("interrupted"), true);
            notify(TargetEvent::Kind::Failed, target.name);
            break;
    }
    return out;
}

bool Executor::merge(ExecutionReport &report, const std::string &target, const Outcome &outcome) {
    report.commands_run += outcome.commands_run;
    report.suppressed_failures += outcome.suppressed;
    // The target that failed first is merged on its own and carries the report.
    if (outcome.stopped) return false;
    if (outcome.status == ExecutionReport::Status::Success) {
        report.completed.push_back(target);
        return true;
    }
    // Keep the first stop reason when several workers fail together.
    if (report.status == ExecutionReport::Status::Success) {
        report.status = outcome.status;
        report.failed_target = target;
        report.failed_command = outcome.command;
        report.exit_code = outcome.exit_code;
    }
    return false;
}

ExecutionReport Executor::execute(const ExecutionPlan &plan) {
    failed_.store(false);
    if (options_.jobs > 1 && plan.size() > 1) return execute_parallel(plan);
    return execute_sequential(plan);
}

ExecutionReport Executor::execute_sequential(const ExecutionPlan &plan) {
    ExecutionReport report;
    for (const auto &name: plan.order) {
        if (cancelled()) {
            report.status = ExecutionReport::Status::Cancelled;
            break;
        }
        if (!merge(report, name, run_target(registry_.find(name)))) break;
    }
    return report;
}

ExecutionReport Executor::execute_parallel(const ExecutionPlan &plan) {
    ExecutionReport report;
    const std::size_t n = plan.size();

    // Prerequisite counts and reverse edges, restricted to the plan.
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < n; ++i) index.emplace(plan.order[i], i);
    std::vector<std::size_t> pending(n, 0);
    std::vector<std::vector<std::size_t> > dependents(n);
    for (std::size_t i = 0; i < n; ++i) {
        std::set<std::size_t> deps;
        for (const auto &dep: registry_.find(plan.order[i]).prerequisites) deps.insert(index.at(dep));
        pending[i] = deps.size();
        for (const std::size_t d: deps) dependents[d].push_back(i);
    }

    // Ready targets are started in plan order.
    std::set<std::size_t> ready;
    for (std::size_t i = 0; i < n; ++i) if (pending[i] == 0) ready.insert(i);

    struct Done {
        std::size_t index;
        Outcome outcome;
        std::exception_ptr error;
    };
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<Done> finished;
    std::vector<std::future<void> > workers;
    std::exception_ptr error;
    std::size_t running = 0;
    bool stop = false;

    for (;;) {
        if (!stop && cancelled()) {
            stop = true;
            if (report.status == ExecutionReport::Status::Success) report.status = ExecutionReport::Status::Cancelled;
        }
        while (!stop && running < options_.jobs && !ready.empty()) {
            const std::size_t i = *ready.begin();
            ready.erase(ready.begin());
            ++running;
            const Target &target = registry_.find(plan.order[i]);
            workers.push_back(std::async(std::launch::async, [this, &target, i, &mutex, &cv, &finished] {
                Done done{i, {}, nullptr};
                try {
                    done.outcome = run_target(target);
                } catch (...) {
                    failed_.store(true);
                    done.error = std::current_exception();
                }
                std::lock_guard lock(mutex);
                finished.push_back(std::move(done));
                cv.notify_one();
            }));
        }
        if (running == 0) break;

        std::vector<Done> batch;
        {
            std::unique_lock lock(mutex);
            cv.wait(lock, [&finished] { return !finished.empty(); });
            batch.swap(finished);
        }
        for (auto &done: batch) {
            --running;
            if (done.error) {
                if (!error) error = done.error;
                stop = true;
                continue;
            }
            if (!merge(report, plan.order[done.index], done.outcome)) {
                stop = true;
                continue;
            }
            for (const std::size_t d: dependents[done.index]) {
                if (--pending[d] == 0) ready.insert(d);
            }
        }
    }
    for (auto &w: workers) w.get();
    if (error) std::rethrow_exception(error);
    return report;
}
