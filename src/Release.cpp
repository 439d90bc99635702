#include "keel/Release.hpp"
#include "keel/Errors.hpp"

#include <array>

using namespace keel;

const char *keel::to_string(const ReleaseState state) {
    switch (state) {
        case ReleaseState::Idle: return "Idle";
        case ReleaseState::Versioned: return "Versioned";
        case ReleaseState::Tagged: return "Tagged";
        case ReleaseState::Pushed: return "Pushed";
        case ReleaseState::Packaged: return "Packaged";
        case ReleaseState::Validated: return "Validated";
        case ReleaseState::Published: return "Published";
        case ReleaseState::Done: return "Done";
        case ReleaseState::Failed: return "Failed";
    }
    return "?";
}

namespace {
    // State reached when the matching stage target finishes.
    struct Stage {
        ReleaseState state;
        const char *suffix;
    };

    constexpr std::array<Stage, 6> stages{{
        {ReleaseState::Tagged, "-tag"},
        {ReleaseState::Pushed, "-push"},
        {ReleaseState::Packaged, "-package"},
        {ReleaseState::Validated, "-validate"},
        {ReleaseState::Published, "-publish"},
        {ReleaseState::Done, ""},
    }};

    Command step(std::string text) {
        Command c;
        c.text = std::move(text);
        return c;
    }

    Command attempt(std::string text) {
        Command c = step(std::move(text));
        c.suppress_failure = true;
        return c;
    }

    Command say(std::string text) {
        Command c = step("echo \"" + std::move(text) + "\"");
        c.silent = true;
        return c;
    }
} // namespace

ReleasePipeline::ReleasePipeline(ReleaseConfig config) : config_(std::move(config)) {
    if (config_.name.empty()) throw Error(_("release name must not be empty"));
}

std::string ReleasePipeline::stage_target(const ReleaseState state) const {
    for (const auto &[s, suffix]: stages) {
        if (s == state) return config_.name + suffix;
    }
    return std::string();
}

void ReleasePipeline::install(Registry &registry, std::vector<Variable> &variables) const {
    const std::string &vcs = config_.vcs;

    variables.push_back(Variable::literal("TAG", config_.tag));
    variables.push_back(Variable::literal("REMOTE", config_.remote));
    variables.push_back(Variable::literal("ARTIFACT", config_.artifact));

    Target tag;
    tag.name = stage_target(ReleaseState::Tagged);
    tag.prerequisites = config_.prerequisites;
    tag.commands = {
        say("=== Creating tag ${TAG}"),
        attempt(vcs + " tag -d ${TAG}"),
        step(vcs + " tag ${TAG}"),
    };

    Target push;
    push.name = stage_target(ReleaseState::Pushed);
    push.prerequisites = {tag.name};
    push.commands = {
        say("=== Pushing tag ${TAG} to ${REMOTE}"),
        step(vcs + " push ${REMOTE}"),
        attempt(vcs + " push ${REMOTE} :${TAG}"),
        step(vcs + " push ${REMOTE} ${TAG}"),
    };

    Target package;
    package.name = stage_target(ReleaseState::Packaged);
    package.prerequisites = {push.name};
    if (!config_.package.empty()) package.commands.push_back(step(config_.package));

    Target validate;
    validate.name = stage_target(ReleaseState::Validated);
    validate.prerequisites = {package.name};
    if (!config_.validate.empty()) validate.commands.push_back(step(config_.validate));

    Target publish;
    publish.name = stage_target(ReleaseState::Published);
    publish.prerequisites = {validate.name};
    if (!config_.publish.empty()) publish.commands.push_back(attempt(config_.publish));
    if (!config_.upload.empty()) publish.commands.push_back(step(config_.upload));

    Target release;
    release.name = config_.name;
    release.prerequisites = {publish.name};
    release.description = config_.description;

    // Aggregate first so it sits where the block was declared in the help output.
    registry.add(std::move(release));
    registry.add(std::move(tag));
    registry.add(std::move(push));
    registry.add(std::move(package));
    registry.add(std::move(validate));
    registry.add(std::move(publish));
}

bool ReleasePipeline::involves(const ExecutionPlan &plan) const {
    return plan.contains(stage_target(ReleaseState::Tagged));
}

void ReleasePipeline::move_to(const ReleaseState next) {
    const ReleaseState from = state_;
    state_ = next;
    if (next != ReleaseState::Failed) reached_ = next;
    if (listener_) listener_(from, next);
}

void ReleasePipeline::begin(Environment &env) {
    state_ = ReleaseState::Idle;
    reached_ = ReleaseState::Idle;
    try {
        (void) env.resolve(config_.version);
    } catch (const VariableResolutionError &) {
        move_to(ReleaseState::Failed);
        throw;
    }
    move_to(ReleaseState::Versioned);
}

void ReleasePipeline::observe(const TargetEvent &event) {
    if (state_ == ReleaseState::Idle || state_ == ReleaseState::Failed || state_ == ReleaseState::Done) return;
    if (event.kind == TargetEvent::Kind::Failed) {
        move_to(ReleaseState::Failed);
        return;
    }
    if (event.kind != TargetEvent::Kind::Finished) return;
    for (const auto &[s, suffix]: stages) {
        // Stages only move forward; the enum order is the pipeline order.
        if (event.target == config_.name + suffix && s > state_) {
            move_to(s);
            return;
        }
    }
}

void ReleasePipeline::finish(const ExecutionReport &report) {
    if (report.ok() || state_ == ReleaseState::Idle || state_ == ReleaseState::Failed) return;
    move_to(ReleaseState::Failed);
}

ExecutionReport ReleasePipeline::run(Executor &executor, Environment &env, const ExecutionPlan &plan) {
    begin(env);
    executor.set_observer([this](const TargetEvent &event) { observe(event); });
    ExecutionReport report;
    try {
        report = executor.execute(plan);
    } catch (const Error &) {
        executor.set_observer(nullptr);
        move_to(ReleaseState::Failed);
        throw;
    }
    executor.set_observer(nullptr);
    finish(report);
    return report;
}
