#pragma once
#include "keel/Environment.hpp"
#include "keel/Executor.hpp"
#include "keel/Registry.hpp"
#include "keel/Resolver.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace keel {
    enum class ReleaseState { Idle, Versioned, Tagged, Pushed, Packaged, Validated, Published, Done, Failed };

    [[nodiscard]] const char *to_string(ReleaseState state);

    /**
     * @brief Declaration of a release workflow.
     *
     * Command fields are shell lines; they may use ${TAG}, ${REMOTE} and
     * ${ARTIFACT}, which the pipeline defines, plus any Keelfile variable.
     */
    struct ReleaseConfig {
        std::string name = "release";
        std::optional<std::string> description;
        std::vector<std::string> prerequisites; // run before anything is tagged
        std::string version = "VERSION";        // variable holding the version string
        std::string tag = "v${VERSION}";
        std::string vcs = "git";
        std::string remote = "origin";
        std::string package;  // builds ${ARTIFACT}
        std::string artifact; // path of the built artifact
        std::string validate; // checks ${ARTIFACT} before anything is uploaded
        std::string publish;  // creates the release record; failure tolerated when it already exists
        std::string upload;   // uploads ${ARTIFACT}, replacing an asset of the same name
    };

    /**
     * @brief Tag, push, package, validate and publish, as ordinary targets.
     *
     * install() generates one internal target per stage, chained through
     * prerequisites, plus the documented aggregate target. Every stage that
     * touches state left behind by an earlier attempt clears it first (local and
     * remote tag deletion, release record creation are suppress-failure), so the
     * whole pipeline can be re-invoked after a partial failure.
     *
     * The pipeline also tracks how far a run got: begin() derives the version,
     * observe() follows the executor's target events, finish() records failure.
     */
    class ReleasePipeline {
    public:
        using Listener = std::function<void(ReleaseState from, ReleaseState to)>;

        explicit ReleasePipeline(ReleaseConfig config);

        // Throws DuplicateTargetError when a generated name is already taken.
        void install(Registry &registry, std::vector<Variable> &variables) const;

        [[nodiscard]] std::string stage_target(ReleaseState state) const;

        [[nodiscard]] bool involves(const ExecutionPlan &plan) const;

        // Idle -> Versioned. On VariableResolutionError the state becomes Failed and the error is rethrown.
        void begin(Environment &env);

        void observe(const TargetEvent &event);

        void finish(const ExecutionReport &report);

        // begin(), execute with observe() attached, finish().
        ExecutionReport run(Executor &executor, Environment &env, const ExecutionPlan &plan);

        void set_listener(Listener listener) { listener_ = std::move(listener); }

        [[nodiscard]] ReleaseState state() const { return state_; }

        // Last state reached before Failed (or the current state otherwise).
        [[nodiscard]] ReleaseState last_reached() const { return reached_; }

        [[nodiscard]] const ReleaseConfig &config() const { return config_; }

    private:
        void move_to(ReleaseState next);

        ReleaseConfig config_;
        ReleaseState state_ = ReleaseState::Idle;
        ReleaseState reached_ = ReleaseState::Idle;
        Listener listener_;
    };
} // namespace keel
