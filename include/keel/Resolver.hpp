#pragma once
#include "keel/Registry.hpp"

#include <string>
#include <vector>

namespace keel {
    // Targets in run order: every prerequisite precedes its dependents, no duplicates.
    struct ExecutionPlan {
        std::vector<std::string> order;

        [[nodiscard]] bool contains(const std::string &name) const;

        [[nodiscard]] std::size_t index_of(const std::string &name) const;

        [[nodiscard]] bool empty() const { return order.empty(); }

        [[nodiscard]] std::size_t size() const { return order.size(); }
    };

    class Resolver {
    public:
        explicit Resolver(const Registry &registry) : registry_(registry) {
        }

        /**
         * @brief Expand the requested targets into one merged execution plan.
         *
         * Depth-first, post-order: prerequisites (in declaration order) are placed
         * before the target itself, and a target already placed is skipped.
         *
         * @throws UnknownTargetError     a requested name or a prerequisite is not registered.
         * @throws CyclicDependencyError  a prerequisite chain returns to a target being expanded.
         */
        [[nodiscard]] ExecutionPlan plan(const std::vector<std::string> &requested) const;

    private:
        const Registry &registry_;
    };
} // namespace keel
