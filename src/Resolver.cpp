#include "keel/Resolver.hpp"
#include "keel/Errors.hpp"

#include <algorithm>
#include <unordered_set>

using namespace keel;

bool ExecutionPlan::contains(const std::string &name) const {
    return std::ranges::find(order, name) != order.end();
}

std::size_t ExecutionPlan::index_of(const std::string &name) const {
    return static_cast<std::size_t>(std::ranges::find(order, name) - order.begin());
}

namespace {
    struct Walk {
        const Registry &registry;
        ExecutionPlan plan;
        std::unordered_set<std::string> done;
        std::vector<std::string> stack; // targets being expanded, outermost first

        void visit(const std::string &name, const std::string &required_by) {
            if (done.contains(name)) return;
            if (const auto it = std::ranges::find(stack, name); it != stack.end()) {
                std::vector<std::string> cycle(it, stack.end());
                cycle.push_back(name);
                throw CyclicDependencyError(std::move(cycle));
            }
            if (!registry.contains(name)) throw UnknownTargetError(name, required_by);
            const Target &target = registry.find(name);

            stack.push_back(name);
            for (const auto &dep: target.prerequisites) visit(dep, name);
            stack.pop_back();

            done.insert(name);
            plan.order.push_back(name);
        }
    };
} // namespace

ExecutionPlan Resolver::plan(const std::vector<std::string> &requested) const {
    Walk walk{registry_, {}, {}, {}};
    for (const auto &name: requested) walk.visit(name, std::string());
    return std::move(walk.plan);
}
