#pragma once
#include "keel/Registry.hpp"
#include "keel/Resolver.hpp"

#include <string>

namespace keel {
    struct HelpStyle {
        int column = 30;    // width the target names are padded to
        bool color = false; // yellow names, bold red section headers
    };

    // Documented targets grouped under their section headers, in declaration order.
    // Never runs anything.
    [[nodiscard]] std::string render_help(const Registry &registry, const HelpStyle &style = {});

    // One target per line, numbered in run order.
    [[nodiscard]] std::string render_plan(const ExecutionPlan &plan);
} // namespace keel
