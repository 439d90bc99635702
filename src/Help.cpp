#include "keel/Help.hpp"

#include <iomanip>
#include <sstream>

using namespace keel;

std::string keel::render_help(const Registry &registry, const HelpStyle &style) {
    std::ostringstream os;
    for (const auto &[kind, name, description]: registry.documented()) {
        if (kind == HelpEntry::Kind::Section) {
            os << "\n" << std::string(15, ' ');
            if (style.color) os << "\033[1;31m" << name << "\033[0m\n";
            else os << name << "\n";
            continue;
        }
        if (style.color) os << "\033[33m";
        os << std::left << std::setw(style.column) << name;
        if (style.color) os << "\033[0m";
        os << " " << description << "\n";
    }
    return os.str();
}

std::string keel::render_plan(const ExecutionPlan &plan) {
    std::ostringstream os;
    for (size_t i = 0; i < plan.order.size(); ++i) {
        os << std::setw(3) << i + 1 << ". " << plan.order[i] << "\n";
    }
    return os.str();
}
