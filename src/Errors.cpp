#include "keel/Errors.hpp"

using namespace keel;

static std::string join_cycle(const std::vector<std::string> &cycle) {
    std::string out;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i) out += " -> ";
        out += cycle[i];
    }
    return out;
}

static std::string unknown_message(const std::string &name, const std::string &required_by) {
    std::string msg = std::string(_("unknown target")) + " '" + name + "'";
    if (!required_by.empty()) msg += std::string(" (") + _("needed by") + " '" + required_by + "')";
    return msg;
}

UnknownTargetError::UnknownTargetError(const std::string &name, const std::string &required_by)
    : Error(unknown_message(name, required_by)), name_(name), required_by_(required_by) {
}

DuplicateTargetError::DuplicateTargetError(const std::string &name)
    : Error(std::string(_("target declared twice")) + ": '" + name + "'"), name_(name) {
}

CyclicDependencyError::CyclicDependencyError(std::vector<std::string> cycle)
    : Error(std::string(_("dependency cycle detected")) + ": " + join_cycle(cycle)), cycle_(std::move(cycle)) {
}

VariableResolutionError::VariableResolutionError(const std::string &variable, const std::string &reason)
    : Error(std::string(_("cannot resolve variable")) + " '" + variable + "': " + reason), variable_(variable) {
}

ParseError::ParseError(const std::string &file, const int line, const std::string &msg)
    : Error("[Keelfile] " + file + ":" + std::to_string(line) + ": " + msg), line_(line) {
}
