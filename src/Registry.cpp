#include "keel/Registry.hpp"
#include "keel/Errors.hpp"

using namespace keel;

void Registry::add(Target target) {
    if (target.name.empty()) throw Error(_("target name must not be empty"));
    if (index_.contains(target.name)) throw DuplicateTargetError(target.name);
    index_.emplace(target.name, targets_.size());
    order_.push_back({targets_.size(), std::string()});
    targets_.push_back(std::move(target));
}

void Registry::add_section(const std::string &title) {
    order_.push_back({npos, title});
}

const Target &Registry::find(const std::string &name) const {
    const auto it = index_.find(name);
    if (it == index_.end()) throw UnknownTargetError(name);
    return targets_[it->second];
}

bool Registry::contains(const std::string &name) const {
    return index_.contains(name);
}

std::vector<HelpEntry> Registry::documented() const {
    std::vector<HelpEntry> out;
    for (const auto &[target, section]: order_) {
        if (target == npos) {
            out.push_back({HelpEntry::Kind::Section, section, std::string()});
            continue;
        }
        const Target &t = targets_[target];
        if (t.description) out.push_back({HelpEntry::Kind::Target, t.name, *t.description});
    }
    return out;
}
