#include "keel/Environment.hpp"
#include "keel/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>

using namespace keel;

Variable Variable::literal(std::string name, std::string value) {
    Variable v;
    v.name = std::move(name);
    v.value = std::move(value);
    return v;
}

Variable Variable::capture(std::string name, std::string command) {
    Variable v;
    v.name = std::move(name);
    v.value = std::move(command);
    v.derived = true;
    return v;
}

static bool is_positional(const std::string &name) {
    return !name.empty() && std::ranges::all_of(name, [](const char c) { return c >= '0' && c <= '9'; });
}

static std::string chomp(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

Environment::Environment(const std::vector<Variable> &variables, CaptureFn capture)
    : capture_(std::move(capture)) {
    for (const auto &v: variables) {
        // Later declarations replace earlier ones, like re-assigning a make variable.
        if (v.exported && std::ranges::find(export_order_, v.name) == export_order_.end()) {
            export_order_.push_back(v.name);
        }
        variables_[v.name] = v;
    }
    for (const auto &[name, v]: variables_) {
        if (v.derived) slots_.emplace(name, std::make_unique<Slot>());
    }
}

void Environment::set_override(const std::string &name, const std::string &value) {
    overrides_[name] = value;
}

void Environment::set_builtin(const std::string &name, const std::string &value) {
    builtins_[name] = value;
}

void Environment::set_positional(std::vector<std::string> args) {
    positional_ = std::move(args);
}

bool Environment::defines(const std::string &name) const {
    if (is_positional(name)) {
        const auto idx = std::strtoul(name.c_str(), nullptr, 10);
        return idx >= 1 && idx <= positional_.size();
    }
    if (overrides_.contains(name) || variables_.contains(name) || builtins_.contains(name)) return true;
    return use_process_env_ && std::getenv(name.c_str()) != nullptr;
}

std::string Environment::resolve(const std::string &name) {
    std::vector<std::string> stack;
    return resolve_impl(name, stack);
}

std::string Environment::expand(const std::string &text) {
    std::vector<std::string> stack;
    return expand_impl(text, stack);
}

EnvPairs Environment::exports() {
    EnvPairs out;
    out.reserve(export_order_.size());
    for (const auto &name: export_order_) out.emplace_back(name, resolve(name));
    return out;
}

static bool mentions(const std::string &text, const std::string &name) {
    for (auto pos = text.find('$'); pos != std::string::npos; pos = text.find('$', pos + 1)) {
        std::size_t start = pos + 1;
        if (start < text.size() && text[start] == '{') ++start;
        if (text.compare(start, name.size(), name) != 0) continue;
        const std::size_t after = start + name.size();
        if (after == text.size()) return true;
        const char c = text[after];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return true;
    }
    return false;
}

EnvPairs Environment::exports_for(const std::string &command) {
    EnvPairs out;
    for (const auto &name: export_order_) {
        const Variable &var = variables_.at(name);
        if (var.derived && !overrides_.contains(name) && !mentions(command, name)) continue;
        out.emplace_back(name, resolve(name));
    }
    return out;
}

std::string Environment::resolve_impl(const std::string &name, std::vector<std::string> &stack) {
    if (is_positional(name)) {
        const auto idx = std::strtoul(name.c_str(), nullptr, 10);
        if (idx < 1 || idx > positional_.size()) {
            throw VariableResolutionError(name, _("no such positional argument"));
        }
        return positional_[idx - 1];
    }

    if (std::ranges::find(stack, name) != stack.end()) {
        std::string path;
        for (const auto &s: stack) path += s + " -> ";
        throw VariableResolutionError(name, std::string(_("recursive reference")) + " (" + path + name + ")");
    }

    struct StackGuard {
        std::vector<std::string> &stack;

        StackGuard(std::vector<std::string> &s, const std::string &n) : stack(s) { stack.push_back(n); }

        ~StackGuard() { stack.pop_back(); }
    } guard(stack, name);

    if (const auto it = overrides_.find(name); it != overrides_.end()) return expand_impl(it->second, stack);
    if (const auto it = variables_.find(name); it != variables_.end()) {
        if (it->second.derived) return run_capture(it->second, stack);
        return expand_impl(it->second.value, stack);
    }
    if (const auto it = builtins_.find(name); it != builtins_.end()) return it->second;
    if (use_process_env_) {
        if (const char *env = std::getenv(name.c_str())) return env;
    }
    throw VariableResolutionError(name, _("undefined variable"));
}

std::string Environment::run_capture(const Variable &var, std::vector<std::string> &stack) {
    Slot &slot = *slots_.at(var.name);
    std::call_once(slot.once, [&] {
        try {
            const std::string cmd = expand_impl(var.value, stack);
            const CaptureResult r = capture_(cmd);
            if (r.exit_code != 0) {
                throw VariableResolutionError(var.name, std::string(_("command exited with status")) + " " +
                                                        std::to_string(r.exit_code) + ": " + cmd);
            }
            slot.value = chomp(r.output);
        } catch (const Error &) {
            // Memoize the failure too: the command must not be run a second time.
            slot.error = std::current_exception();
        }
    });
    if (slot.error) std::rethrow_exception(slot.error);
    return slot.value;
}

std::string Environment::expand_impl(const std::string &text, std::vector<std::string> &stack) {
    static const std::regex re(R"(\$(\$?)\{([A-Za-z_][A-Za-z0-9_]*|[0-9]+)\})");
    std::string out;
    out.reserve(text.size());
    std::sregex_iterator it(text.begin(), text.end(), re);
    size_t last = 0;
    for (const std::sregex_iterator end; it != end; ++it) {
        const auto &m = *it;
        out.append(text, last, static_cast<size_t>(m.position()) - last);
        if (m[1].length() > 0) out += "${" + m[2].str() + "}";
        else out += resolve_impl(m[2].str(), stack);
        last = static_cast<size_t>(m.position() + m.length());
    }
    out.append(text, last, std::string::npos);
    return out;
}
