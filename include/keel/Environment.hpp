#pragma once
#include "keel/Subprocess.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace keel {
    struct Variable {
        std::string name;
        std::string value; // literal text, or the shell command of a derived variable
        bool derived = false;
        bool exported = false;

        static Variable literal(std::string name, std::string value);

        static Variable capture(std::string name, std::string command);
    };

    using CaptureFn = std::function<CaptureResult(const std::string &)>;

    /**
     * @brief Variable lookup and ${...} substitution for one invocation.
     *
     * Lookup order: overrides, declared variables, built-ins, process environment.
     * Derived variables run their command on first use only; the result (or the
     * failure) is memoized behind a per-variable once flag, so concurrent workers
     * never run the same capture twice.
     *
     * Overrides, built-ins and positional arguments must be set before the
     * environment is shared between threads.
     */
    class Environment {
    public:
        explicit Environment(const std::vector<Variable> &variables = {}, CaptureFn capture = capture_shell);

        void set_override(const std::string &name, const std::string &value);

        void set_builtin(const std::string &name, const std::string &value);

        // Values for ${1}, ${2}, ...
        void set_positional(std::vector<std::string> args);

        // When disabled, the process environment is not consulted.
        void use_process_environment(bool enabled) { use_process_env_ = enabled; }

        [[nodiscard]] bool defines(const std::string &name) const;

        // Throws VariableResolutionError when the name is unknown, a capture fails,
        // or the value refers back to itself.
        std::string resolve(const std::string &name);

        // Replace every ${NAME} / ${N} token; $${NAME} yields a literal ${NAME}.
        std::string expand(const std::string &text);

        // Name/value pairs of the exported variables, resolved.
        EnvPairs exports();

        // Exports for one command line (before substitution): literal exports always,
        // derived exports only when the line mentions $NAME or ${NAME}, so an
        // unreferenced capture never runs.
        EnvPairs exports_for(const std::string &command);

    private:
        struct Slot {
            std::once_flag once;
            std::string value;
            std::exception_ptr error;
        };

        std::string resolve_impl(const std::string &name, std::vector<std::string> &stack);

        std::string expand_impl(const std::string &text, std::vector<std::string> &stack);

        std::string run_capture(const Variable &var, std::vector<std::string> &stack);

        CaptureFn capture_;
        std::unordered_map<std::string, Variable> variables_;
        std::vector<std::string> export_order_;
        std::unordered_map<std::string, std::string> overrides_;
        std::unordered_map<std::string, std::string> builtins_;
        std::vector<std::string> positional_;
        // One slot per derived variable, created up front; the map itself is never
        // modified afterwards.
        std::unordered_map<std::string, std::unique_ptr<Slot> > slots_;
        bool use_process_env_ = true;
    };
} // namespace keel
