#pragma once
#include <libintl.h>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef KEEL_GETTEXT_DEFINED
#define _(String) gettext(String)
#define KEEL_GETTEXT_DEFINED
#endif

namespace keel {
    // Base of every error that aborts a top-level invocation.
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // A requested target, or a declared prerequisite, is not registered.
    class UnknownTargetError : public Error {
    public:
        explicit UnknownTargetError(const std::string &name, const std::string &required_by = std::string());

        [[nodiscard]] const std::string &target() const { return name_; }

        [[nodiscard]] const std::string &required_by() const { return required_by_; }

    private:
        std::string name_;
        std::string required_by_;
    };

    class DuplicateTargetError : public Error {
    public:
        explicit DuplicateTargetError(const std::string &name);

        [[nodiscard]] const std::string &target() const { return name_; }

    private:
        std::string name_;
    };

    // The cycle is reported as the closed path, e.g. {a, b, a}.
    class CyclicDependencyError : public Error {
    public:
        explicit CyclicDependencyError(std::vector<std::string> cycle);

        [[nodiscard]] const std::vector<std::string> &cycle() const { return cycle_; }

    private:
        std::vector<std::string> cycle_;
    };

    class VariableResolutionError : public Error {
    public:
        VariableResolutionError(const std::string &variable, const std::string &reason);

        [[nodiscard]] const std::string &variable() const { return variable_; }

    private:
        std::string variable_;
    };

    // Keelfile syntax or semantic error, located by file and line.
    class ParseError : public Error {
    public:
        ParseError(const std::string &file, int line, const std::string &msg);

        [[nodiscard]] int line() const { return line_; }

    private:
        int line_;
    };
} // namespace keel
