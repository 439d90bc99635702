#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace keel {
    struct Command {
        std::string text;             // shell command line, before substitution
        bool suppress_failure = false; // non-zero exit is discarded
        bool silent = false;          // not echoed before running
        bool expand = true;           // ${...} substitution applies
    };

    struct Target {
        std::string name;
        std::vector<std::string> prerequisites;
        std::vector<Command> commands;
        std::optional<std::string> description; // absent = internal target
        bool always_run = true;                 // no produced file gates execution
    };

    struct HelpEntry {
        enum class Kind { Section, Target };

        Kind kind = Kind::Target;
        std::string name; // section title for Kind::Section
        std::string description;
    };

    /**
     * @brief Declared targets, in declaration order, plus help section headers.
     */
    class Registry {
    public:
        // Throws DuplicateTargetError when the name is taken.
        void add(Target target);

        // Section headers only group the help output; they are not targets.
        void add_section(const std::string &title);

        // Throws UnknownTargetError.
        [[nodiscard]] const Target &find(const std::string &name) const;

        [[nodiscard]] bool contains(const std::string &name) const;

        [[nodiscard]] std::vector<HelpEntry> documented() const;

        [[nodiscard]] const std::vector<Target> &targets() const { return targets_; }

        [[nodiscard]] std::size_t size() const { return targets_.size(); }

    private:
        // Target index, or npos for a section header.
        struct Entry {
            std::size_t target;
            std::string section;
        };

        static constexpr std::size_t npos = static_cast<std::size_t>(-1);

        std::vector<Target> targets_;
        std::vector<Entry> order_;
        std::unordered_map<std::string, std::size_t> index_;
    };
} // namespace keel
