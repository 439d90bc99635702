#pragma once
#include "keel/Environment.hpp"
#include "keel/Registry.hpp"
#include "keel/Release.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace keel {
    // Everything a Keelfile declares. Immutable once loaded.
    struct Project {
        Registry registry;
        std::vector<Variable> variables;
        std::optional<ReleasePipeline> release; // at most one @release block
        std::string default_goal;
        std::vector<std::string> files; // absolute paths of every file read
    };

    class KeelParser {
    public:
        KeelParser();

        // Parsing
        void parse_file(const std::string &path);

        void parse_line(const std::string &line);

        // Rejects unterminated @target / @release blocks.
        void finalize();

        [[nodiscard]] const Project &project() const { return project_; }

        Project take() { return std::move(project_); }

        // ${VAR} expansion against the literal @let values seen so far (used for @include paths).
        [[nodiscard]] std::string expand_literals(const std::string &in, int depth = 0) const;

    private:
        static std::string trim(const std::string &x);

        static bool starts_with(const std::string &s, const std::string &p);

        static bool is_directive(const std::string &s, const std::string &name);

        static std::vector<std::string> split_names(const std::string &src);

        static std::string strip_quotes(std::string x);

        static bool valid_name(const std::string &name);

        // Error with file and line context
        [[noreturn]] void bad(const std::string &msg) const;

        void parse_target_line(const std::string &line);

        void parse_release_line(const std::string &line);

        void open_target(const std::string &rest);

        void open_release(const std::string &rest);

        void close_block();

        void mark_block();

        // TAG, REMOTE and ARTIFACT belong to the @release block.
        void check_not_release_variable(const std::string &name) const;

        // NAME=VALUE or NAME VALUE
        std::pair<std::string, std::string> split_assignment(const std::string &rest, const char *directive) const;

        Project project_;

        // Block context
        std::optional<Target> current_target_;
        std::optional<ReleaseConfig> current_release_;
        std::string block_file_;
        int block_line_ = 0;

        // Parsing context
        int currentLine = 0;
        std::unordered_map<std::string, std::string> literals_;
        std::vector<std::filesystem::path> file_stack;
        std::unordered_set<std::string> include_guard;
        int include_depth = 0;
        const int include_depth_max = 32;
    };

    // parse_file() + finalize()
    Project load_keelfile(const std::string &path);
} // namespace keel
