#pragma once
#include <iosfwd>
#include <mutex>
#include <string>

namespace keel {
    /**
     * @brief Serialized writer for the orchestrator's own output.
     *
     * Subprocesses write straight to the inherited descriptors; only status lines,
     * command echo and notes go through here. All writes take the same lock so
     * parallel workers never split each other's lines.
     */
    class Console {
    public:
        /**
         * @param log   Destination stream.
         * @param color Emit ANSI colors (the CLI enables this when stdout is a terminal).
         * @param quiet Drop status lines and notes; command echo is still written.
         */
        explicit Console(std::ostream &log, bool color = false, bool quiet = false);

        /**
         * @brief OpenRC style status line: ` * msg ........ [ ok ]`.
         * The bracketed block is right-aligned on the terminal width (80 when unknown).
         */
        void status(const std::string &msg, const std::string &status, bool error = false);

        // Echo a command line before it runs.
        void command(const std::string &cmd);

        void note(const std::string &msg);

        [[nodiscard]] bool color() const { return color_; }

        [[nodiscard]] static bool is_terminal(int fd);

        [[nodiscard]] static int terminal_width(int fd);

    private:
        std::ostream &log_;
        bool color_;
        bool quiet_;
        std::mutex mutex_;
    };
} // namespace keel
