#include "keel/Console.hpp"

#include <ostream>
#include <unistd.h>
#include <sys/ioctl.h>

using namespace keel;

Console::Console(std::ostream &log, const bool color, const bool quiet)
    : log_(log), color_(color), quiet_(quiet) {
}

bool Console::is_terminal(const int fd) {
    return isatty(fd) == 1;
}

int Console::terminal_width(const int fd) {
    winsize w{};
    if (ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) return w.ws_col;
    return 80;
}

void Console::status(const std::string &msg, const std::string &status, const bool error) {
    if (quiet_) return;
    const int term_width = terminal_width(STDOUT_FILENO);

    // Stars (green), brackets (white), status (green/red)
    std::string star = "*";
    std::string open = "[";
    std::string close = "]";
    std::string text = status;
    if (color_) {
        star = "\033[32m*\033[0m";
        open = "\033[37m[\033[0m";
        close = "\033[37m]\033[0m";
        text = error ? "\033[31;1m" + status + "\033[0m" : "\033[32;1m" + status + "\033[0m";
    }
    const int msg_display_len = 3 + static_cast<int>(msg.length());
    int padding = term_width - msg_display_len - 5 - static_cast<int>(status.length());
    if (padding < 1) padding = 1;

    std::lock_guard lock(mutex_);
    log_ << " " << star << " " << msg << std::string(static_cast<size_t>(padding), ' ')
         << " " << open << " " << text << " " << close << std::endl;
}

void Console::command(const std::string &cmd) {
    std::lock_guard lock(mutex_);
    log_ << cmd << std::endl;
}

void Console::note(const std::string &msg) {
    if (quiet_) return;
    std::lock_guard lock(mutex_);
    if (color_) log_ << "\033[1m" << msg << "\033[0m" << std::endl;
    else log_ << msg << std::endl;
}
