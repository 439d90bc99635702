#include "keel/Subprocess.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>
#include <sys/wait.h>

extern char **environ;

using namespace keel;

static int decode_status(const int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// waitpid() is interrupted when the orchestrator receives SIGINT; the child gets the
// signal as well, so keep waiting until it is actually gone.
static int wait_child(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decode_status(status);
}

static void flush_parent_streams() {
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);
}

// The process environment with `exports` replacing entries of the same name.
// Built before fork(): the child of a multithreaded parent may only call
// async-signal-safe functions.
static std::vector<std::string> child_environment(const EnvPairs &exports) {
    std::vector<std::string> entries;
    for (char **e = environ; e && *e; ++e) {
        const std::string entry = *e;
        const auto eq = entry.find('=');
        const std::string name = entry.substr(0, eq);
        bool shadowed = false;
        for (const auto &[export_name, value]: exports) {
            if (export_name == name) {
                shadowed = true;
                break;
            }
        }
        if (!shadowed) entries.push_back(entry);
    }
    for (const auto &[name, value]: exports) entries.push_back(name + "=" + value);
    return entries;
}

int keel::run_shell(const std::string &cmd, const EnvPairs &exports) {
    std::vector<std::string> entries = child_environment(exports);
    std::vector<char *> envp;
    envp.reserve(entries.size() + 1);
    for (auto &entry: entries) envp.push_back(entry.data());
    envp.push_back(nullptr);

    flush_parent_streams();
    const pid_t pid = fork();
    if (pid < 0) return -1;
    if (pid == 0) {
        execle("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr), envp.data());
        _exit(127);
    }
    return wait_child(pid);
}

CaptureResult keel::capture_shell(const std::string &cmd) {
    CaptureResult result;
    int fds[2];
    if (pipe(fds) != 0) return result;

    flush_parent_streams();
    const pid_t pid = fork();
    if (pid < 0) {
        close(fds[0]);
        close(fds[1]);
        return result;
    }
    if (pid == 0) {
        close(fds[0]);
        dup2(fds[1], STDOUT_FILENO);
        close(fds[1]);
        execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr));
        _exit(127);
    }
    close(fds[1]);
    char buf[4096];
    for (;;) {
        const ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(fds[0]);
    result.exit_code = wait_child(pid);
    return result;
}
