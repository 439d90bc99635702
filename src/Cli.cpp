#include "keel/Cli.hpp"
#include "keel/Console.hpp"
#include "keel/Environment.hpp"
#include "keel/Errors.hpp"
#include "keel/Executor.hpp"
#include "keel/Help.hpp"
#include "keel/Keelfile.hpp"
#include "keel/Release.hpp"
#include "keel/Resolver.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include <unistd.h>

#ifndef KEEL_VERSION
#define KEEL_VERSION "0.0.0"
#endif

using namespace keel;

namespace {
    Executor *g_executor = nullptr;

    void on_interrupt(int) {
        if (g_executor) g_executor->cancel();
    }

    // Routes SIGINT/SIGTERM to the executor while it runs, then restores the
    // previous handlers. No SA_RESTART: a blocked waitpid() must wake up; the
    // child receives the signal too.
    class InterruptScope {
    public:
        explicit InterruptScope(Executor &executor) {
            g_executor = &executor;
            struct sigaction sa{};
            sa.sa_handler = on_interrupt;
            sigemptyset(&sa.sa_mask);
            sa.sa_flags = 0;
            sigaction(SIGINT, &sa, &old_int_);
            sigaction(SIGTERM, &sa, &old_term_);
        }

        ~InterruptScope() {
            sigaction(SIGINT, &old_int_, nullptr);
            sigaction(SIGTERM, &old_term_, nullptr);
            g_executor = nullptr;
        }

        InterruptScope(const InterruptScope &) = delete;

        InterruptScope &operator=(const InterruptScope &) = delete;

    private:
        struct sigaction old_int_{};
        struct sigaction old_term_{};
    };

    struct Options {
        std::string keelfile = "Keelfile";
        std::string directory;
        std::size_t jobs = 1;
        bool dry_run = false;
        bool show_plan = false;
        bool quiet = false;
        bool help = false;
        bool version = false;
        std::vector<std::string> targets;
        std::vector<std::pair<std::string, std::string> > overrides;
        std::vector<std::string> positional;
    };

    void usage(std::ostream &os) {
        os << _("Usage: keel [options] [target...] [NAME=VALUE...] [-- args...]") << "\n\n"
           << _("Options:") << "\n"
           << "  -f FILE     " << _("read FILE instead of ./Keelfile") << "\n"
           << "  -C DIR      " << _("change to DIR before doing anything") << "\n"
           << "  -j N        " << _("run up to N independent targets at once") << "\n"
           << "  -n          " << _("print the commands without running them") << "\n"
           << "  -q          " << _("no status lines") << "\n"
           << "  --plan      " << _("print the execution plan and exit") << "\n"
           << "  -h, --help  " << _("list the documented targets") << "\n"
           << "  --version   " << _("print the keel version") << "\n";
    }

    bool parse_jobs(const std::string &s, std::size_t &out) {
        char *end = nullptr;
        const unsigned long v = std::strtoul(s.c_str(), &end, 10);
        if (s.empty() || *end != '\0' || v == 0) return false;
        out = static_cast<std::size_t>(v);
        return true;
    }

    // Returns false on a usage error (already reported).
    bool parse_args(const int argc, char **argv, Options &opt, std::ostream &err) {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            auto value = [&](const char *flag) -> const char * {
                if (i + 1 >= argc) {
                    err << "keel: " << flag << " " << _("expects an argument") << "\n";
                    return nullptr;
                }
                return argv[++i];
            };
            if (arg == "--") {
                for (++i; i < argc; ++i) opt.positional.emplace_back(argv[i]);
                break;
            }
            if (arg == "-h" || arg == "--help") opt.help = true;
            else if (arg == "--version") opt.version = true;
            else if (arg == "-n" || arg == "--dry-run") opt.dry_run = true;
            else if (arg == "-q" || arg == "--quiet") opt.quiet = true;
            else if (arg == "--plan") opt.show_plan = true;
            else if (arg == "-f") {
                const char *v = value("-f");
                if (!v) return false;
                opt.keelfile = v;
            } else if (arg == "-C") {
                const char *v = value("-C");
                if (!v) return false;
                opt.directory = v;
            } else if (arg.rfind("-j", 0) == 0) {
                std::string n = arg.substr(2);
                if (n.empty()) {
                    const char *v = value("-j");
                    if (!v) return false;
                    n = v;
                }
                if (!parse_jobs(n, opt.jobs)) {
                    err << "keel: " << _("invalid job count") << ": " << n << "\n";
                    return false;
                }
            } else if (!arg.empty() && arg[0] == '-') {
                err << "keel: " << _("unknown option") << ": " << arg << "\n";
                return false;
            } else if (const auto eq = arg.find('='); eq != std::string::npos && eq > 0) {
                opt.overrides.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
            } else {
                opt.targets.push_back(arg);
            }
        }
        return true;
    }

    std::string self_path(const char *argv0) {
        std::error_code ec;
        const auto p = std::filesystem::canonical("/proc/self/exe", ec);
        if (!ec) return p.string();
        return argv0 ? argv0 : "keel";
    }

    void report_failure(const ExecutionReport &report, std::ostream &err) {
        if (report.status == ExecutionReport::Status::Cancelled) {
            err << "keel: *** " << _("interrupted");
            if (!report.failed_target.empty()) err << " [" << report.failed_target << "]";
            err << std::endl;
            return;
        }
        err << "keel: *** [" << report.failed_target << "] " << _("command failed with exit code") << " "
            << report.exit_code << ": " << report.failed_command << std::endl;
    }

    int run_project(const Options &options, const char *argv0, std::ostream &out, std::ostream &err,
                    const bool color) {
        Options opt = options;
        Project project = load_keelfile(opt.keelfile);

        if (opt.help) {
            out << render_help(project.registry, HelpStyle{30, color});
            return 0;
        }
        if (opt.targets.empty()) {
            if (project.default_goal.empty()) opt.targets.emplace_back("help");
            else opt.targets.push_back(project.default_goal);
        }
        // "help" always prints the help, even when a Keelfile documents a target of that name.
        std::vector<std::string> requested;
        bool want_help = false;
        for (const auto &t: opt.targets) {
            if (t == "help") want_help = true;
            else requested.push_back(t);
        }
        if (want_help) out << render_help(project.registry, HelpStyle{30, color});
        if (requested.empty()) return 0;

        Environment env(project.variables);
        env.set_builtin("KEEL", self_path(argv0));
        env.set_builtin("KEELFILE", project.files.empty() ? opt.keelfile : project.files.front());
        for (const auto &[name, value]: opt.overrides) env.set_override(name, value);
        env.set_positional(opt.positional);

        const Resolver resolver(project.registry);
        const ExecutionPlan plan = resolver.plan(requested);
        if (opt.show_plan) {
            out << render_plan(plan);
            return 0;
        }

        Console console(out, color, opt.quiet);
        Executor executor(project.registry, env, console, ExecutorOptions{opt.jobs, opt.dry_run});
        ExecutionReport report;
        {
            InterruptScope interrupts(executor);
            if (project.release && project.release->involves(plan)) {
                ReleasePipeline &release = *project.release;
                release.set_listener([&console](const ReleaseState from, const ReleaseState to) {
                    console.note(std::string("=== release: ") + to_string(from) + " -> " + to_string(to));
                });
                report = release.run(executor, env, plan);
                if (!report.ok()) {
                    err << "keel: " << _("release stopped after state") << " "
                        << to_string(release.last_reached()) << std::endl;
                }
            } else {
                report = executor.execute(plan);
            }
        }

        if (report.ok()) return 0;
        report_failure(report, err);
        if (report.status == ExecutionReport::Status::Cancelled) return kExitInterrupted;
        return report.exit_code > 0 ? report.exit_code : 1;
    }
} // namespace

int keel::run_cli(const int argc, char **argv, std::ostream &out, std::ostream &err, const bool color) {
    Options opt;
    if (!parse_args(argc, argv, opt, err)) {
        usage(err);
        return kExitUsage;
    }
    if (opt.version) {
        out << "keel " << KEEL_VERSION << std::endl;
        return 0;
    }
    if (!opt.directory.empty() && chdir(opt.directory.c_str()) != 0) {
        err << "keel: " << _("cannot change to directory") << " " << opt.directory << std::endl;
        return kExitUsage;
    }

    try {
        return run_project(opt, argc > 0 ? argv[0] : nullptr, out, err, color);
    } catch (const Error &e) {
        err << "keel: *** " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::filesystem::filesystem_error &e) {
        err << "keel: *** " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::exception &e) {
        err << "keel: *** " << _("internal error") << ": " << e.what() << std::endl;
        return kExitInternal;
    }
}
