#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>
#include "keel/Environment.hpp"
#include "keel/Errors.hpp"

using namespace keel;

namespace {
    // Fake version command: counts invocations, answers with a fixed output.
    struct CountingCapture {
        std::atomic<int> calls{0};
        CaptureResult answer{0, "1.2.3\n"};

        CaptureFn fn() {
            return [this](const std::string &) {
                ++calls;
                return answer;
            };
        }
    };
} // namespace

TEST(Environment, LiteralResolves) {
    Environment env({Variable::literal("SRC_DIRS", "./tutor ./tests")});
    EXPECT_EQ(env.resolve("SRC_DIRS"), "./tutor ./tests");
    EXPECT_EQ(env.expand("black ${SRC_DIRS}"), "black ./tutor ./tests");
}

TEST(Environment, NestedLiteralsExpandOnResolve) {
    Environment env({
        Variable::literal("OPTS", "--exclude templates ${DIRS}"),
        Variable::literal("DIRS", "a b"),
    });
    EXPECT_EQ(env.resolve("OPTS"), "--exclude templates a b");
}

TEST(Environment, DerivedTrimsTrailingNewline) {
    CountingCapture cap;
    Environment env({Variable::capture("VERSION", "print-version")}, cap.fn());
    EXPECT_EQ(env.resolve("VERSION"), "1.2.3");
}

TEST(Environment, DerivedCapturedOnceForManyReferences) {
    CountingCapture cap;
    Environment env({
        Variable::capture("VERSION", "print-version"),
        Variable::literal("TAG", "v${VERSION}"),
    }, cap.fn());
    EXPECT_EQ(env.expand("twine check dist/pkg-${VERSION}.tar.gz"), "twine check dist/pkg-1.2.3.tar.gz");
    EXPECT_EQ(env.expand("git tag ${TAG}"), "git tag v1.2.3");
    EXPECT_EQ(env.expand("git push origin ${TAG}"), "git push origin v1.2.3");
    EXPECT_EQ(cap.calls.load(), 1);
}

TEST(Environment, DerivedNotEvaluatedUnlessReferenced) {
    CountingCapture cap;
    Environment env({
        Variable::capture("VERSION", "print-version"),
        Variable::literal("SRC", "src"),
    }, cap.fn());
    EXPECT_EQ(env.expand("ls ${SRC}"), "ls src");
    EXPECT_EQ(cap.calls.load(), 0);
}

TEST(Environment, CaptureFailureIsFatalAndNotRetried) {
    CountingCapture cap;
    cap.answer = CaptureResult{1, ""};
    Environment env({Variable::capture("VERSION", "print-version")}, cap.fn());
    EXPECT_THROW((void) env.resolve("VERSION"), VariableResolutionError);
    EXPECT_THROW((void) env.expand("echo ${VERSION}"), VariableResolutionError);
    EXPECT_EQ(cap.calls.load(), 1);
}

TEST(Environment, CaptureCommandIsExpanded) {
    std::string seen;
    Environment env({
        Variable::literal("PY", "python3"),
        Variable::capture("VERSION", "${PY} -c 'print(1)'"),
    }, [&seen](const std::string &cmd) {
        seen = cmd;
        return CaptureResult{0, "1\n"};
    });
    EXPECT_EQ(env.resolve("VERSION"), "1");
    EXPECT_EQ(seen, "python3 -c 'print(1)'");
}

TEST(Environment, UnresolvedTokenThrows) {
    Environment env;
    env.use_process_environment(false);
    EXPECT_THROW((void) env.expand("echo ${NOT_DECLARED_ANYWHERE}"), VariableResolutionError);
}

TEST(Environment, EscapedTokenStaysLiteral) {
    Environment env;
    env.use_process_environment(false);
    EXPECT_EQ(env.expand("echo $${HOME} $$ $(uname -s)"), "echo ${HOME} $$ $(uname -s)");
}

TEST(Environment, OverrideWinsAndSkipsCapture) {
    CountingCapture cap;
    Environment env({Variable::capture("TAG", "compute-tag")}, cap.fn());
    env.set_override("TAG", "v9.9.9");
    EXPECT_EQ(env.resolve("TAG"), "v9.9.9");
    EXPECT_EQ(cap.calls.load(), 0);
}

TEST(Environment, BuiltinsAndProcessEnvironment) {
    Environment env;
    env.set_builtin("KEEL", "/usr/bin/keel");
    setenv("KEEL_TEST_FROM_ENV", "from-env", 1);
    EXPECT_EQ(env.expand("${KEEL} -C docs"), "/usr/bin/keel -C docs");
    EXPECT_EQ(env.resolve("KEEL_TEST_FROM_ENV"), "from-env");
    env.use_process_environment(false);
    EXPECT_FALSE(env.defines("KEEL_TEST_FROM_ENV"));
    unsetenv("KEEL_TEST_FROM_ENV");
}

TEST(Environment, PositionalArguments) {
    Environment env;
    env.set_positional({"first", "second"});
    EXPECT_EQ(env.expand("${1}-${2}"), "first-second");
    EXPECT_TRUE(env.defines("2"));
    EXPECT_FALSE(env.defines("3"));
    EXPECT_THROW((void) env.expand("${3}"), VariableResolutionError);
}

TEST(Environment, RecursiveReferenceThrows) {
    Environment env({
        Variable::literal("A", "x${B}"),
        Variable::literal("B", "y${A}"),
    });
    EXPECT_THROW((void) env.resolve("A"), VariableResolutionError);
}

TEST(Environment, ExportsAreResolvedInDeclarationOrder) {
    Variable a = Variable::literal("PIP_INDEX", "https://example.invalid/simple");
    a.exported = true;
    Variable b = Variable::literal("PROJECT", "tutor-${SUFFIX}");
    b.exported = true;
    Environment env({a, b, Variable::literal("SUFFIX", "openedx")});
    const EnvPairs ex = env.exports();
    ASSERT_EQ(ex.size(), 2u);
    EXPECT_EQ(ex[0].first, "PIP_INDEX");
    EXPECT_EQ(ex[1].second, "tutor-openedx");
}

TEST(Environment, ConcurrentResolveCapturesOnce) {
    std::atomic<int> calls{0};
    Environment env({Variable::capture("VERSION", "slow-version")}, [&calls](const std::string &) {
        ++calls;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return CaptureResult{0, "2.0.0\n"};
    });
    std::vector<std::thread> threads;
    std::vector<std::string> results(8);
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&env, &results, i] { results[i] = env.resolve("VERSION"); });
    }
    for (auto &t: threads) t.join();
    EXPECT_EQ(calls.load(), 1);
    for (const auto &r: results) EXPECT_EQ(r, "2.0.0");
}

TEST(Environment, RealShellCapture) {
    Environment env({Variable::capture("VERSION", "printf '4.5.6\\n\\n'")});
    EXPECT_EQ(env.resolve("VERSION"), "4.5.6");
}

TEST(Environment, RealShellCaptureFailure) {
    Environment env({Variable::capture("VERSION", "exit 4")});
    EXPECT_THROW((void) env.resolve("VERSION"), VariableResolutionError);
}

TEST(Environment, DerivedExportCapturedOnlyWhenMentioned) {
    CountingCapture cap;
    Variable version = Variable::capture("VERSION", "print-version");
    version.exported = true;
    Variable root = Variable::literal("TUTOR_ROOT", "/tmp/tutor");
    root.exported = true;
    Environment env({version, root}, cap.fn());

    EXPECT_EQ(env.exports_for("tutor config save"), (EnvPairs{{"TUTOR_ROOT", "/tmp/tutor"}}));
    EXPECT_EQ(env.exports_for("echo $VERSIONS"), (EnvPairs{{"TUTOR_ROOT", "/tmp/tutor"}}));
    EXPECT_EQ(cap.calls.load(), 0);

    const EnvPairs shell = env.exports_for("git tag \"v$VERSION\"");
    ASSERT_EQ(shell.size(), 2u);
    EXPECT_EQ(shell[0], (std::pair<std::string, std::string>{"VERSION", "1.2.3"}));
    EXPECT_EQ(env.exports_for("echo ${VERSION}").size(), 2u);
    EXPECT_EQ(cap.calls.load(), 1);
}
