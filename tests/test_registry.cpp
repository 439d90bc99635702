#include <gtest/gtest.h>
#include "keel/Errors.hpp"
#include "keel/Registry.hpp"

using namespace keel;

namespace {
    Target make_target(const std::string &name, std::vector<std::string> deps = {},
                       std::optional<std::string> desc = std::nullopt) {
        Target t;
        t.name = name;
        t.prerequisites = std::move(deps);
        t.description = std::move(desc);
        return t;
    }
} // namespace

TEST(Registry, AddAndFind) {
    Registry r;
    r.add(make_target("test-unit", {}, "Run unit tests"));
    ASSERT_TRUE(r.contains("test-unit"));
    const Target &t = r.find("test-unit");
    EXPECT_EQ(t.name, "test-unit");
    EXPECT_TRUE(t.always_run);
    EXPECT_EQ(r.size(), 1u);
}

TEST(Registry, DuplicateNameThrows) {
    Registry r;
    r.add(make_target("format"));
    EXPECT_THROW(r.add(make_target("format")), DuplicateTargetError);
    EXPECT_EQ(r.size(), 1u);
}

TEST(Registry, UnknownNameThrows) {
    Registry r;
    r.add(make_target("test"));
    try {
        (void) r.find("tset");
        FAIL() << "expected UnknownTargetError";
    } catch (const UnknownTargetError &e) {
        EXPECT_EQ(e.target(), "tset");
    }
}

TEST(Registry, EmptyTargetIsAllowed) {
    Registry r;
    r.add(make_target("noop"));
    EXPECT_TRUE(r.find("noop").commands.empty());
}

TEST(Registry, DocumentedKeepsDeclarationOrder) {
    Registry r;
    r.add_section("Development");
    r.add(make_target("docs", {}, "Build html documentation"));
    r.add(make_target("release-tag")); // internal
    r.add_section("Deployment");
    r.add(make_target("bundle", {}, "Bundle the package"));

    const auto entries = r.documented();
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].kind, HelpEntry::Kind::Section);
    EXPECT_EQ(entries[0].name, "Development");
    EXPECT_EQ(entries[1].name, "docs");
    EXPECT_EQ(entries[1].description, "Build html documentation");
    EXPECT_EQ(entries[2].kind, HelpEntry::Kind::Section);
    EXPECT_EQ(entries[3].name, "bundle");

    // Section headers are not targets.
    EXPECT_FALSE(r.contains("Development"));
}
