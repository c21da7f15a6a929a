/**
 * bashgate - utility function tests
 *
 * Path normalization and segment-wise containment are what the directory
 * whitelist rests on, so most of the cases live here.
 */

#include <gtest/gtest.h>
#include <bashgate/core/utils.hpp>

using namespace bashgate;

// =============================================================================
// Path normalization
// =============================================================================

TEST(NormalizePathTest, CollapsesDotsAndSlashes) {
    EXPECT_EQ(normalize_path("/home/user/./project//src/"), "/home/user/project/src");
    EXPECT_EQ(normalize_path("/home/user/project/../other"), "/home/user/other");
    EXPECT_EQ(normalize_path("/a/b/c/../../d"), "/a/d");
}

TEST(NormalizePathTest, RootStaysRoot) {
    EXPECT_EQ(normalize_path("/"), "/");
    EXPECT_EQ(normalize_path("//"), "/");
    EXPECT_EQ(normalize_path("/.."), "/");
    EXPECT_EQ(normalize_path("/../../etc"), "/etc");
}

TEST(NormalizePathTest, RelativePathsKeepLeadingParents) {
    EXPECT_EQ(normalize_path("a/./b/"), "a/b");
    EXPECT_EQ(normalize_path("../x"), "../x");
    EXPECT_EQ(normalize_path("a/.."), ".");
}

TEST(AbsolutePathTest, ResolvesAgainstWorkingDirectory) {
    std::string cwd = current_directory();
    EXPECT_EQ(absolute_path("."), normalize_path(cwd));
    EXPECT_EQ(absolute_path("sub/dir"), normalize_path(cwd + "/sub/dir"));
    EXPECT_EQ(absolute_path("/tmp/../var"), "/var");
}

// =============================================================================
// Containment
// =============================================================================

TEST(DescendantTest, SameDirectoryMatches) {
    EXPECT_TRUE(is_same_or_descendant("/home/user", "/home/user"));
}

TEST(DescendantTest, SubdirectoryMatches) {
    EXPECT_TRUE(is_same_or_descendant("/home/user/project", "/home"));
    EXPECT_TRUE(is_same_or_descendant("/home/user/a/b/c", "/home/user"));
}

TEST(DescendantTest, SiblingWithSharedPrefixDoesNotMatch) {
    EXPECT_FALSE(is_same_or_descendant("/home2/x", "/home"));
    EXPECT_FALSE(is_same_or_descendant("/home2", "/home"));
    EXPECT_FALSE(is_same_or_descendant("/homeuser", "/home"));
}

TEST(DescendantTest, ParentDoesNotMatchChild) {
    EXPECT_FALSE(is_same_or_descendant("/home", "/home/user"));
}

TEST(DescendantTest, RootAdmitsEveryAbsolutePath) {
    EXPECT_TRUE(is_same_or_descendant("/", "/"));
    EXPECT_TRUE(is_same_or_descendant("/etc/ssh", "/"));
}

// =============================================================================
// Strings, hashing, ids
// =============================================================================

TEST(StringUtilsTest, TrimAndSplit) {
    EXPECT_EQ(trim("  ls -la \n"), "ls -la");
    EXPECT_EQ(trim("   "), "");

    std::vector<std::string> parts = split("a.b.c", '.');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(join(parts, ", "), "a, b, c");
}

TEST(StringUtilsTest, EscapeControlMakesNewlinesVisible) {
    EXPECT_EQ(escape_control("a\nb"), "a\\nb");
    EXPECT_EQ(escape_control("tab\there"), "tab\\there");
    EXPECT_EQ(escape_control(std::string("\x01", 1)), "\\x01");
}

TEST(HashTest, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex("").size(), 64u);
}

TEST(IdTest, UuidShapeAndUniqueness) {
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    ASSERT_EQ(a.size(), 36u);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(a, b);
    EXPECT_EQ(generate_request_id().size(), 8u);
}

TEST(TimeTest, MonotonicClockDoesNotGoBackwards) {
    int64_t a = monotonic_ms();
    int64_t b = monotonic_ms();
    EXPECT_LE(a, b);
    EXPECT_GT(current_timestamp_ms(), 0);
}
