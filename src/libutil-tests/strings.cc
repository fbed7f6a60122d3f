#include <gtest/gtest.h>

#include "arbor/util/strings.hh"
#include "arbor/util/error.hh"

namespace arbor {

TEST(concatStringsSep, joinsWithSeparator)
{
    ASSERT_EQ(concatStringsSep(",", Strings{}), "");
    ASSERT_EQ(concatStringsSep(",", Strings{"tree"}), "tree");
    ASSERT_EQ(concatStringsSep(", ", Strings{"build", "tree", "image"}), "build, tree, image");
}

TEST(concatStringsSep, keepsEmptyElements)
{
    ASSERT_EQ(concatStringsSep(",", Strings{"", ""}), ",");
    ASSERT_EQ(concatStringsSep("/", std::vector<std::string>{"", "usr", "lib"}), "/usr/lib");
}

TEST(concatStringsSep, setsJoinInOrder)
{
    ASSERT_EQ(concatStringsSep("", StringSet{"c", "a", "b"}), "abc");
}

TEST(tokenizeString, onlySeparatorsGiveNoTokens)
{
    ASSERT_TRUE(tokenizeString<Strings>("").empty());
    ASSERT_TRUE(tokenizeString<Strings>(" \n\t").empty());
}

TEST(tokenizeString, splitsOnAnyWhitespace)
{
    ASSERT_EQ(tokenizeString<Strings>("  foo\tbar\n\nbaz "), (Strings{"foo", "bar", "baz"}));
}

TEST(tokenizeString, customSeparatorsKeepWhitespace)
{
    ASSERT_EQ(
        tokenizeString<std::vector<std::string>>("org.osbuild.rpm:org.osbuild.tar ", ":"),
        (std::vector<std::string>{"org.osbuild.rpm", "org.osbuild.tar "}));
}

TEST(tokenizeString, intoSetDeduplicates)
{
    ASSERT_EQ(tokenizeString<StringSet>("CAP_MKNOD CAP_CHOWN CAP_MKNOD"), (StringSet{"CAP_CHOWN", "CAP_MKNOD"}));
}

TEST(trim, stripsBothEnds)
{
    ASSERT_EQ(trim("  max-jobs = 4\n\t"), "max-jobs = 4");
    ASSERT_EQ(trim(" \n\t "), "");
    ASSERT_EQ(trim("--foo--", "-"), "foo");
}

TEST(chomp, stripsTrailingOnly)
{
    ASSERT_EQ(chomp("  0\n"), "  0");
    ASSERT_EQ(chomp("\n\n"), "");
}

TEST(hasPrefix, matchesLeadingText)
{
    ASSERT_TRUE(hasPrefix("org.osbuild.curl", "org.osbuild."));
    ASSERT_TRUE(hasPrefix("foo", ""));
    ASSERT_FALSE(hasPrefix("foo", "foobar"));
}

TEST(hasSuffix, matchesTrailingText)
{
    ASSERT_TRUE(hasSuffix("org.osbuild.rpm.meta.json", ".meta.json"));
    ASSERT_FALSE(hasSuffix("json", ".meta.json"));
}

TEST(toLower, lowersAsciiLetters)
{
    ASSERT_EQ(toLower("MAX_JOBS-2"), "max_jobs-2");
}

TEST(string2Int, parsesInRange)
{
    ASSERT_EQ(string2Int<unsigned int>("42"), 42u);
    ASSERT_EQ(string2Int<int>("-3"), -3);
}

TEST(string2Int, rejectsMalformedInput)
{
    ASSERT_EQ(string2Int<int>(""), std::nullopt);
    ASSERT_EQ(string2Int<int>("4x"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>("-1"), std::nullopt);
    ASSERT_EQ(string2Int<unsigned int>("99999999999999999999"), std::nullopt);
}

TEST(base64Decode, decodesPaddedAndUnpadded)
{
    ASSERT_EQ(base64Decode(""), "");
    ASSERT_EQ(base64Decode("cXVvZCBlcmF0IGRlbW9uc3RyYW5kdW0="), "quod erat demonstrandum");
    ASSERT_EQ(base64Decode("aGk"), "hi");
}

TEST(base64Decode, ignoresNewlines)
{
    ASSERT_EQ(base64Decode("aGVs\nbG8="), "hello");
}

TEST(base64Decode, rejectsInvalidCharacters)
{
    ASSERT_THROW(base64Decode("aGVs*G8="), Error);
}

} // namespace arbor
