#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "arbor/util/file-system.hh"
#include "arbor/util/hash.hh"

namespace arbor {

/* ----------------------------------------------------------------------------
 * hashString
 * --------------------------------------------------------------------------*/

TEST(hashString, testKnownSHA256Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abc";

    auto hash = hashString(HashAlgorithm::SHA256, s);
    ASSERT_EQ(hash.to_string(), "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hashString, testKnownSHA256Hashes2)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

    auto hash = hashString(HashAlgorithm::SHA256, s);
    ASSERT_EQ(hash.to_string(), "sha256:248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(hashString, testKnownSHA512Hashes1)
{
    // values taken from: https://tools.ietf.org/html/rfc4634
    auto s = "abc";

    auto hash = hashString(HashAlgorithm::SHA512, s);
    ASSERT_EQ(
        hash.to_string(),
        "sha512:ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
        "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(hashString, emptyString)
{
    ASSERT_EQ(
        hashString(HashAlgorithm::SHA256, "").to_string(false),
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

/* ----------------------------------------------------------------------------
 * Hash::parsePrefixed
 * --------------------------------------------------------------------------*/

TEST(parsePrefixed, acceptsAlgoPrefix)
{
    auto hash = Hash::parsePrefixed("sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    ASSERT_EQ(hash, hashString(HashAlgorithm::SHA256, "abc"));
    ASSERT_EQ(hash.algo, HashAlgorithm::SHA256);
}

TEST(parsePrefixed, acceptsUpperCaseHex)
{
    auto hash = Hash::parsePrefixed("sha256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    ASSERT_EQ(hash, hashString(HashAlgorithm::SHA256, "abc"));
}

TEST(parsePrefixed, rejectsMissingAlgo)
{
    ASSERT_THROW(Hash::parsePrefixed("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"), BadHash);
}

TEST(parsePrefixed, rejectsUnknownAlgo)
{
    ASSERT_THROW(Hash::parsePrefixed("md5:900150983cd24fb0d6963f7d28e17f72"), BadHash);
}

TEST(parsePrefixed, rejectsWrongLength)
{
    ASSERT_THROW(Hash::parsePrefixed("sha256:ba7816bf"), BadHash);
}

TEST(parsePrefixed, rejectsNonHexDigits)
{
    ASSERT_THROW(
        Hash::parsePrefixed("sha256:zz7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"), BadHash);
}

/* ----------------------------------------------------------------------------
 * hashFile / HashSink
 * --------------------------------------------------------------------------*/

TEST(hashFile, matchesHashString)
{
    auto tmpDir = createTempDir();
    AutoDelete delTmpDir(tmpDir, true);

    writeFile(tmpDir + "/file", "abc");

    ASSERT_EQ(hashFile(HashAlgorithm::SHA256, tmpDir + "/file"), hashString(HashAlgorithm::SHA256, "abc"));
}

TEST(HashSink, incrementalEqualsWhole)
{
    HashSink sink(HashAlgorithm::SHA256);
    sink("ab");
    sink("");
    sink("c");

    ASSERT_EQ(sink.finish(), hashString(HashAlgorithm::SHA256, "abc"));
}

RC_GTEST_PROP(Hash, hexRepresentationParsesBack, (const std::string & s))
{
    auto hash = hashString(HashAlgorithm::SHA256, s);
    RC_ASSERT(Hash::parseHex(hash.to_string(false), HashAlgorithm::SHA256) == hash);
}

} // namespace arbor
