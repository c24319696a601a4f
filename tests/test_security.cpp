#include <gtest/gtest.h>
#include "security.hpp"
#include "test_util.hpp"

namespace {
// SHA-256("abc") from FIPS 180-2
const char* kAbcDigest = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char* kEmptyDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

TEST(Security, Sha256KnownVectors) {
    EXPECT_EQ(security::sha256_hex("abc"), kAbcDigest);
    EXPECT_EQ(security::sha256_hex(""), kEmptyDigest);
}

TEST(Security, IncrementalMatchesOneShot) {
    security::Sha256 hasher;
    hasher.update("a", 1);
    hasher.update("bc", 2);
    EXPECT_EQ(hasher.finish(), kAbcDigest);
    EXPECT_THROW(hasher.update("x", 1), std::logic_error);
}

TEST(Security, FileDigest) {
    testutil::TempDir dir;
    testutil::write_file(dir.file("abc.bin"), "abc");
    auto digest = security::sha256_file(dir.file("abc.bin"));
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, kAbcDigest);
    EXPECT_FALSE(security::sha256_file(dir.file("missing.bin")).has_value());
}

TEST(Security, DigestComparisonIgnoresCase) {
    std::string upper = kAbcDigest;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_TRUE(security::digest_equals(kAbcDigest, upper));
    EXPECT_FALSE(security::digest_equals(kAbcDigest, kEmptyDigest));
    EXPECT_FALSE(security::digest_equals(kAbcDigest, "ba78"));
}

TEST(Security, SanitizeKeepsPlainNames) {
    EXPECT_EQ(security::sanitize_filename("data_01.csv").value(), "data_01.csv");
    EXPECT_EQ(security::sanitize_filename("my file.txt").value(), "my file.txt");
}

TEST(Security, SanitizeStripsTraversal) {
    EXPECT_EQ(security::sanitize_filename("../../etc/passwd").value(), "passwd");
    EXPECT_EQ(security::sanitize_filename("/abs/path/x.bin").value(), "x.bin");
    EXPECT_EQ(security::sanitize_filename("..\\..\\win.ini").value(), "win.ini");
    EXPECT_EQ(security::sanitize_filename("C:evil.txt").value(), "Cevil.txt");
    EXPECT_EQ(security::sanitize_filename(std::string("a\0b\nc", 5)).value(), "abc");
}

TEST(Security, SanitizeRejectsEmptyResults) {
    EXPECT_FALSE(security::sanitize_filename("").has_value());
    EXPECT_FALSE(security::sanitize_filename("..").has_value());
    EXPECT_FALSE(security::sanitize_filename(".").has_value());
    EXPECT_FALSE(security::sanitize_filename("dir/").has_value());
    EXPECT_FALSE(security::sanitize_filename("  ").has_value());
}
