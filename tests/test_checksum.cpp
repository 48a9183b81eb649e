#include "checksum.hpp"
#include "test_support.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

namespace
{

const char *ABC_SHA256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
const char *ABC_MD5 = "900150983cd24fb0d6963f7d28e17f72";
const char *ABC_SHA1 = "a9993e364706816aba3e25717850c26c9cd0d89d";

class ChecksumTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        file_ = dir_ / "abc.txt";
        writeFile(file_, "abc");
    }

    TempDir dir_;
    std::filesystem::path file_;
};

} // namespace

TEST_F(ChecksumTest, ComputesKnownDigests)
{
    EXPECT_EQ(ChecksumVerifier::compute(file_, ChecksumVerifier::Algorithm::SHA256), ABC_SHA256);
    EXPECT_EQ(ChecksumVerifier::compute(file_, ChecksumVerifier::Algorithm::MD5), ABC_MD5);
    EXPECT_EQ(ChecksumVerifier::compute(file_, ChecksumVerifier::Algorithm::SHA1), ABC_SHA1);
}

TEST_F(ChecksumTest, VerifyAcceptsMatchAndRejectsMismatch)
{
    EXPECT_TRUE(ChecksumVerifier::verify(file_, std::string("sha256:") + ABC_SHA256));
    EXPECT_FALSE(ChecksumVerifier::verify(
        file_, "sha256:0000000000000000000000000000000000000000000000000000000000000000"));
}

TEST_F(ChecksumTest, VerifyIgnoresCaseAndAlgorithmSpelling)
{
    EXPECT_TRUE(ChecksumVerifier::verify(file_, "SHA-256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"));
    EXPECT_TRUE(ChecksumVerifier::verify(file_, std::string("MD5:") + ABC_MD5));
}

TEST_F(ChecksumTest, ComputeThrowsForMissingFile)
{
    EXPECT_THROW(ChecksumVerifier::compute(dir_ / "missing", ChecksumVerifier::Algorithm::SHA256),
                 std::runtime_error);
}

TEST(ChecksumParseTest, SplitsAlgorithmAndHash)
{
    auto [algorithm, hash] = ChecksumVerifier::parseChecksum(std::string("sha1:") + ABC_SHA1);
    EXPECT_EQ(algorithm, ChecksumVerifier::Algorithm::SHA1);
    EXPECT_EQ(hash, ABC_SHA1);
}

TEST(ChecksumParseTest, RejectsMalformedInput)
{
    EXPECT_THROW(ChecksumVerifier::parseChecksum(ABC_SHA256), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parseChecksum(std::string("crc32:") + ABC_MD5), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parseChecksum("sha256:abc123"), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parseChecksum(std::string("md5:") + ABC_SHA1), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parseChecksum("md5:zz0150983cd24fb0d6963f7d28e17f72"), std::runtime_error);
}

TEST(ChecksumParseTest, RejectsNonAsciiAlgorithmName)
{
    EXPECT_THROW(ChecksumVerifier::parseChecksum(std::string("SH\xC4-256:") + ABC_SHA256), std::runtime_error);
    EXPECT_THROW(ChecksumVerifier::parseChecksum(std::string("\xFF\x80:") + ABC_MD5), std::runtime_error);
}
