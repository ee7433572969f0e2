#include "core/downloader/Errors.hpp"
#include "core/downloader/IntegrityVerifier.hpp"
#include "utils/HashUtils.hpp"

#include "TestHelpers.hpp"

#include <gtest/gtest.h>

using namespace bulkfetch;
using namespace bulkfetch::core::downloader;

TEST(HashUtilsTest, KnownDigests) {
    EXPECT_EQ(utils::HashUtils::md5String(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(utils::HashUtils::md5String("abc"), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(HashUtilsTest, FileDigestsMatchKnownValues) {
    test::TempDir dir;
    auto file = dir.path() / "abc.txt";
    test::writeFile(file, "abc");

    EXPECT_EQ(utils::HashUtils::md5File(file.string()), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(utils::HashUtils::sha1File(file.string()), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(HashUtilsTest, StreamsFilesLargerThanOneBlock) {
    test::TempDir dir;
    auto file = dir.path() / "big.bin";
    std::string content = test::patternBytes(utils::HashUtils::kBlockSize * 3 + 17);
    test::writeFile(file, content);

    EXPECT_EQ(utils::HashUtils::md5File(file.string()), utils::HashUtils::md5String(content));
}

TEST(HashUtilsTest, MissingFileHasNoDigest) {
    test::TempDir dir;
    EXPECT_FALSE(utils::HashUtils::md5File((dir.path() / "nope").string()).has_value());
}

TEST(IntegrityVerifierTest, MatchIsCaseInsensitive) {
    test::TempDir dir;
    auto file = dir.path() / "abc.txt";
    test::writeFile(file, "abc");

    EXPECT_TRUE(IntegrityVerifier::matches(file, "900150983CD24FB0D6963F7D28E17F72"));
    EXPECT_FALSE(IntegrityVerifier::matches(file, "00000000000000000000000000000000"));
}

TEST(IntegrityVerifierTest, AlgorithmFollowsDigestLength) {
    test::TempDir dir;
    auto file = dir.path() / "abc.txt";
    test::writeFile(file, "abc");

    EXPECT_TRUE(IntegrityVerifier::matches(file, "a9993e364706816aba3e25717850c26c9cd0d89d"));
    EXPECT_TRUE(IntegrityVerifier::matches(
        file, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

TEST(IntegrityVerifierTest, VerifyReportsBothDigests) {
    test::TempDir dir;
    auto file = dir.path() / "abc.txt";
    test::writeFile(file, "abc");

    try {
        IntegrityVerifier::verify(file, "0123456789abcdef0123456789abcdef");
        FAIL() << "expected IntegrityMismatch";
    } catch (const IntegrityMismatch& e) {
        EXPECT_EQ(e.expected(), "0123456789abcdef0123456789abcdef");
        EXPECT_EQ(e.actual(), "900150983cd24fb0d6963f7d28e17f72");
    }
}

TEST(IntegrityVerifierTest, UnreadableFileIsLocalIOError) {
    test::TempDir dir;
    EXPECT_THROW(IntegrityVerifier::digest(dir.path() / "missing.bin", "abc"), LocalIOError);
}
