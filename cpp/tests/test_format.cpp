#include "b64unpack/base64.hpp"
#include "b64unpack/format.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdio>

namespace b64unpack {
namespace {

using format::FormatTag;
using testing::Bytes;
using testing::ToBytes;

Bytes SampleTar() {
    return testing::TarBuilder().AddDirectory("docs/").AddFile("docs/readme.txt", "hello tar").Finish();
}

TEST(FormatTest, DetectsZipLocalHeader) {
    Bytes zip = testing::ZipBuilder().AddStored("a.txt", "alpha").Finish();
    EXPECT_EQ(format::Sniff(zip), FormatTag::Zip);
}

TEST(FormatTest, TruncatedZipHeaderStillSniffsAsZip) {
    Bytes payload = base64::DecodePayload("UEsDBBQAAAAIAA==");
    EXPECT_EQ(format::Sniff(payload), FormatTag::Zip);
}

TEST(FormatTest, EmptyZipIsRecognisedByEndRecord) {
    Bytes zip = testing::ZipBuilder().Finish();
    EXPECT_EQ(format::Sniff(zip), FormatTag::Zip);
}

TEST(FormatTest, DetectsUstarMagicAtOffset257) {
    Bytes tar = SampleTar();
    ASSERT_TRUE(format::HasUstarMagic(tar));
    EXPECT_EQ(format::Sniff(tar), FormatTag::Tar);
}

TEST(FormatTest, DetectsV7TarByChecksum) {
    Bytes tar = SampleTar();
    // Clear the magic and version, then recompute the header checksum.
    for (std::size_t i = 257; i < 265; ++i) {
        tar[i] = 0;
    }
    unsigned int sum = 0;
    for (std::size_t i = 0; i < 512; ++i) {
        sum += (i >= 148 && i < 156) ? ' ' : tar[i];
    }
    char field[8];
    std::snprintf(field, sizeof(field), "%06o", sum);
    for (std::size_t i = 0; i < 7; ++i) {
        tar[148 + i] = static_cast<std::uint8_t>(field[i]);
    }
    tar[155] = ' ';
    ASSERT_FALSE(format::HasUstarMagic(tar));
    EXPECT_EQ(format::Sniff(tar), FormatTag::Tar);
}

TEST(FormatTest, DetectsCompressedTarVariants) {
    Bytes tar = SampleTar();
    EXPECT_EQ(format::Sniff(testing::GzipCompress(tar)), FormatTag::TarGzip);
    EXPECT_EQ(format::Sniff(testing::Bzip2Compress(tar)), FormatTag::TarBzip2);
    EXPECT_EQ(format::Sniff(testing::XzCompress(tar)), FormatTag::TarXz);
}

TEST(FormatTest, EmptyCompressedTarKeepsItsTag) {
    Bytes empty_tar = testing::TarBuilder().Finish();
    EXPECT_EQ(format::Sniff(testing::GzipCompress(empty_tar)), FormatTag::TarGzip);
    EXPECT_EQ(format::Sniff(testing::Bzip2Compress(empty_tar)), FormatTag::TarBzip2);
    EXPECT_EQ(format::Sniff(testing::XzCompress(empty_tar)), FormatTag::TarXz);
}

TEST(FormatTest, CompressedNonTarIsUnknown) {
    Bytes text = ToBytes("just a compressed note, not an archive");
    EXPECT_EQ(format::Sniff(testing::GzipCompress(text)), FormatTag::Unknown);
    EXPECT_EQ(format::Sniff(testing::Bzip2Compress(text)), FormatTag::Unknown);
    EXPECT_EQ(format::Sniff(testing::XzCompress(text)), FormatTag::Unknown);
}

TEST(FormatTest, UndecodableGzipKeepsItsTag) {
    Bytes gz = testing::GzipCompress(SampleTar());
    gz.resize(12);
    EXPECT_EQ(format::Sniff(gz), FormatTag::TarGzip);
}

TEST(FormatTest, DetectsRarSignature) {
    Bytes rar = ToBytes(std::string("Rar!\x1A\x07\x01\x00", 8));
    rar.resize(64, 0);
    EXPECT_EQ(format::Sniff(rar), FormatTag::Rar);
}

TEST(FormatTest, ArbitraryBytesAreUnknown) {
    EXPECT_EQ(format::Sniff(ToBytes("hello world")), FormatTag::Unknown);
    EXPECT_EQ(format::Sniff(Bytes{}), FormatTag::Unknown);
    EXPECT_EQ(format::Sniff(Bytes(1024, 0)), FormatTag::Unknown);
}

TEST(FormatTest, ForcedTagBypassesSniffing) {
    Bytes text = ToBytes("hello world");
    EXPECT_EQ(format::SniffOrForced(text, FormatTag::Zip), FormatTag::Zip);
    EXPECT_EQ(format::SniffOrForced(text, std::nullopt), FormatTag::Unknown);
}

TEST(FormatTest, ParsesFormatFlags) {
    EXPECT_EQ(format::FormatFromFlag("zip"), FormatTag::Zip);
    EXPECT_EQ(format::FormatFromFlag("TAR"), FormatTag::Tar);
    EXPECT_EQ(format::FormatFromFlag("tgz"), FormatTag::TarGzip);
    EXPECT_EQ(format::FormatFromFlag("tar.gz"), FormatTag::TarGzip);
    EXPECT_EQ(format::FormatFromFlag("tar.bz2"), FormatTag::TarBzip2);
    EXPECT_EQ(format::FormatFromFlag("txz"), FormatTag::TarXz);
    EXPECT_EQ(format::FormatFromFlag("rar"), FormatTag::Rar);
    EXPECT_FALSE(format::FormatFromFlag("7z").has_value());
}

TEST(FormatTest, ArchiveFileNames) {
    EXPECT_EQ(format::ArchiveFileName(FormatTag::Zip), "decoded_archive.zip");
    EXPECT_EQ(format::ArchiveFileName(FormatTag::TarGzip), "decoded_archive.tar.gz");
    EXPECT_EQ(format::ArchiveFileName(FormatTag::Unknown), "decoded_data.bin");
}

}  // namespace
}  // namespace b64unpack
