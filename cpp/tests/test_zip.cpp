#include "b64unpack/archive.hpp"
#include "b64unpack/base64.hpp"
#include "b64unpack/errors.hpp"
#include "b64unpack/zip_reader.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace b64unpack {
namespace {

namespace fs = std::filesystem;

using archive::EntryKind;
using archive::EntryStatus;
using archive::ExtractOptions;
using archive::ResultStatus;
using format::FormatTag;
using testing::Bytes;

ErrorKind ExtractError(const Bytes& payload, const fs::path& out, const ExtractOptions& options = {}) {
    try {
        archive::Extract(payload, FormatTag::Zip, out, options);
    } catch (const Error& err) {
        return err.kind();
    }
    ADD_FAILURE() << "expected extraction to fail";
    return ErrorKind::IoError;
}

ExtractOptions WithPassword(const std::string& password) {
    ExtractOptions options;
    options.password = password;
    return options;
}

TEST(ZipExtractTest, ExtractsStoredAndDeflatedEntries) {
    Bytes zip = testing::ZipBuilder()
                    .AddDirectory("docs/")
                    .AddStored("docs/a.txt", "alpha")
                    .AddDeflated("docs/b.txt", std::string(1000, 'b'))
                    .AddDeflated("top.txt", "top level")
                    .Finish();
    testing::TempDir dir;
    auto out = dir.path() / "extracted";
    auto result = archive::Extract(zip, FormatTag::Zip, out, {});

    EXPECT_EQ(result.status, ResultStatus::Extracted);
    ASSERT_EQ(result.entries.size(), 4u);
    EXPECT_EQ(result.entries[0].entry.kind, EntryKind::Directory);
    auto files = testing::ListFiles(out);
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(testing::ReadText(out / "docs" / "a.txt"), "alpha");
    EXPECT_EQ(files["docs/b.txt"], 1000u);
    EXPECT_EQ(testing::ReadText(out / "top.txt"), "top level");
    EXPECT_EQ(result.total_bytes, 5u + 1000u + 9u);
}

TEST(ZipExtractTest, ReadsZip64Records) {
    Bytes zip = testing::ZipBuilder()
                    .AddStored("z64/stored.txt", "sixty-four")
                    .AddDeflated("z64/deflated.txt", std::string(300, 'q'))
                    .Finish(true);
    testing::TempDir dir;
    auto result = archive::Extract(zip, FormatTag::Zip, dir.path(), {});
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].entry.size, 300u);
    EXPECT_EQ(testing::ReadText(dir.path() / "z64" / "stored.txt"), "sixty-four");
    EXPECT_EQ(testing::ListFiles(dir.path())["z64/deflated.txt"], 300u);
}

TEST(ZipExtractTest, Bzip2AndXzMethods) {
    Bytes plain = testing::ToBytes(std::string(2000, 'm') + "tail");
    Bytes zip = testing::ZipBuilder()
                    .AddRaw("bz.txt", 12, 0, testing::Crc32(plain), testing::Bzip2Compress(plain), plain.size())
                    .AddRaw("xz.txt", 95, 0, testing::Crc32(plain), testing::XzCompress(plain), plain.size())
                    .Finish();
    testing::TempDir dir;
    archive::Extract(zip, FormatTag::Zip, dir.path(), {});
    EXPECT_EQ(testing::ReadText(dir.path() / "bz.txt"), testing::ToString(plain));
    EXPECT_EQ(testing::ReadText(dir.path() / "xz.txt"), testing::ToString(plain));
}

TEST(ZipReaderTest, ReaderOwnsItsPayload) {
    archive::ZipReader reader(testing::ZipBuilder().AddStored("a.txt", "hello").Finish(), "");
    auto entries = reader.ListEntries();
    ASSERT_EQ(entries.size(), 1u);
    path_guard::SizeBudget budget(1024);
    EXPECT_EQ(testing::ToString(reader.ReadEntry(entries[0], budget)), "hello");
    EXPECT_EQ(budget.Used(), 5u);
}

TEST(ZipExtractTest, FailedReextractionRestoresExistingFiles) {
    testing::TempDir dir;
    archive::Extract(testing::ZipBuilder().AddStored("keep.txt", "original").Finish(), FormatTag::Zip,
                     dir.path(), {});

    Bytes second = testing::ZipBuilder()
                       .AddStored("keep.txt", "replaced")
                       .AddStored("fresh.txt", "new file")
                       .AddStored("big.bin", std::string(4096, 'x'))
                       .Finish();
    ExtractOptions options;
    options.limits.max_total_bytes = 1024;
    EXPECT_EQ(ExtractError(second, dir.path(), options), ErrorKind::SizeLimitExceeded);

    auto files = testing::ListFiles(dir.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(testing::ReadText(dir.path() / "keep.txt"), "original");
}

TEST(ZipExtractTest, SuccessfulReextractionLeavesNoBackups) {
    testing::TempDir dir;
    archive::Extract(testing::ZipBuilder().AddStored("keep.txt", "original").Finish(), FormatTag::Zip,
                     dir.path(), {});
    archive::Extract(testing::ZipBuilder().AddStored("keep.txt", "replaced").Finish(), FormatTag::Zip,
                     dir.path(), {});
    auto files = testing::ListFiles(dir.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(testing::ReadText(dir.path() / "keep.txt"), "replaced");
}

TEST(ZipExtractTest, TruncatedLocalHeaderIsCorrupt) {
    Bytes payload = base64::DecodePayload("UEsDBBQAAAAIAA==");
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(payload, dir.path()), ErrorKind::CorruptArchive);
    EXPECT_TRUE(testing::ListFiles(dir.path()).empty());
}

TEST(ZipExtractTest, EmptyZipHasNoEntries) {
    testing::TempDir dir;
    auto result = archive::Extract(testing::ZipBuilder().Finish(), FormatTag::Zip, dir.path(), {});
    EXPECT_TRUE(result.entries.empty());
    EXPECT_TRUE(testing::ListFiles(dir.path()).empty());
}

TEST(ZipExtractTest, ForcedZipOnOtherBytesIsFormatMismatch) {
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(testing::ToBytes("this is plainly not a zip file at all"), dir.path()),
              ErrorKind::FormatMismatch);
}

TEST(ZipExtractTest, TraversalEntryWritesNothing) {
    Bytes zip = testing::ZipBuilder()
                    .AddStored("ok.txt", "fine")
                    .AddStored("../../etc/passwd", "root")
                    .Finish();
    testing::TempDir dir;
    auto out = dir.path() / "extracted";
    EXPECT_EQ(ExtractError(zip, out), ErrorKind::PathTraversal);
    EXPECT_TRUE(testing::IsEmptyDirectory(out));
}

TEST(ZipExtractTest, BackslashTraversalIsRejected) {
    Bytes zip = testing::ZipBuilder().AddStored("..\\evil.txt", "x").Finish();
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(zip, dir.path()), ErrorKind::PathTraversal);
}

TEST(ZipExtractTest, SymlinkEntriesAreSkipped) {
    Bytes zip = testing::ZipBuilder()
                    .AddStored("real.txt", "data")
                    .AddSymlink("link", "/etc/passwd")
                    .Finish();
    testing::TempDir dir;
    auto result = archive::Extract(zip, FormatTag::Zip, dir.path(), {});
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_EQ(result.entries[1].status, EntryStatus::Skipped);
    EXPECT_EQ(result.entries[1].entry.note, "symbolic link");
    auto files = testing::ListFiles(dir.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_FALSE(fs::exists(fs::symlink_status(dir.path() / "link")));
}

TEST(ZipExtractTest, CrcMismatchIsCorrupt) {
    Bytes data = testing::ToBytes("payload");
    Bytes zip = testing::ZipBuilder().AddRaw("bad.txt", 0, 0, testing::Crc32(data) ^ 1u, data, data.size()).Finish();
    testing::TempDir dir;
    auto out = dir.path() / "extracted";
    EXPECT_EQ(ExtractError(zip, out), ErrorKind::CorruptArchive);
    EXPECT_TRUE(testing::ListFiles(out).empty());
}

TEST(ZipExtractTest, UnknownMethodIsUnsupported) {
    Bytes data = testing::ToBytes("ppmd bytes");
    Bytes zip = testing::ZipBuilder().AddRaw("x.bin", 98, 0, testing::Crc32(data), data, data.size()).Finish();
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(zip, dir.path()), ErrorKind::UnsupportedFormat);
}

TEST(ZipExtractTest, StrongEncryptionIsUnsupported) {
    Bytes data = testing::ToBytes("opaque");
    Bytes zip = testing::ZipBuilder().AddRaw("s.bin", 0, 0x0041, 0, data, data.size()).Finish();
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(zip, dir.path(), WithPassword("pw")), ErrorKind::UnsupportedFormat);
}

TEST(ZipExtractTest, EncryptedEntryWithoutPasswordWritesNothing) {
    Bytes zip = testing::ZipBuilder()
                    .AddStored("public.txt", "hello")
                    .AddTraditional("secret.txt", "classified", "hunter2")
                    .Finish();
    testing::TempDir dir;
    auto out = dir.path() / "extracted";
    EXPECT_EQ(ExtractError(zip, out), ErrorKind::PasswordRequired);
    EXPECT_TRUE(testing::IsEmptyDirectory(out));
}

TEST(ZipExtractTest, TraditionalEncryptionRoundTrip) {
    Bytes zip = testing::ZipBuilder().AddTraditional("secret.txt", "classified contents", "hunter2").Finish();
    testing::TempDir dir;
    auto result = archive::Extract(zip, FormatTag::Zip, dir.path(), WithPassword("hunter2"));
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_TRUE(result.entries[0].entry.encrypted);
    EXPECT_EQ(testing::ReadText(dir.path() / "secret.txt"), "classified contents");
}

TEST(ZipExtractTest, TraditionalEncryptionWrongPassword) {
    Bytes zip = testing::ZipBuilder().AddTraditional("secret.txt", "classified contents", "hunter2").Finish();
    testing::TempDir dir;
    auto out = dir.path() / "extracted";
    EXPECT_EQ(ExtractError(zip, out, WithPassword("letmein")), ErrorKind::PasswordIncorrect);
    EXPECT_TRUE(testing::ListFiles(out).empty());
}

TEST(ZipExtractTest, AesEncryptionRoundTrip) {
    for (std::uint8_t strength : {1, 2, 3}) {
        for (std::uint16_t version : {1, 2}) {
            Bytes zip = testing::ZipBuilder()
                            .AddAes("vault/aes.txt", "aes protected text", "correct horse", strength, version)
                            .Finish();
            testing::TempDir dir;
            archive::Extract(zip, FormatTag::Zip, dir.path(), WithPassword("correct horse"));
            EXPECT_EQ(testing::ReadText(dir.path() / "vault" / "aes.txt"), "aes protected text")
                << "strength " << int(strength) << " AE-" << version;
        }
    }
}

TEST(ZipExtractTest, AesEncryptionWrongPassword) {
    Bytes zip = testing::ZipBuilder().AddAes("aes.txt", "aes protected text", "correct horse").Finish();
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(zip, dir.path(), WithPassword("battery staple")), ErrorKind::PasswordIncorrect);
    EXPECT_EQ(ExtractError(zip, dir.path()), ErrorKind::PasswordRequired);
}

TEST(ZipExtractTest, AesTamperedCiphertextFailsAuthentication) {
    Bytes zip = testing::ZipBuilder().AddAes("aes.txt", "aes protected text", "correct horse").Finish();
    // Local header (30) + name (7) + AES extra (11) + salt (16) + verifier (2).
    zip[30 + 7 + 11 + 16 + 2] ^= 0x01;
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(zip, dir.path(), WithPassword("correct horse")), ErrorKind::CorruptArchive);
}

TEST(ZipExtractTest, AnalyzeOnlyListsEncryptedEntriesWithoutPassword) {
    Bytes zip = testing::ZipBuilder()
                    .AddStored("public.txt", "hello")
                    .AddTraditional("secret.txt", "classified", "hunter2")
                    .Finish();
    ExtractOptions options;
    options.analyze_only = true;
    testing::TempDir dir;
    auto out = dir.path() / "extracted";
    auto result = archive::Extract(zip, FormatTag::Zip, out, options);
    EXPECT_EQ(result.status, ResultStatus::Analyzed);
    ASSERT_EQ(result.entries.size(), 2u);
    EXPECT_TRUE(result.entries[1].entry.encrypted);
    EXPECT_EQ(result.entries[1].entry.size, 10u);
    EXPECT_FALSE(fs::exists(out));
}

TEST(ZipExtractTest, DeflateBombHitsSizeCeiling) {
    Bytes zip = testing::ZipBuilder()
                    .AddDeflated("small.txt", "ok")
                    .AddDeflated("bomb.bin", std::string(8u << 20, '\0'))
                    .Finish();
    ExtractOptions options;
    options.limits.max_total_bytes = 1u << 20;
    testing::TempDir dir;
    auto out = dir.path() / "extracted";
    EXPECT_EQ(ExtractError(zip, out, options), ErrorKind::SizeLimitExceeded);
    EXPECT_TRUE(testing::ListFiles(out).empty());
}

TEST(ZipExtractTest, StoredEntryHitsSizeCeiling) {
    Bytes zip = testing::ZipBuilder().AddStored("big.txt", std::string(4096, 's')).Finish();
    ExtractOptions options;
    options.limits.max_total_bytes = 1024;
    testing::TempDir dir;
    EXPECT_EQ(ExtractError(zip, dir.path(), options), ErrorKind::SizeLimitExceeded);
}

TEST(ZipExtractTest, DuplicateEntriesOverwrite) {
    Bytes zip = testing::ZipBuilder().AddStored("dup.txt", "first").AddStored("dup.txt", "second").Finish();
    testing::TempDir dir;
    archive::Extract(zip, FormatTag::Zip, dir.path(), {});
    EXPECT_EQ(testing::ReadText(dir.path() / "dup.txt"), "second");
}

}  // namespace
}  // namespace b64unpack
