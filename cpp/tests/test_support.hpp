#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace b64unpack::testing {

using Bytes = std::vector<std::uint8_t>;

Bytes ToBytes(const std::string& text);
std::string ToString(const Bytes& data);

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Relative generic path -> size for every regular file under `root`.
std::map<std::string, std::uint64_t> ListFiles(const std::filesystem::path& root);
bool IsEmptyDirectory(const std::filesystem::path& dir);
std::string ReadText(const std::filesystem::path& path);

class TarBuilder {
public:
    TarBuilder& AddFile(const std::string& name, const std::string& content);
    TarBuilder& AddDirectory(const std::string& name);
    TarBuilder& AddSymlink(const std::string& name, const std::string& target);
    TarBuilder& AddSpecial(const std::string& name, char type);
    TarBuilder& AddGnuLongName(const std::string& name, const std::string& content);
    TarBuilder& AddPaxPath(const std::string& path, const std::string& content);
    Bytes Finish() const;

private:
    void AppendHeader(const std::string& name, std::uint64_t size, char type, const std::string& linkname = {});
    void AppendData(const std::string& data);

    Bytes out_;
};

Bytes GzipCompress(const Bytes& data);
Bytes Bzip2Compress(const Bytes& data);
Bytes XzCompress(const Bytes& data);
Bytes RawDeflate(const Bytes& data);
std::uint32_t Crc32(const Bytes& data);

class ZipBuilder {
public:
    ZipBuilder& AddStored(const std::string& name, const std::string& content);
    ZipBuilder& AddDeflated(const std::string& name, const std::string& content);
    ZipBuilder& AddDirectory(const std::string& name);
    ZipBuilder& AddSymlink(const std::string& name, const std::string& target);
    ZipBuilder& AddTraditional(const std::string& name, const std::string& content, const std::string& password);
    ZipBuilder& AddAes(const std::string& name,
                       const std::string& content,
                       const std::string& password,
                       std::uint8_t strength = 3,
                       std::uint16_t vendor_version = 2);
    // Low-level escape hatch for malformed members.
    ZipBuilder& AddRaw(const std::string& name,
                       std::uint16_t method,
                       std::uint16_t flags,
                       std::uint32_t crc,
                       const Bytes& data,
                       std::uint64_t uncompressed_size,
                       std::uint32_t external_attrs = 0,
                       const Bytes& extra = {});
    // With `zip64`, central sizes/offsets and the end record are written in
    // their ZIP64 forms.
    Bytes Finish(bool zip64 = false) const;

private:
    struct Member {
        std::string name;
        std::uint16_t method = 0;
        std::uint16_t flags = 0;
        std::uint32_t crc = 0;
        std::uint64_t uncompressed_size = 0;
        std::uint32_t external_attrs = 0;
        Bytes extra;
        Bytes data;
    };

    std::vector<Member> members_;
};

}  // namespace b64unpack::testing
