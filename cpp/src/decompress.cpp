#include "b64unpack/decompress.hpp"

#include "b64unpack/errors.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string>

#include <bzlib.h>
#include <lzma.h>
#include <zlib.h>

namespace b64unpack::decompress {

namespace {

constexpr std::size_t kChunkSize = 1 << 16;

// Output collector shared by the codec loops. In prefix mode it stops
// quietly at the limit instead of throwing.
class Sink {
public:
    Sink(std::uint64_t limit, bool prefix_mode) : limit_(limit), prefix_mode_(prefix_mode) {}

    // Returns false once a prefix-mode sink is full.
    bool Append(const std::uint8_t* data, std::size_t size) {
        if (out_.size() + size > limit_) {
            if (!prefix_mode_) {
                throw Error(ErrorKind::SizeLimitExceeded,
                            "Decompressed data exceeds the limit of " + std::to_string(limit_) + " bytes");
            }
            out_.insert(out_.end(), data, data + static_cast<std::size_t>(limit_ - out_.size()));
            return false;
        }
        out_.insert(out_.end(), data, data + size);
        return out_.size() < limit_ || !prefix_mode_;
    }

    bool Full() const { return prefix_mode_ && out_.size() >= limit_; }
    Bytes Take() { return std::move(out_); }

private:
    std::uint64_t limit_;
    bool prefix_mode_;
    Bytes out_;
};

[[noreturn]] void Corrupt(const std::string& what) {
    throw Error(ErrorKind::CorruptArchive, what);
}

bool HasGzipMagic(const std::uint8_t* data, std::size_t size) {
    return size >= 2 && data[0] == 0x1F && data[1] == 0x8B;
}

bool HasBzip2Magic(const std::uint8_t* data, std::size_t size) {
    return size >= 3 && data[0] == 'B' && data[1] == 'Z' && data[2] == 'h';
}

void RunZlib(const std::uint8_t* data, std::size_t size, int window_bits, bool multi_member, Sink& sink) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) {
        throw Error(ErrorKind::CorruptArchive, "Failed to initialize zlib inflater");
    }
    std::array<std::uint8_t, kChunkSize> out_buf{};
    std::size_t consumed = 0;
    bool finished = false;
    try {
        while (!finished) {
            std::size_t take = std::min<std::size_t>(size - consumed, std::numeric_limits<uInt>::max());
            strm.next_in = const_cast<Bytef*>(data + consumed);
            strm.avail_in = static_cast<uInt>(take);
            strm.next_out = out_buf.data();
            strm.avail_out = static_cast<uInt>(out_buf.size());
            int ret = inflate(&strm, Z_NO_FLUSH);
            consumed += take - strm.avail_in;
            std::size_t produced = out_buf.size() - strm.avail_out;
            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                Corrupt(std::string("Deflate stream is corrupt: ") + (strm.msg ? strm.msg : "inflate failed"));
            }
            if (produced > 0 && !sink.Append(out_buf.data(), produced)) {
                break;
            }
            if (ret == Z_STREAM_END) {
                if (multi_member && HasGzipMagic(data + consumed, size - consumed)) {
                    if (inflateReset(&strm) != Z_OK) {
                        Corrupt("Failed to reset gzip inflater");
                    }
                    continue;
                }
                finished = true;
            } else if (produced == 0 && consumed >= size) {
                Corrupt("Compressed stream is truncated");
            } else if (ret == Z_BUF_ERROR && produced == 0) {
                Corrupt("Compressed stream is truncated");
            }
        }
    } catch (...) {
        inflateEnd(&strm);
        throw;
    }
    inflateEnd(&strm);
}

void RunBzip2(const std::uint8_t* data, std::size_t size, Sink& sink) {
    std::array<char, kChunkSize> out_buf{};
    std::size_t consumed = 0;
    while (true) {
        bz_stream strm{};
        if (BZ2_bzDecompressInit(&strm, 0, 0) != BZ_OK) {
            throw Error(ErrorKind::CorruptArchive, "Failed to initialize bzip2 decoder");
        }
        bool stream_end = false;
        try {
            while (!stream_end) {
                std::size_t take = std::min<std::size_t>(size - consumed, std::numeric_limits<unsigned int>::max());
                strm.next_in = reinterpret_cast<char*>(const_cast<std::uint8_t*>(data + consumed));
                strm.avail_in = static_cast<unsigned int>(take);
                strm.next_out = out_buf.data();
                strm.avail_out = static_cast<unsigned int>(out_buf.size());
                int ret = BZ2_bzDecompress(&strm);
                consumed += take - strm.avail_in;
                std::size_t produced = out_buf.size() - strm.avail_out;
                if (ret != BZ_OK && ret != BZ_STREAM_END) {
                    Corrupt("Bzip2 stream is corrupt (code " + std::to_string(ret) + ")");
                }
                if (produced > 0
                    && !sink.Append(reinterpret_cast<const std::uint8_t*>(out_buf.data()), produced)) {
                    BZ2_bzDecompressEnd(&strm);
                    return;
                }
                if (ret == BZ_STREAM_END) {
                    stream_end = true;
                } else if (produced == 0 && consumed >= size) {
                    Corrupt("Bzip2 stream is truncated");
                }
            }
        } catch (...) {
            BZ2_bzDecompressEnd(&strm);
            throw;
        }
        BZ2_bzDecompressEnd(&strm);
        if (!HasBzip2Magic(data + consumed, size - consumed)) {
            return;
        }
    }
}

void RunXz(const std::uint8_t* data, std::size_t size, Sink& sink) {
    lzma_stream strm = LZMA_STREAM_INIT;
    lzma_ret ret = lzma_stream_decoder(&strm, UINT64_MAX, LZMA_CONCATENATED);
    if (ret != LZMA_OK) {
        throw Error(ErrorKind::CorruptArchive, "Failed to initialize xz decoder");
    }
    std::array<std::uint8_t, kChunkSize> out_buf{};
    strm.next_in = data;
    strm.avail_in = size;
    try {
        while (true) {
            strm.next_out = out_buf.data();
            strm.avail_out = out_buf.size();
            ret = lzma_code(&strm, LZMA_FINISH);
            std::size_t produced = out_buf.size() - strm.avail_out;
            if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
                if (ret == LZMA_BUF_ERROR) {
                    Corrupt("XZ stream is truncated");
                }
                Corrupt("XZ stream is corrupt (code " + std::to_string(static_cast<int>(ret)) + ")");
            }
            if (produced > 0 && !sink.Append(out_buf.data(), produced)) {
                break;
            }
            if (ret == LZMA_STREAM_END) {
                break;
            }
        }
    } catch (...) {
        lzma_end(&strm);
        throw;
    }
    lzma_end(&strm);
}

void Run(Codec codec, const std::uint8_t* data, std::size_t size, Sink& sink) {
    switch (codec) {
        case Codec::Gzip:
            if (!HasGzipMagic(data, size)) {
                Corrupt("Missing gzip header");
            }
            RunZlib(data, size, 15 + 16, true, sink);
            return;
        case Codec::Deflate:
            RunZlib(data, size, -15, false, sink);
            return;
        case Codec::Bzip2:
            RunBzip2(data, size, sink);
            return;
        case Codec::Xz:
            RunXz(data, size, sink);
            return;
    }
}

}  // namespace

Bytes Decompress(Codec codec, const std::uint8_t* data, std::size_t size, std::uint64_t limit) {
    Sink sink(limit, false);
    Run(codec, data, size, sink);
    return sink.Take();
}

std::optional<Bytes> DecompressPrefix(Codec codec, const Bytes& data, std::size_t max_out) {
    Sink sink(max_out, true);
    try {
        Run(codec, data.data(), data.size(), sink);
    } catch (const Error&) {
        if (!sink.Full()) {
            return std::nullopt;
        }
    }
    return sink.Take();
}

}  // namespace b64unpack::decompress
