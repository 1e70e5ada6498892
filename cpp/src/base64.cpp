#include "b64unpack/base64.hpp"

#include "b64unpack/errors.hpp"

#include <array>
#include <cctype>
#include <string>
#include <vector>

namespace b64unpack::base64 {

namespace {

constexpr char kEncTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Longest first so "data:...;base64," wins over a bare "data:".
constexpr std::string_view kPrefixes[] = {
    "data:application/octet-stream;base64,",
    "data:application/zip;base64,",
    "base64:",
};

std::array<std::uint8_t, 256> BuildDecodeTable() {
    std::array<std::uint8_t, 256> table{};
    table.fill(0xFF);
    for (std::size_t i = 0; i < 64; ++i) {
        table[static_cast<std::uint8_t>(kEncTable[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const std::array<std::uint8_t, 256> kDecTable = BuildDecodeTable();

bool StartsWithNoCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[i]))
            != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view StripPrefix(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    for (std::string_view prefix : kPrefixes) {
        if (StartsWithNoCase(text, prefix)) {
            return text.substr(prefix.size());
        }
    }
    if (StartsWithNoCase(text, "data:")) {
        // Generic data URI: the payload starts after the first comma.
        std::size_t comma = text.find(',');
        if (comma != std::string_view::npos) {
            return text.substr(comma + 1);
        }
        return text.substr(5);
    }
    return text;
}

}  // namespace

std::string Encode(const Bytes& data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);
    std::size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16)
                               | (static_cast<std::uint32_t>(data[i + 1]) << 8)
                               | static_cast<std::uint32_t>(data[i + 2]);
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        out.push_back(kEncTable[(triple >> 12) & 0x3F]);
        out.push_back(kEncTable[(triple >> 6) & 0x3F]);
        out.push_back(kEncTable[triple & 0x3F]);
        i += 3;
    }
    if (i < data.size()) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(kEncTable[(triple >> 18) & 0x3F]);
        if (i + 1 < data.size()) {
            triple |= static_cast<std::uint32_t>(data[i + 1]) << 8;
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back(kEncTable[(triple >> 6) & 0x3F]);
            out.push_back('=');
        } else {
            out.push_back(kEncTable[(triple >> 12) & 0x3F]);
            out.push_back('=');
            out.push_back('=');
        }
    }
    return out;
}

std::string Normalize(std::string_view text) {
    std::string_view body = StripPrefix(text);
    std::string out;
    out.reserve(body.size());
    for (unsigned char c : body) {
        if (c == '=' || kDecTable[c] != 0xFF) {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

Bytes Decode(const std::string& input, bool* ok) {
    auto fail = [ok]() {
        if (ok) {
            *ok = false;
        }
        return Bytes{};
    };
    if (input.size() % 4 != 0) {
        return fail();
    }
    std::size_t padding = 0;
    while (padding < input.size() && input[input.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (padding > 2) {
        return fail();
    }
    std::size_t data_chars = input.size() - padding;
    // A trailing quantum with one character carries fewer than eight bits.
    if (data_chars % 4 == 1) {
        return fail();
    }

    Bytes out;
    out.reserve((input.size() / 4) * 3);
    std::uint32_t val = 0;
    int valb = -8;
    for (std::size_t i = 0; i < data_chars; ++i) {
        std::uint8_t decoded = kDecTable[static_cast<unsigned char>(input[i])];
        if (decoded == 0xFF) {
            return fail();
        }
        val = ((val << 6) | decoded) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    if (ok) {
        *ok = true;
    }
    return out;
}

Bytes DecodePayload(std::string_view text) {
    std::string clean = Normalize(text);
    while (clean.size() % 4 != 0) {
        clean.push_back('=');
    }
    bool ok = false;
    Bytes decoded = Decode(clean, &ok);
    if (!ok) {
        throw Error(ErrorKind::InvalidEncoding, "Input is not valid base64 after cleaning");
    }
    return decoded;
}

bool IsLikelyBase64(std::string_view input) {
    if (input.empty()) {
        return true;
    }
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=' || kDecTable[c] != 0xFF) {
            continue;
        }
        return false;
    }
    return true;
}

}  // namespace b64unpack::base64
