#include "b64unpack/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace b64unpack::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string Trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::uint64_t GetUint(std::string_view name, std::uint64_t default_value) {
    std::string raw = Trim(Get(name));
    if (raw.empty() || raw.front() == '-') {
        return default_value;
    }
    try {
        std::uint64_t parsed = static_cast<std::uint64_t>(std::stoull(raw));
        return parsed == 0 ? default_value : parsed;
    } catch (const std::exception&) {
        return default_value;
    }
}

std::vector<std::string> GetList(std::string_view name) {
    std::vector<std::string> items;
    std::string raw = Get(name);
    std::size_t start = 0;
    while (start <= raw.size()) {
        std::size_t comma = raw.find(',', start);
        if (comma == std::string::npos) {
            comma = raw.size();
        }
        std::string item = Trim(raw.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

}  // namespace b64unpack::env
