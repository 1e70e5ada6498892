#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace b64unpack::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);

// Unset, empty, zero or unparsable values yield `default_value`.
std::uint64_t GetUint(std::string_view name, std::uint64_t default_value);

// Comma separated, trimmed, empty items dropped.
std::vector<std::string> GetList(std::string_view name);

}  // namespace b64unpack::env
