#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace b64
{

// Standard alphabet with '=' padding (what btoa()/atob() speak).
std::string encode(const std::uint8_t *data, std::size_t len);

// nullopt on any character outside the alphabet, bad padding or trailing junk.
std::optional<std::vector<std::uint8_t>> decode(std::string_view text);

}  // namespace b64
