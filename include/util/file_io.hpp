#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace storage
{

std::optional<std::vector<std::uint8_t>> read_file(const std::string &path);

// Write to <path>.part, then rename over <path>.
bool write_file(const std::string &path, const std::vector<std::uint8_t> &data);

}  // namespace storage
