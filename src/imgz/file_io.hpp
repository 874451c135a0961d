#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace imgz
{

[[nodiscard]] auto read_bytes(std::filesystem::path const& path)
  -> std::vector<std::byte>;

void write_bytes(std::filesystem::path const& path,
                 std::span<std::byte const> data);

} // namespace imgz
