#include <imgz/file_io.hpp>

#include <fstream>

#include <fmt/format.h>

#include <imgz/compression_error.hpp>

namespace imgz
{

auto
read_bytes(std::filesystem::path const& path) -> std::vector<std::byte>
{
  auto file = std::ifstream{ path, std::ios::binary | std::ios::ate };

  if (not file)
  {
    throw io_error{ fmt::format("Failed to open {}", path.string()) };
  }

  auto const size = file.tellg();

  if (size < 0)
  {
    throw io_error{ fmt::format("Failed to determine the size of {}",
                                path.string()) };
  }

  auto data = std::vector<std::byte>(static_cast<std::size_t>(size));
  file.seekg(0);

  if (not file.read(reinterpret_cast<char*>(data.data()),
                    static_cast<std::streamsize>(data.size())))
  {
    throw io_error{ fmt::format("Failed to read {}", path.string()) };
  }

  return data;
}

void
write_bytes(std::filesystem::path const& path,
            std::span<std::byte const> const data)
{
  auto file = std::ofstream{ path, std::ios::binary | std::ios::trunc };

  if (not file)
  {
    throw io_error{ fmt::format("Failed to create {}", path.string()) };
  }

  if (not file.write(reinterpret_cast<char const*>(data.data()),
                     static_cast<std::streamsize>(data.size())))
  {
    throw io_error{ fmt::format("Failed to write {}", path.string()) };
  }
}

} // namespace imgz
