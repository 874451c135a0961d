#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace imgz
{

static constexpr auto rgb_channels = std::size_t{ 3 };

struct image_data_deleter
{
  using pointer = std::uint8_t*;

  void operator()(pointer ptr);
};

using image_data_pointer = std::unique_ptr<std::uint8_t[], image_data_deleter>;

// Decodes any format stb_image understands into interleaved RGB8 pixels
// (width * height * rgb_channels bytes).
[[nodiscard]] auto read_rgb_image(std::filesystem::path const& path,
                                  std::size_t& out_width,
                                  std::size_t& out_height)
  -> image_data_pointer;

void write_rgb_image_as_bmp(std::filesystem::path const& path,
                            std::size_t width,
                            std::size_t height,
                            std::uint8_t const* data);

} // namespace imgz
