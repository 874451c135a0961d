#include <imgz/image_io.hpp>

#include <fmt/format.h>

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image.h>
#include <stb_image_write.h>

#include <imgz/compression_error.hpp>

namespace imgz
{

void
image_data_deleter::operator()(pointer const ptr)
{
  ::stbi_image_free(ptr);
}

auto
read_rgb_image(std::filesystem::path const& path,
               std::size_t& out_width,
               std::size_t& out_height) -> image_data_pointer
{
  auto width = int{};
  auto height = int{};
  auto channels = int{};

  auto ptr = image_data_pointer{
    reinterpret_cast<std::uint8_t*>(
      ::stbi_load(path.c_str(), &width, &height, &channels, ::STBI_rgb)),
  };

  if (not ptr)
  {
    throw io_error{ fmt::format("Failed to read image {}: {}",
                                path.string(),
                                ::stbi_failure_reason()) };
  }

  out_width = static_cast<std::size_t>(width);
  out_height = static_cast<std::size_t>(height);

  return ptr;
}

void
write_rgb_image_as_bmp(std::filesystem::path const& path,
                       std::size_t const width,
                       std::size_t const height,
                       std::uint8_t const* const data)
{
  if (::stbi_write_bmp(path.c_str(),
                       static_cast<int>(width),
                       static_cast<int>(height),
                       ::STBI_rgb,
                       data) == 0)
  {
    throw io_error{ fmt::format("Failed to write image {}", path.string()) };
  }
}

} // namespace imgz
