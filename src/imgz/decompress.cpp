#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <imgz/codec_arguments.hpp>
#include <imgz/compression_error.hpp>
#include <imgz/compression_options.hpp>
#include <imgz/compressor.hpp>
#include <imgz/file_io.hpp>
#include <imgz/image_io.hpp>

auto
main(int const argc, char const* const* const argv) -> int
{
  try
  {
    // Parse arguments
    auto show_help = false;
    auto width = std::size_t{};
    auto height = std::size_t{};
    auto in_path = std::filesystem::path{};
    auto out_path = std::filesystem::path{};
    auto codec = imgz::codec_arguments{};

    auto parser =
      lyra::cli_parser{}
        .add_argument(lyra::help(show_help))
        .add_argument(lyra::opt(in_path, "in")
                        .name("-i")
                        .name("--input")
                        .required()
                        .help("Input compressed file path"))
        .add_argument(lyra::opt(out_path, "out")
                        .name("-o")
                        .name("--output")
                        .required()
                        .help("Output path, raw bytes or BMP image"))
        .add_argument(lyra::opt(width, "pixels")
                        .name("--width")
                        .help("Image width, writes a BMP image when set"))
        .add_argument(lyra::opt(height, "pixels")
                        .name("--height")
                        .help("Image height, writes a BMP image when set"));
    imgz::add_codec_arguments(parser, codec);

    if (auto const parse_result = parser.parse(lyra::args(argc, argv));
        not parse_result)
    {
      fmt::print(stderr, "{}\n", parse_result.errorMessage());
      fmt::print("See --help for correct usage\n");

      return EXIT_FAILURE;
    }

    if (show_help)
    {
      // Display usage and exit
      fmt::print("{}", fmt::streamed(parser));

      return EXIT_SUCCESS;
    }

    auto const options = imgz::resolve_options(codec);

    // Decompress the stream
    auto compressor = imgz::compressor{};
    imgz::apply_options(options, compressor);

    auto const compressed_data = imgz::read_bytes(in_path);
    auto const decompressed_data = compressor.decompress(compressed_data);

    if (width == 0u and height == 0u)
    {
      imgz::write_bytes(out_path, decompressed_data);

      return EXIT_SUCCESS;
    }

    // Rebuild the image from RGB pixels
    auto const expected_size = width * height * imgz::rgb_channels;

    if (decompressed_data.size() != expected_size)
    {
      throw imgz::io_error{ fmt::format(
        "Decompressed {}B, a {}x{} RGB image needs {}B",
        decompressed_data.size(),
        width,
        height,
        expected_size) };
    }

    imgz::write_rgb_image_as_bmp(
      out_path,
      width,
      height,
      reinterpret_cast<std::uint8_t const*>(decompressed_data.data()));
  }
  catch (std::exception const& error)
  {
    fmt::print(stderr, "{}\n", error.what());

    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
