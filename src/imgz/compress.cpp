#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <imgz/codec_arguments.hpp>
#include <imgz/compression_options.hpp>
#include <imgz/compressor.hpp>
#include <imgz/file_io.hpp>
#include <imgz/image_io.hpp>
#include <imgz/utils/entropy.hpp>

auto
main(int const argc, char const* const* const argv) -> int
{
  try
  {
    // Parse arguments
    auto show_help = false;
    auto show_stats = false;
    auto in_path = std::filesystem::path{};
    auto out_path = std::filesystem::path{};
    auto codec = imgz::codec_arguments{};

    auto parser =
      lyra::cli_parser{}
        .add_argument(lyra::help(show_help))
        .add_argument(lyra::opt(show_stats)
                        .name("-s")
                        .name("--stats")
                        .help("Display compression stats"))
        .add_argument(lyra::opt(in_path, "in")
                        .name("-i")
                        .name("--input")
                        .required()
                        .help("Input image path"))
        .add_argument(lyra::opt(out_path, "out")
                        .name("-o")
                        .name("--output")
                        .required()
                        .help("Output compressed file path"));
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

    // Read the input image
    auto width = std::size_t{};
    auto height = std::size_t{};
    auto const image_data = imgz::read_rgb_image(in_path, width, height);
    auto const image_bytes = std::as_bytes(std::span{
      image_data.get(), width * height * imgz::rgb_channels });

    // Compress the raw pixels
    auto compressor = imgz::compressor{};
    imgz::apply_options(options, compressor);

    auto const compressed_data = compressor.compress(image_bytes);

    if (show_stats)
    {
      auto const original_size = image_bytes.size();
      auto const compressed_size = compressed_data.size();
      auto const compression_ratio =
        original_size == 0u ? 0.0f
                            : static_cast<float>(compressed_size) /
                                static_cast<float>(original_size);

      fmt::print("Codec: {}\n"
                 "Image: {}x{} RGB\n"
                 "Original size: {}B (entropy {:.3f} bits/byte)\n"
                 "Compressed size: {}B\n"
                 "Compression ratio: {}\n",
                 compressor.describe(),
                 width,
                 height,
                 original_size,
                 imgz::calculate_entropy(image_bytes),
                 compressed_size,
                 compression_ratio);
      std::fflush(stdout);
    }

    // Write the compressed stream
    imgz::write_bytes(out_path, compressed_data);

    fmt::print("Image compressed successfully!\n");
  }
  catch (std::exception const& error)
  {
    fmt::print(stderr, "{}\n", error.what());

    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
