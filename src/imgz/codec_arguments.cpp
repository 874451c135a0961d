#include <imgz/codec_arguments.hpp>

#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include <imgz/coding/lzw_base.hpp>
#include <imgz/compression_error.hpp>
#include <imgz/config.hpp>

namespace imgz
{

void
add_codec_arguments(lyra::cli_parser& parser, codec_arguments& arguments)
{
  parser
    .add_argument(lyra::opt(arguments.config_path, "path")
                    .name("-c")
                    .name("--config")
                    .help("Configuration file selecting the codec"))
    .add_argument(lyra::opt(arguments.algorithm, "name")
                    .name("-a")
                    .name("--algorithm")
                    .help("Compression algorithm: deflate or lzw"))
    .add_argument(
      lyra::opt([&](unsigned level) { arguments.level = level; },
                "level")
        .name("-l")
        .name("--level")
        .help(fmt::format("Deflate compression level, 0-9; default = {}",
                          coding::deflate::default_level)))
    .add_argument(
      lyra::opt([&](std::size_t size) { arguments.table_size = size; },
                "size")
        .name("-t")
        .name("--table-size")
        .help(fmt::format("LZW maximum table size, {}-{}; default = {}",
                          coding::lzw::literal_count,
                          coding::lzw::max_table_size,
                          coding::lzw::default_table_size)));
}

auto
resolve_options(codec_arguments const& arguments) -> compression_options
{
  auto options = arguments.config_path.empty()
                   ? compression_options{}
                   : load_config(arguments.config_path);

  if (not arguments.algorithm.empty() or arguments.level)
  {
    auto const algorithm = arguments.algorithm.empty()
                             ? std::string{ algorithm_name(options) }
                             : arguments.algorithm;
    auto coding = make_coding(algorithm, arguments.level);

    // Same algorithm keeps its configured fields, only deflate takes a level
    auto const switches_algorithm = coding.index() != options.coding.index();
    auto const sets_level =
      arguments.level and
      std::holds_alternative<compression_options::coding_deflate>(coding);

    if (switches_algorithm or sets_level)
    {
      options.coding = std::move(coding);
    }
  }

  if (arguments.table_size)
  {
    auto* const lzw =
      std::get_if<compression_options::coding_lzw>(&options.coding);

    if (lzw == nullptr)
    {
      throw configuration_error{
        "--table-size only applies to the lzw algorithm"
      };
    }

    coding::lzw::validate_table_size(*arguments.table_size);
    lzw->max_table_size = *arguments.table_size;
  }

  return options;
}

} // namespace imgz
