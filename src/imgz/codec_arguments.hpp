#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include <lyra/lyra.hpp>

#include <imgz/compression_options.hpp>

namespace imgz
{

// Codec selection shared by the command-line tools. Flags given on the
// command line override the configuration file.
struct codec_arguments
{
  std::filesystem::path config_path = {};
  std::string algorithm = {};
  std::optional<unsigned> level = std::nullopt;
  std::optional<std::size_t> table_size = std::nullopt;
};

void add_codec_arguments(lyra::cli_parser& parser, codec_arguments& arguments);

[[nodiscard]] auto resolve_options(codec_arguments const& arguments)
  -> compression_options;

} // namespace imgz
