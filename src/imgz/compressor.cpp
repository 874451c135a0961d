#include <imgz/compressor.hpp>

#include <iterator>

#include <fmt/format.h>

#include <imgz/coding/lzw_decoder.hpp>
#include <imgz/coding/lzw_encoder.hpp>
#include <imgz/compression_error.hpp>

namespace imgz
{

void
compressor::set_coding_lzw(coding::lzw::table_size_t const max_table_size)
{
  encoding_function_ =
    [lzw_encoder = coding::lzw::encoder{ max_table_size }](
      std::span<std::byte const> const input, std::vector<std::byte>& output)
  { lzw_encoder(input, std::back_inserter(output)); };

  decoding_function_ =
    [lzw_decoder = coding::lzw::decoder{ max_table_size }](
      std::span<std::byte const> const input, std::vector<std::byte>& output)
  { lzw_decoder(input, std::back_inserter(output)); };

  description_ = fmt::format("LZW (max table size: {})", max_table_size);
}

void
compressor::set_coding_deflate(coding::deflate::level_t const level)
{
  encoding_function_ = coding::deflate::encoder{ level };
  decoding_function_ = coding::deflate::decoder{};

  description_ = fmt::format("Deflate (compression level: {})", level);
}

auto
compressor::compress(std::span<std::byte const> const input) const
  -> std::vector<std::byte>
{
  check_configured();

  auto output = std::vector<std::byte>{};
  encoding_function_(input, output);

  return output;
}

auto
compressor::decompress(std::span<std::byte const> const input) const
  -> std::vector<std::byte>
{
  check_configured();

  auto output = std::vector<std::byte>{};
  decoding_function_(input, output);

  return output;
}

auto
compressor::describe() const -> std::string const&
{
  return description_;
}

void
compressor::check_configured() const
{
  if (not encoding_function_ or not decoding_function_)
  {
    throw configuration_error{ "No coding selected for the compressor" };
  }
}

} // namespace imgz
