#pragma once

#include <cstddef>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include <imgz/coding/deflate.hpp>
#include <imgz/coding/lzw_base.hpp>

namespace imgz
{

// Whole-buffer codec with interchangeable coding back ends. Every call owns
// its own coding state, so one configured compressor may be shared between
// threads.
class compressor
{
public:
  void set_coding_lzw(
    coding::lzw::table_size_t max_table_size = coding::lzw::default_table_size);

  void set_coding_deflate(
    coding::deflate::level_t level = coding::deflate::default_level);

  [[nodiscard]] auto compress(std::span<std::byte const> input) const
    -> std::vector<std::byte>;

  [[nodiscard]] auto decompress(std::span<std::byte const> input) const
    -> std::vector<std::byte>;

  [[nodiscard]] auto describe() const -> std::string const&;

private:
  using coding_function_type = void(std::span<std::byte const> input,
                                    std::vector<std::byte>& output);

  std::function<coding_function_type> encoding_function_;
  std::function<coding_function_type> decoding_function_;
  std::string description_;

  void check_configured() const;
};

} // namespace imgz
