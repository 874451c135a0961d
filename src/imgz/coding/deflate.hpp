#pragma once

#include <cstddef>
#include <span>
#include <vector>

namespace imgz::coding::deflate
{

using level_t = int;

static constexpr auto min_level = level_t{ 0 };
static constexpr auto max_level = level_t{ 9 };
static constexpr auto default_level = level_t{ 6 };

// Raw deflate stream (RFC 1951), no zlib or gzip wrapper
class encoder
{
public:
  explicit encoder(level_t level = default_level);

  [[nodiscard]] auto level() const noexcept -> level_t { return level_; }

  void operator()(std::span<std::byte const> input,
                  std::vector<std::byte>& output) const;

private:
  level_t level_;
};

class decoder
{
public:
  void operator()(std::span<std::byte const> input,
                  std::vector<std::byte>& output) const;
};

} // namespace imgz::coding::deflate
