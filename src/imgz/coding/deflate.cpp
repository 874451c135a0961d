#include <imgz/coding/deflate.hpp>

#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <zlib.h>

#include <imgz/compression_error.hpp>

namespace imgz::coding::deflate
{

namespace
{

constexpr auto raw_window_bits = -MAX_WBITS;
constexpr auto memory_level = 8;
constexpr auto output_chunk_size = std::size_t{ 16384 };
constexpr auto input_chunk_size =
  static_cast<std::size_t>(std::numeric_limits<uInt>::max());

struct deflate_stream
{
  z_stream stream = {};

  explicit deflate_stream(level_t const level)
  {
    if (::deflateInit2(&stream,
                       level,
                       Z_DEFLATED,
                       raw_window_bits,
                       memory_level,
                       Z_DEFAULT_STRATEGY) != Z_OK)
    {
      throw encode_error{ "Failed to initialize deflate stream" };
    }
  }

  ~deflate_stream() { ::deflateEnd(&stream); }

  deflate_stream(deflate_stream const&) = delete;
  auto operator=(deflate_stream const&) -> deflate_stream& = delete;
};

struct inflate_stream
{
  z_stream stream = {};

  inflate_stream()
  {
    if (::inflateInit2(&stream, raw_window_bits) != Z_OK)
    {
      throw decode_error{ "Failed to initialize inflate stream" };
    }
  }

  ~inflate_stream() { ::inflateEnd(&stream); }

  inflate_stream(inflate_stream const&) = delete;
  auto operator=(inflate_stream const&) -> inflate_stream& = delete;
};

void
set_next_input(z_stream& stream, std::span<std::byte const>& remaining)
{
  auto const chunk = std::min(remaining.size(), input_chunk_size);

  // zlib does not modify the input, next_in is only non-const for C89
  stream.next_in =
    reinterpret_cast<Bytef*>(const_cast<std::byte*>(remaining.data()));
  stream.avail_in = static_cast<uInt>(chunk);
  remaining = remaining.subspan(chunk);
}

void
set_next_output(z_stream& stream, std::vector<std::byte>& output)
{
  auto const offset = output.size();
  output.resize(offset + output_chunk_size);

  stream.next_out = reinterpret_cast<Bytef*>(output.data() + offset);
  stream.avail_out = static_cast<uInt>(output_chunk_size);
}

void
trim_output(z_stream const& stream, std::vector<std::byte>& output)
{
  output.resize(output.size() - stream.avail_out);
}

[[nodiscard]] auto
stream_message(z_stream const& stream, char const* const fallback)
  -> char const*
{
  return stream.msg != nullptr ? stream.msg : fallback;
}

} // namespace

encoder::encoder(level_t const level)
  : level_{ level }
{
  if (level < min_level or level > max_level)
  {
    throw invalid_level_error{ fmt::format(
      "Deflate level must be between {} and {}, got {}",
      min_level,
      max_level,
      level) };
  }
}

void
encoder::operator()(std::span<std::byte const> input,
                    std::vector<std::byte>& output) const
{
  auto deflater = deflate_stream{ level_ };
  auto& stream = deflater.stream;
  auto flush = Z_NO_FLUSH;

  do
  {
    set_next_input(stream, input);
    flush = input.empty() ? Z_FINISH : Z_NO_FLUSH;

    do
    {
      set_next_output(stream, output);

      if (::deflate(&stream, flush) == Z_STREAM_ERROR)
      {
        throw encode_error{ stream_message(stream, "Deflate stream error") };
      }

      trim_output(stream, output);
    } while (stream.avail_out == 0u);
  } while (flush != Z_FINISH);
}

void
decoder::operator()(std::span<std::byte const> input,
                    std::vector<std::byte>& output) const
{
  auto inflater = inflate_stream{};
  auto& stream = inflater.stream;
  auto decoded = std::vector<std::byte>{};
  auto status = Z_OK;

  do
  {
    set_next_input(stream, input);

    do
    {
      set_next_output(stream, decoded);
      status = ::inflate(&stream, Z_NO_FLUSH);

      switch (status)
      {
        case Z_NEED_DICT:
        case Z_DATA_ERROR:
        case Z_MEM_ERROR:
        case Z_STREAM_ERROR:
          throw decode_error{ fmt::format(
            "Invalid deflate stream: {}",
            stream_message(stream, "corrupt data")) };
        default:
          break;
      }

      trim_output(stream, decoded);
    } while (stream.avail_out == 0u and status != Z_STREAM_END);
  } while (status != Z_STREAM_END and not input.empty());

  if (status != Z_STREAM_END)
  {
    throw decode_error{ "Truncated deflate stream" };
  }

  output.insert(output.end(), decoded.begin(), decoded.end());
}

} // namespace imgz::coding::deflate
