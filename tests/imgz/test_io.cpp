#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include <catch2/catch.hpp>

#include <imgz/compression_error.hpp>
#include <imgz/compressor.hpp>
#include <imgz/file_io.hpp>
#include <imgz/image_io.hpp>

namespace
{

class scoped_temp_dir
{
public:
    scoped_temp_dir()
        : path_{ std::filesystem::temp_directory_path() /
                 ("imgz_test_" +
                   std::to_string(
                       std::chrono::steady_clock::now().time_since_epoch().count())) }
    {
        std::filesystem::create_directories(path_);
    }

    ~scoped_temp_dir()
    {
        auto error = std::error_code{};
        std::filesystem::remove_all(path_, error);
    }

    [[nodiscard]] auto path() const -> std::filesystem::path const&
    {
        return path_;
    }

private:
    std::filesystem::path path_;
};

auto
gradient_image(std::size_t const width, std::size_t const height)
    -> std::vector<std::uint8_t>
{
    auto pixels = std::vector<std::uint8_t>{};

    for (auto y = std::size_t{ 0 }; y < height; ++y)
    {
        for (auto x = std::size_t{ 0 }; x < width; ++x)
        {
            pixels.push_back(static_cast<std::uint8_t>(x * 16u));
            pixels.push_back(static_cast<std::uint8_t>(y * 16u));
            pixels.push_back(static_cast<std::uint8_t>((x + y) * 8u));
        }
    }

    return pixels;
}

} // namespace

TEST_CASE("Raw bytes are written and read back")
{
    auto const dir = scoped_temp_dir{};
    auto const path = dir.path() / "data.bin";
    auto const data = std::vector<std::byte>{ std::byte{ 0x00 },
                                              std::byte{ 0xFF },
                                              std::byte{ 0x41 } };

    imgz::write_bytes(path, data);

    CHECK(std::filesystem::file_size(path) == data.size());
    CHECK(imgz::read_bytes(path) == data);
}

TEST_CASE("Empty files are read as empty buffers")
{
    auto const dir = scoped_temp_dir{};
    auto const path = dir.path() / "empty.bin";

    imgz::write_bytes(path, {});

    CHECK(imgz::read_bytes(path).empty());
}

TEST_CASE("Missing files raise io errors")
{
    auto const dir = scoped_temp_dir{};

    CHECK_THROWS_AS(imgz::read_bytes(dir.path() / "missing.bin"),
                    imgz::io_error);
    CHECK_THROWS_AS(imgz::write_bytes(dir.path() / "no" / "such.bin", {}),
                    imgz::io_error);
    CHECK_THROWS_AS(imgz::read_bytes(dir.path()), imgz::io_error);
}

TEST_CASE("RGB images survive a BMP round trip")
{
    auto const dir = scoped_temp_dir{};
    auto const path = dir.path() / "gradient.bmp";
    auto const pixels = gradient_image(16u, 8u);

    imgz::write_rgb_image_as_bmp(path, 16u, 8u, pixels.data());

    auto width = std::size_t{};
    auto height = std::size_t{};
    auto const image = imgz::read_rgb_image(path, width, height);

    REQUIRE(width == 16u);
    REQUIRE(height == 8u);
    CHECK(std::vector<std::uint8_t>(image.get(),
                                    image.get() + pixels.size()) == pixels);
}

TEST_CASE("Image pixels round trip through the lzw compressor")
{
    auto const dir = scoped_temp_dir{};
    auto const image_path = dir.path() / "gradient.bmp";
    auto const compressed_path = dir.path() / "gradient.lzw";
    auto const pixels = gradient_image(32u, 32u);

    imgz::write_rgb_image_as_bmp(image_path, 32u, 32u, pixels.data());

    auto width = std::size_t{};
    auto height = std::size_t{};
    auto const image = imgz::read_rgb_image(image_path, width, height);
    auto const image_bytes = std::as_bytes(
        std::span{ image.get(), width * height * imgz::rgb_channels });

    auto compressor = imgz::compressor{};
    compressor.set_coding_lzw();

    imgz::write_bytes(compressed_path, compressor.compress(image_bytes));

    auto const restored =
        compressor.decompress(imgz::read_bytes(compressed_path));

    CHECK(std::ranges::equal(restored, image_bytes));
}

TEST_CASE("Undecodable images raise io errors")
{
    auto const dir = scoped_temp_dir{};
    auto const path = dir.path() / "not_an_image.png";
    auto const data = std::vector<std::byte>(64u, std::byte{ 0x42 });
    imgz::write_bytes(path, data);

    auto width = std::size_t{};
    auto height = std::size_t{};

    CHECK_THROWS_AS(imgz::read_rgb_image(path, width, height), imgz::io_error);
}
