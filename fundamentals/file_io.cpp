#include "fundamentals/file_io.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace file_io
{

std::expected<bytes::buffer_t, std::string> read_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Cannot open file: {}", path));
    }

    bytes::buffer_t data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad())
    {
        return std::unexpected(std::format("Read error on {}", path));
    }
    return data;
}

std::expected<void, std::string> write_private_file(const std::string& path, std::span<const uint8_t> data)
{
    auto tmp = path + ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
        {
            return std::unexpected(std::format("Cannot create file: {}", tmp));
        }
        std::error_code ec;
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        if (ec)
        {
            return std::unexpected(std::format("Cannot restrict permissions on {}: {}", tmp, ec.message()));
        }

        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file)
        {
            return std::unexpected(std::format("Write error on {}", tmp));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
    {
        auto reason = ec.message();
        fs::remove(tmp, ec);
        return std::unexpected(std::format("Cannot replace {}: {}", path, reason));
    }
    return {};
}

} // namespace file_io
