#include "fundamentals/bytes.hpp"

#include <sodium.h>

namespace bytes
{

std::string to_hex(std::span<const uint8_t> data)
{
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.pop_back();
    return out;
}

std::optional<buffer_t> from_hex(std::string_view hex)
{
    if (hex.size() % 2 != 0)
    {
        return std::nullopt;
    }

    buffer_t out(hex.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                       nullptr, std::addressof(bin_len), std::addressof(end)) != 0
        || bin_len != out.size()
        || end != hex.data() + hex.size())
    {
        return std::nullopt;
    }
    return out;
}

} // namespace bytes
