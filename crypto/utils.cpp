#include "crypto/utils.hpp"
#include "fundamentals/bytes.hpp"

namespace crypto
{

std::optional<std::string> random_id(std::string_view prefix, size_t n_bytes)
{
    std::vector<uint8_t> raw(n_bytes);
    if (!random_fill(raw))
    {
        return std::nullopt;
    }

    std::string id;
    if (!prefix.empty())
    {
        id.append(prefix);
        id.push_back('-');
    }
    id += bytes::to_hex(raw);
    return id;
}

} // namespace crypto
