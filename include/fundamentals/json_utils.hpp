#pragma once
#include <boost/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>
#include <format>

#include "fundamentals/bytes.hpp"

namespace json_utils
{

inline boost::json::object status_msg(std::string_view status, std::string_view msg)
{
    return boost::json::object{
        {"status", status},
        {"message", msg}
    };
}

inline std::expected<std::string, std::string> extract_str(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("\"{}\" must be a string", key));
    }

    return static_cast<std::string>(it->value().as_string());
}

inline std::expected<int64_t, std::string> extract_int(const boost::json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::unexpected(std::format("\"{}\" field required", key));
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("\"{}\" must be an integer", key));
    }
    if (it->value().is_uint64() && it->value().get_uint64() > static_cast<uint64_t>(INT64_MAX))
    {
        return std::unexpected(std::format("\"{}\" is out of range", key));
    }

    return it->value().to_number<int64_t>();
}

inline std::expected<bytes::buffer_t, std::string> extract_hex(const boost::json::object& obj, std::string_view key)
{
    auto str = extract_str(obj, key);
    if (!str)
    {
        return std::unexpected(str.error());
    }
    auto bin = bytes::from_hex(*str);
    if (!bin)
    {
        return std::unexpected(std::format("\"{}\" is not valid hex", key));
    }
    return std::move(*bin);
}

inline boost::json::string hex(std::span<const uint8_t> data)
{
    return boost::json::string(bytes::to_hex(data));
}

} // namespace json_utils
