#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <string>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bytes
{

using buffer_t = std::vector<uint8_t>;

constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::little)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

template<std::integral Ty = uint32_t>
Ty to_int(std::span<const uint8_t> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<std::integral From>
void from_int(std::span<uint8_t> to, From val)
{
    val = endify(val);
    std::memcpy(to.data(), std::addressof(val), sizeof(From));
}

inline std::span<const uint8_t> as_span(std::string_view sv)
{
    return {reinterpret_cast<const uint8_t*>(sv.data()), sv.size()};
}

[[nodiscard]] std::string to_hex(std::span<const uint8_t> data);
[[nodiscard]] std::optional<buffer_t> from_hex(std::string_view hex);

// Big-endian, length-prefixed encoder used for transcripts and file headers.
class Writer
{
public:
    template<std::integral Ty>
    Writer& put_int(Ty val)
    {
        auto at = buf.size();
        buf.resize(at + sizeof(Ty));
        from_int(std::span(buf).subspan(at), val);
        return *this;
    }

    Writer& put_raw(std::span<const uint8_t> data)
    {
        buf.insert(buf.end(), data.begin(), data.end());
        return *this;
    }

    // u32 length followed by the data.
    Writer& put_field(std::span<const uint8_t> data)
    {
        put_int(static_cast<uint32_t>(data.size()));
        return put_raw(data);
    }

    Writer& put_field(std::string_view sv)
    {
        return put_field(as_span(sv));
    }

    [[nodiscard]] const buffer_t& data() const { return buf; }
    [[nodiscard]] buffer_t take() { return std::move(buf); }

private:
    buffer_t buf;
};

class Reader
{
public:
    explicit Reader(std::span<const uint8_t> src) : rest(src) {}

    template<std::integral Ty>
    [[nodiscard]] std::optional<Ty> get_int()
    {
        if (rest.size() < sizeof(Ty))
        {
            return std::nullopt;
        }
        Ty val = to_int<Ty>(rest.first(sizeof(Ty)));
        rest = rest.subspan(sizeof(Ty));
        return val;
    }

    [[nodiscard]] std::optional<std::span<const uint8_t>> get_raw(size_t n)
    {
        if (rest.size() < n)
        {
            return std::nullopt;
        }
        auto out = rest.first(n);
        rest = rest.subspan(n);
        return out;
    }

    [[nodiscard]] std::span<const uint8_t> remaining() const { return rest; }
    [[nodiscard]] bool empty() const { return rest.empty(); }

private:
    std::span<const uint8_t> rest;
};

} // namespace bytes
