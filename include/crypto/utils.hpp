#pragma once
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace crypto
{

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        OPENSSL_cleanse(cont.data(), cont.size() * sizeof(*cont.data()));
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

[[nodiscard]] inline bool random_fill(std::span<uint8_t> out)
{
    return RAND_bytes(out.data(), static_cast<int>(out.size())) == 1;
}

template<size_t N>
[[nodiscard]] std::optional<std::array<uint8_t, N>> random_array()
{
    std::array<uint8_t, N> out{};
    if (!random_fill(out))
    {
        return std::nullopt;
    }
    return out;
}

// Random identifier rendered as lowercase hex, e.g. "kem-3fa2..." when a prefix is given.
[[nodiscard]] std::optional<std::string> random_id(std::string_view prefix, size_t n_bytes = 16);

[[nodiscard]] inline bool constant_time_equal(std::span<const uint8_t> a, std::span<const uint8_t> b)
{
    return a.size() == b.size() && CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

/**
 * Owning byte buffer for secret material. Zeroed on destruction, on move-from
 * and on explicit wipe(); copies are deliberate and explicit via clone().
 */
class SecretBytes
{
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t n) : buf(n) {}
    explicit SecretBytes(std::span<const uint8_t> src) : buf(src.begin(), src.end()) {}
    ~SecretBytes() { wipe(); }

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;
    SecretBytes(SecretBytes&& other) noexcept : buf(std::move(other.buf)) { other.buf.clear(); }
    SecretBytes& operator=(SecretBytes&& other) noexcept
    {
        if (this != &other)
        {
            wipe();
            buf = std::move(other.buf);
            other.buf.clear();
        }
        return *this;
    }

    [[nodiscard]] SecretBytes clone() const { return SecretBytes(std::span<const uint8_t>(buf)); }

    void wipe()
    {
        secure_clear(buf);
        buf.clear();
    }

    [[nodiscard]] uint8_t* data() { return buf.data(); }
    [[nodiscard]] const uint8_t* data() const { return buf.data(); }
    [[nodiscard]] size_t size() const { return buf.size(); }
    [[nodiscard]] bool empty() const { return buf.empty(); }
    [[nodiscard]] std::span<const uint8_t> view() const { return buf; }
    [[nodiscard]] std::span<uint8_t> view() { return buf; }

private:
    std::vector<uint8_t> buf;
};

} // namespace crypto
