#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace keys
{

enum class KeyKind : uint8_t
{
    Kem,
    Signature,
};

[[nodiscard]] constexpr std::string_view to_string(KeyKind kind)
{
    return kind == KeyKind::Kem ? "kem" : "sig";
}

struct AlgorithmInfo
{
    std::string_view name;
    KeyKind kind;
    uint8_t rank;        // claimed NIST security level
    uint8_t preference;  // fixed tie-break order, lower wins
};

/**
 * Negotiated pair of algorithms for one handshake. Immutable once chosen.
 */
struct AlgorithmSuite
{
    std::string kem;
    std::string sig;
    uint8_t rank = 0;

    // e.g. "PQ_ML_KEM_768_ML_DSA_65"
    [[nodiscard]] std::string cipher_suite() const;

    bool operator==(const AlgorithmSuite&) const = default;
};

[[nodiscard]] std::span<const AlgorithmInfo> default_catalog();

[[nodiscard]] const AlgorithmInfo* find_algorithm(
    std::string_view name,
    KeyKind kind,
    std::span<const AlgorithmInfo> catalog = default_catalog()
);

/**
 * Picks the highest-ranked algorithm present in both `offered` and `supported`.
 * Equal ranks are resolved by the catalog preference, never by offer order.
 * Names missing from the catalog are ignored.
 */
[[nodiscard]] std::optional<std::string> negotiate(
    std::span<const std::string> offered,
    std::span<const std::string> supported,
    KeyKind kind,
    std::span<const AlgorithmInfo> catalog = default_catalog()
);

} // namespace keys
