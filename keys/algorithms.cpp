#include "keys/algorithms.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace keys
{

namespace
{

constexpr std::array catalog_entries
{
    AlgorithmInfo{"ML-KEM-1024", KeyKind::Kem, 5, 0},
    AlgorithmInfo{"Kyber1024",   KeyKind::Kem, 5, 1},
    AlgorithmInfo{"ML-KEM-768",  KeyKind::Kem, 3, 2},
    AlgorithmInfo{"Kyber768",    KeyKind::Kem, 3, 3},
    AlgorithmInfo{"ML-KEM-512",  KeyKind::Kem, 1, 4},
    AlgorithmInfo{"Kyber512",    KeyKind::Kem, 1, 5},

    AlgorithmInfo{"ML-DSA-87",   KeyKind::Signature, 5, 0},
    AlgorithmInfo{"Dilithium5",  KeyKind::Signature, 5, 1},
    AlgorithmInfo{"Falcon-1024", KeyKind::Signature, 5, 2},
    AlgorithmInfo{"ML-DSA-65",   KeyKind::Signature, 3, 3},
    AlgorithmInfo{"Dilithium3",  KeyKind::Signature, 3, 4},
    AlgorithmInfo{"ML-DSA-44",   KeyKind::Signature, 2, 5},
    AlgorithmInfo{"Dilithium2",  KeyKind::Signature, 2, 6},
    AlgorithmInfo{"Falcon-512",  KeyKind::Signature, 1, 7},
};

void append_token(std::string& out, std::string_view name)
{
    for (char ch : name)
    {
        out.push_back(ch == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
}

} // namespace

std::string AlgorithmSuite::cipher_suite() const
{
    std::string out = "PQ_";
    append_token(out, kem);
    out.push_back('_');
    append_token(out, sig);
    return out;
}

std::span<const AlgorithmInfo> default_catalog()
{
    return catalog_entries;
}

const AlgorithmInfo* find_algorithm(std::string_view name, KeyKind kind, std::span<const AlgorithmInfo> catalog)
{
    auto it = std::ranges::find_if(catalog, [&](const AlgorithmInfo& info)
    {
        return info.kind == kind && info.name == name;
    });
    return it == catalog.end() ? nullptr : std::addressof(*it);
}

std::optional<std::string> negotiate(
    std::span<const std::string> offered,
    std::span<const std::string> supported,
    KeyKind kind,
    std::span<const AlgorithmInfo> catalog)
{
    const AlgorithmInfo* best = nullptr;
    for (const auto& name : offered)
    {
        if (std::ranges::find(supported, name) == supported.end())
        {
            continue;
        }
        const AlgorithmInfo* info = find_algorithm(name, kind, catalog);
        if (!info)
        {
            continue;
        }
        if (!best
            || info->rank > best->rank
            || (info->rank == best->rank && info->preference < best->preference))
        {
            best = info;
        }
    }

    if (!best)
    {
        return std::nullopt;
    }
    return std::string(best->name);
}

} // namespace keys
