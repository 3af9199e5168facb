#include "keys/key_pair.hpp"

namespace keys
{

KeyPair::KeyPair(KeyKind kind,
                 std::string algorithm,
                 std::vector<uint8_t> public_key,
                 crypto::SecretBytes secret_key,
                 uint32_t version,
                 time_point created_at,
                 std::string key_id,
                 std::string parent_key_id)
    : kind_(kind)
    , algorithm_(std::move(algorithm))
    , public_key_(std::move(public_key))
    , secret_key_(std::move(secret_key))
    , version_(version)
    , created_at_(created_at)
    , key_id_(std::move(key_id))
    , parent_key_id_(std::move(parent_key_id))
{
}

PublicKeyInfo describe(const KeyPair& kp)
{
    return PublicKeyInfo{
        .kind = kp.kind(),
        .algorithm = kp.algorithm(),
        .public_key = kp.public_key(),
        .version = kp.version(),
        .key_id = kp.key_id(),
        .created_at = kp.created_at(),
    };
}

} // namespace keys
