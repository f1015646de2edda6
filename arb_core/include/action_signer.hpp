#pragma once
#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

class SignerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using Hash32 = std::array<unsigned char, 32>;

// Signs exchange actions before they go out on the post channel.
// Returns the wire signature {"r": "0x..", "s": "0x..", "v": 27|28}.
class IActionSigner {
public:
    virtual ~IActionSigner() = default;

    virtual nlohmann::ordered_json sign_action(const nlohmann::ordered_json& action, long long nonce) const = 0;
    virtual const std::string& address() const = 0;
};

// secp256k1 wallet key (main wallet or API wallet).
// L1 actions are signed as an EIP-712 "Agent" whose connectionId is
// keccak256(msgpack(action) || nonce || no-vault flag).
// Needs the KECCAK-256 digest from OpenSSL 3.2+; throws SignerError otherwise.
class WalletSigner : public IActionSigner {
public:
    WalletSigner(const std::string& private_key_hex, bool mainnet);

    nlohmann::ordered_json sign_action(const nlohmann::ordered_json& action, long long nonce) const override;
    const std::string& address() const override { return address_; }

    nlohmann::ordered_json sign_digest(const Hash32& digest) const;

private:
    Hash32 private_key_{};
    bool mainnet_;
    std::string address_;
};

bool keccak_available();
Hash32 keccak256(const unsigned char* data, std::size_t len);
Hash32 keccak256(const std::string& data);

Hash32 action_hash(const nlohmann::ordered_json& action, long long nonce);
Hash32 agent_digest(const Hash32& connection_id, bool mainnet);

std::string to_hex(const unsigned char* data, std::size_t len);

// Address of the key that produced signature over digest
std::string recover_signer(const Hash32& digest, const nlohmann::ordered_json& signature);
