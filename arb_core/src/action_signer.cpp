#include "action_signer.hpp"
#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

namespace {

struct OsslFree {
    void operator()(BIGNUM* p) const { BN_free(p); }
    void operator()(BN_CTX* p) const { BN_CTX_free(p); }
    void operator()(EC_GROUP* p) const { EC_GROUP_free(p); }
    void operator()(EC_POINT* p) const { EC_POINT_free(p); }
    void operator()(EC_KEY* p) const { EC_KEY_free(p); }
    void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); }
    void operator()(EVP_MD* p) const { EVP_MD_free(p); }
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

template <typename T>
using Ossl = std::unique_ptr<T, OsslFree>;

template <typename T>
Ossl<T> checked(T* p, const char* what) {
    if (!p) {
        ERR_clear_error();
        throw SignerError(std::string("openssl: ") + what + " failed");
    }
    return Ossl<T>(p);
}

void append(std::vector<unsigned char>& out, const Hash32& h) {
    out.insert(out.end(), h.begin(), h.end());
}

// big-endian uint256
Hash32 uint256(unsigned long long v) {
    Hash32 out{};
    for (int i = 0; i < 8; ++i) {
        out[31 - i] = static_cast<unsigned char>((v >> (8 * i)) & 0xff);
    }
    return out;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string strip_0x(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) return hex.substr(2);
    return hex;
}

Hash32 parse_private_key(const std::string& hex) {
    const std::string digits = strip_0x(hex);
    if (digits.size() != 64) {
        throw SignerError("private key must be 32 bytes of hex");
    }
    Hash32 key{};
    for (std::size_t i = 0; i < key.size(); ++i) {
        int hi = hex_value(digits[2 * i]);
        int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw SignerError("private key is not hex");
        }
        key[i] = static_cast<unsigned char>((hi << 4) | lo);
    }
    return key;
}

struct KeyPair {
    Ossl<BN_CTX> ctx;
    Ossl<EC_GROUP> group;
    Ossl<BIGNUM> secret;
    Ossl<EC_POINT> pub;
};

KeyPair load_key(const Hash32& private_key) {
    KeyPair k;
    k.ctx = checked(BN_CTX_new(), "BN_CTX_new");
    k.group = checked(EC_GROUP_new_by_curve_name(NID_secp256k1), "secp256k1 group");
    k.secret = checked(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr), "BN_bin2bn");

    if (BN_is_zero(k.secret.get()) || BN_cmp(k.secret.get(), EC_GROUP_get0_order(k.group.get())) >= 0) {
        throw SignerError("private key out of range");
    }

    k.pub = checked(EC_POINT_new(k.group.get()), "EC_POINT_new");
    if (EC_POINT_mul(k.group.get(), k.pub.get(), k.secret.get(), nullptr, nullptr, k.ctx.get()) != 1) {
        throw SignerError("public key derivation failed");
    }
    return k;
}

// Last 20 bytes of keccak256(X || Y)
std::string address_of(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
    unsigned char buf[65];
    std::size_t n = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED, buf, sizeof(buf), ctx);
    if (n != sizeof(buf)) {
        throw SignerError("public key encoding failed");
    }
    Hash32 h = keccak256(buf + 1, 64);
    return "0x" + to_hex(h.data() + 12, 20);
}

// Q = r^-1 (s*R - e*G), R being the point with x = r and the given y parity.
// Null when r is not the x of a curve point.
Ossl<EC_POINT> recover_point(const EC_GROUP* group, const BIGNUM* r, const BIGNUM* s,
                             const Hash32& digest, int y_bit, BN_CTX* ctx) {
    const BIGNUM* order = EC_GROUP_get0_order(group);

    Ossl<BIGNUM> e = checked(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr), "BN_bin2bn");
    Ossl<BIGNUM> e_mod = checked(BN_new(), "BN_new");
    Ossl<BIGNUM> neg_e = checked(BN_new(), "BN_new");
    Ossl<BIGNUM> u1 = checked(BN_new(), "BN_new");
    Ossl<BIGNUM> u2 = checked(BN_new(), "BN_new");
    Ossl<BIGNUM> r_inv = checked(BN_mod_inverse(nullptr, r, order, ctx), "BN_mod_inverse");

    if (BN_nnmod(e_mod.get(), e.get(), order, ctx) != 1
        || BN_sub(neg_e.get(), order, e_mod.get()) != 1
        || BN_mod_mul(u1.get(), neg_e.get(), r_inv.get(), order, ctx) != 1
        || BN_mod_mul(u2.get(), s, r_inv.get(), order, ctx) != 1) {
        throw SignerError("recovery scalars failed");
    }

    Ossl<EC_POINT> big_r = checked(EC_POINT_new(group), "EC_POINT_new");
    if (EC_POINT_set_compressed_coordinates(group, big_r.get(), r, y_bit, ctx) != 1) {
        ERR_clear_error();
        return nullptr;
    }

    Ossl<EC_POINT> q = checked(EC_POINT_new(group), "EC_POINT_new");
    if (EC_POINT_mul(group, q.get(), u1.get(), big_r.get(), u2.get(), ctx) != 1) {
        throw SignerError("point recovery failed");
    }
    return q;
}

std::string bn_hex32(const BIGNUM* bn) {
    unsigned char buf[32];
    if (BN_bn2binpad(bn, buf, sizeof(buf)) != static_cast<int>(sizeof(buf))) {
        throw SignerError("signature component too large");
    }
    return "0x" + to_hex(buf, sizeof(buf));
}

Ossl<BIGNUM> bn_from_hex(const std::string& hex) {
    BIGNUM* raw = nullptr;
    const std::string digits = strip_0x(hex);
    if (digits.empty() || BN_hex2bn(&raw, digits.c_str()) != static_cast<int>(digits.size())) {
        BN_free(raw);
        ERR_clear_error();
        throw SignerError("bad signature component: " + hex);
    }
    return Ossl<BIGNUM>(raw);
}

}  // namespace

std::string to_hex(const unsigned char* data, std::size_t len) {
    std::stringstream ss;
    for (std::size_t i = 0; i < len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

bool keccak_available() {
    Ossl<EVP_MD> md(EVP_MD_fetch(nullptr, "KECCAK-256", nullptr));
    if (!md) ERR_clear_error();
    return md != nullptr;
}

Hash32 keccak256(const unsigned char* data, std::size_t len) {
    Ossl<EVP_MD> md(EVP_MD_fetch(nullptr, "KECCAK-256", nullptr));
    if (!md) {
        ERR_clear_error();
        throw SignerError("KECCAK-256 digest not available, OpenSSL 3.2 or newer is required");
    }
    Ossl<EVP_MD_CTX> ctx = checked(EVP_MD_CTX_new(), "EVP_MD_CTX_new");

    Hash32 out{};
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data, len) != 1
        || EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1
        || out_len != out.size()) {
        ERR_clear_error();
        throw SignerError("keccak256 failed");
    }
    return out;
}

Hash32 keccak256(const std::string& data) {
    return keccak256(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

// msgpack(action) || nonce (u64 big-endian) || 0x00 (no vault)
Hash32 action_hash(const nlohmann::ordered_json& action, long long nonce) {
    std::vector<std::uint8_t> data = nlohmann::ordered_json::to_msgpack(action);
    const auto n = static_cast<unsigned long long>(nonce);
    for (int shift = 56; shift >= 0; shift -= 8) {
        data.push_back(static_cast<std::uint8_t>((n >> shift) & 0xff));
    }
    data.push_back(0x00);
    return keccak256(data.data(), data.size());
}

// EIP-712 digest of Agent{source, connectionId} in the "Exchange" v1 domain, chain 1337
Hash32 agent_digest(const Hash32& connection_id, bool mainnet) {
    std::vector<unsigned char> domain;
    append(domain, keccak256("EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)"));
    append(domain, keccak256("Exchange"));
    append(domain, keccak256("1"));
    append(domain, uint256(1337));
    append(domain, Hash32{});
    const Hash32 domain_separator = keccak256(domain.data(), domain.size());

    std::vector<unsigned char> agent;
    append(agent, keccak256("Agent(string source,bytes32 connectionId)"));
    append(agent, keccak256(mainnet ? "a" : "b"));
    append(agent, connection_id);
    const Hash32 struct_hash = keccak256(agent.data(), agent.size());

    std::vector<unsigned char> message = {0x19, 0x01};
    append(message, domain_separator);
    append(message, struct_hash);
    return keccak256(message.data(), message.size());
}

WalletSigner::WalletSigner(const std::string& private_key_hex, bool mainnet)
    : private_key_(parse_private_key(private_key_hex)), mainnet_(mainnet)
{
    KeyPair key = load_key(private_key_);
    address_ = address_of(key.group.get(), key.pub.get(), key.ctx.get());
}

nlohmann::ordered_json WalletSigner::sign_action(const nlohmann::ordered_json& action, long long nonce) const {
    return sign_digest(agent_digest(action_hash(action, nonce), mainnet_));
}

nlohmann::ordered_json WalletSigner::sign_digest(const Hash32& digest) const {
    KeyPair key = load_key(private_key_);
    const EC_GROUP* group = key.group.get();
    const BIGNUM* order = EC_GROUP_get0_order(group);

    Ossl<EC_KEY> ec = checked(EC_KEY_new_by_curve_name(NID_secp256k1), "EC_KEY_new_by_curve_name");
    if (EC_KEY_set_private_key(ec.get(), key.secret.get()) != 1
        || EC_KEY_set_public_key(ec.get(), key.pub.get()) != 1) {
        throw SignerError("EC key setup failed");
    }

    Ossl<ECDSA_SIG> sig = checked(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), ec.get()),
                                  "ECDSA_do_sign");
    const BIGNUM* r = nullptr;
    const BIGNUM* s_raw = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s_raw);

    // Low-s form
    Ossl<BIGNUM> s = checked(BN_dup(s_raw), "BN_dup");
    Ossl<BIGNUM> half = checked(BN_new(), "BN_new");
    if (BN_rshift1(half.get(), order) != 1) {
        throw SignerError("BN_rshift1 failed");
    }
    if (BN_cmp(s.get(), half.get()) > 0 && BN_sub(s.get(), order, s.get()) != 1) {
        throw SignerError("BN_sub failed");
    }

    int recovery_id = -1;
    for (int y_bit = 0; y_bit < 2 && recovery_id < 0; ++y_bit) {
        Ossl<EC_POINT> q = recover_point(group, r, s.get(), digest, y_bit, key.ctx.get());
        if (q && EC_POINT_cmp(group, q.get(), key.pub.get(), key.ctx.get()) == 0) {
            recovery_id = y_bit;
        }
    }
    if (recovery_id < 0) {
        throw SignerError("could not derive recovery id");
    }

    nlohmann::ordered_json out;
    out["r"] = bn_hex32(r);
    out["s"] = bn_hex32(s.get());
    out["v"] = 27 + recovery_id;
    return out;
}

std::string recover_signer(const Hash32& digest, const nlohmann::ordered_json& signature) {
    Ossl<BN_CTX> ctx = checked(BN_CTX_new(), "BN_CTX_new");
    Ossl<EC_GROUP> group = checked(EC_GROUP_new_by_curve_name(NID_secp256k1), "secp256k1 group");

    Ossl<BIGNUM> r = bn_from_hex(signature.at("r").get<std::string>());
    Ossl<BIGNUM> s = bn_from_hex(signature.at("s").get<std::string>());
    const int v = signature.at("v").get<int>();
    if (v != 27 && v != 28) {
        throw SignerError("bad recovery id " + std::to_string(v));
    }

    Ossl<EC_POINT> q = recover_point(group.get(), r.get(), s.get(), digest, v - 27, ctx.get());
    if (!q) {
        throw SignerError("signature does not recover to a point");
    }
    return address_of(group.get(), q.get(), ctx.get());
}
