/**
 * @file crypto.hpp
 * @brief Thin OpenSSL (libcrypto) wrappers used by KeyManager and EncryptionService.
 *
 * @details
 * | Concern          | Primitive                      | Sizes (bytes)            |
 * |------------------|--------------------------------|--------------------------|
 * | signing          | Ed25519                        | pub 32, seed 32, sig 64  |
 * | key agreement    | X25519                         | pub 32, priv 32, out 32  |
 * | key derivation   | HKDF-SHA256 (empty salt)       | out 32                   |
 * | channel keys     | scrypt N=16384 r=8 p=1         | out 32                   |
 * | AEAD             | ChaCha20-Poly1305              | key 32, nonce 12, tag 16 |
 * | randomness       | RAND_bytes                     |                          |
 *
 * Every function reports failure as `false` and logs the OpenSSL error queue
 * under the `crypto` tag. Nothing here throws.
 */
#ifndef HOPMESH_CRYPTO_HPP
#define HOPMESH_CRYPTO_HPP

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace hopmesh::crypto {

using Bytes = std::vector<uint8_t>;

static constexpr size_t KEY_SIZE        = 32;
static constexpr size_t PUBLIC_KEY_SIZE = 32;
static constexpr size_t NONCE_SIZE      = 12;
static constexpr size_t TAG_SIZE        = 16;
static constexpr size_t SIGNATURE_SIZE  = 64;

static constexpr uint64_t SCRYPT_N = 16384;
static constexpr uint64_t SCRYPT_R = 8;
static constexpr uint64_t SCRYPT_P = 1;

struct PkeyDeleter {
  void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

/// @name Key pairs
///@{
PkeyPtr generate_ed25519();
PkeyPtr generate_x25519();
PkeyPtr ed25519_from_seed(const Bytes& seed);
PkeyPtr x25519_from_private(const Bytes& priv);
bool    raw_public_key(EVP_PKEY* key, Bytes& out);
bool    raw_private_key(EVP_PKEY* key, Bytes& out);
///@}

/// X25519: `secret_out` = DH(priv, peer_public). Fails on a low-order peer key.
bool x25519_derive(EVP_PKEY* priv, const Bytes& peer_public, Bytes& secret_out);

bool ed25519_sign(EVP_PKEY* key, const Bytes& data, Bytes& sig_out);
bool ed25519_verify(const Bytes& public_key, const Bytes& data, const Bytes& sig);

/// HKDF-SHA256 with an empty salt.
bool hkdf_sha256(const Bytes& ikm, const std::string& info, size_t out_len, Bytes& out);

/// scrypt(password, salt) -> KEY_SIZE bytes.
bool scrypt_derive(const std::string& password, const std::string& salt, Bytes& out);

bool random_bytes(size_t n, Bytes& out);

/// ChaCha20-Poly1305 without associated data.
bool aead_encrypt(const Bytes& key, const Bytes& nonce, const Bytes& plain,
                  Bytes& cipher_out, Bytes& tag_out);

/// @return false when the tag does not verify (or on backend failure).
bool aead_decrypt(const Bytes& key, const Bytes& nonce, const Bytes& cipher,
                  const Bytes& tag, Bytes& plain_out);

/// Overwrite and clear (OPENSSL_cleanse).
void wipe(Bytes& b);

/// Constant-time equality for equal-length buffers.
bool equal(const Bytes& a, const Bytes& b);

} // namespace hopmesh::crypto

#endif // HOPMESH_CRYPTO_HPP
