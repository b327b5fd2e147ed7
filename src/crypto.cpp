// -----------------------------------------------------------------------------
// crypto.cpp: OpenSSL EVP glue: Ed25519, X25519, HKDF, scrypt, ChaCha20-Poly1305.
// -----------------------------------------------------------------------------
#include "hopmesh/crypto.hpp"
#include "hopmesh/log.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

namespace hopmesh::crypto {

namespace {

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* c) const { EVP_PKEY_CTX_free(c); }
};
struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};
struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* c) const { EVP_CIPHER_CTX_free(c); }
};
using PkeyCtxPtr   = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using MdCtxPtr     = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

// Drain the OpenSSL error queue into one log record.
void log_failure(const char* what) {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    HOPMESH_LOG_ERROR("crypto", what << " failed");
    return;
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  HOPMESH_LOG_ERROR("crypto", what << " failed: " << buf);
  ERR_clear_error();
}

PkeyPtr generate(int type, const char* what) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(type, nullptr));
  EVP_PKEY*  raw = nullptr;
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 || EVP_PKEY_keygen(ctx.get(), &raw) <= 0) {
    log_failure(what);
    return PkeyPtr();
  }
  return PkeyPtr(raw);
}

} // namespace

// =============================================================================
// Key pairs
// =============================================================================

PkeyPtr generate_ed25519() { return generate(EVP_PKEY_ED25519, "ed25519 keygen"); }
PkeyPtr generate_x25519()  { return generate(EVP_PKEY_X25519, "x25519 keygen"); }

PkeyPtr ed25519_from_seed(const Bytes& seed) {
  if (seed.size() != KEY_SIZE) return PkeyPtr();
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
  if (!key) log_failure("ed25519 import");
  return key;
}

PkeyPtr x25519_from_private(const Bytes& priv) {
  if (priv.size() != KEY_SIZE) return PkeyPtr();
  PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, priv.data(), priv.size()));
  if (!key) log_failure("x25519 import");
  return key;
}

bool raw_public_key(EVP_PKEY* key, Bytes& out) {
  if (!key) return false;
  size_t len = PUBLIC_KEY_SIZE;
  out.assign(len, 0);
  if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1) {
    log_failure("raw public key");
    out.clear();
    return false;
  }
  out.resize(len);
  return true;
}

bool raw_private_key(EVP_PKEY* key, Bytes& out) {
  if (!key) return false;
  size_t len = KEY_SIZE;
  out.assign(len, 0);
  if (EVP_PKEY_get_raw_private_key(key, out.data(), &len) != 1) {
    log_failure("raw private key");
    wipe(out);
    return false;
  }
  out.resize(len);
  return true;
}

// =============================================================================
// Agreement & signatures
// =============================================================================

bool x25519_derive(EVP_PKEY* priv, const Bytes& peer_public, Bytes& secret_out) {
  if (!priv || peer_public.size() != PUBLIC_KEY_SIZE) return false;

  PkeyPtr peer(EVP_PKEY_new_raw_public_key(EVP_PKEY_X25519, nullptr,
                                           peer_public.data(), peer_public.size()));
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new(priv, nullptr));
  if (!peer || !ctx) {
    log_failure("x25519 setup");
    return false;
  }

  size_t len = 0;
  if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
      EVP_PKEY_derive_set_peer(ctx.get(), peer.get()) <= 0 ||
      EVP_PKEY_derive(ctx.get(), nullptr, &len) <= 0) {
    log_failure("x25519 derive");
    return false;
  }
  secret_out.assign(len, 0);
  if (EVP_PKEY_derive(ctx.get(), secret_out.data(), &len) <= 0) {
    log_failure("x25519 derive");
    wipe(secret_out);
    return false;
  }
  secret_out.resize(len);
  return true;
}

bool ed25519_sign(EVP_PKEY* key, const Bytes& data, Bytes& sig_out) {
  if (!key) return false;
  MdCtxPtr ctx(EVP_MD_CTX_new());
  size_t len = SIGNATURE_SIZE;
  sig_out.assign(len, 0);
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key) != 1 ||
      EVP_DigestSign(ctx.get(), sig_out.data(), &len, data.data(), data.size()) != 1) {
    log_failure("ed25519 sign");
    sig_out.clear();
    return false;
  }
  sig_out.resize(len);
  return true;
}

// A bad signature is an expected outcome, not a backend error: no error log.
bool ed25519_verify(const Bytes& public_key, const Bytes& data, const Bytes& sig) {
  if (public_key.size() != PUBLIC_KEY_SIZE || sig.size() != SIGNATURE_SIZE) return false;

  PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                          public_key.data(), public_key.size()));
  MdCtxPtr ctx(EVP_MD_CTX_new());
  if (!key || !ctx) {
    ERR_clear_error();
    return false;
  }
  const bool ok =
      EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) == 1 &&
      EVP_DigestVerify(ctx.get(), sig.data(), sig.size(), data.data(), data.size()) == 1;
  ERR_clear_error();
  return ok;
}

// =============================================================================
// Key derivation
// =============================================================================

bool hkdf_sha256(const Bytes& ikm, const std::string& info, size_t out_len, Bytes& out) {
  PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  out.assign(out_len, 0);
  size_t len = out_len;
  if (!ctx ||
      EVP_PKEY_derive_init(ctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
      EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), reinterpret_cast<const unsigned char*>(info.data()),
                                  static_cast<int>(info.size())) <= 0 ||
      EVP_PKEY_derive(ctx.get(), out.data(), &len) <= 0 ||
      len != out_len) {
    log_failure("hkdf-sha256");
    wipe(out);
    return false;
  }
  return true;
}

bool scrypt_derive(const std::string& password, const std::string& salt, Bytes& out) {
  out.assign(KEY_SIZE, 0);
  // 128 * N * r bytes of working memory, with headroom for the block array.
  const uint64_t max_mem = 128ull * SCRYPT_N * SCRYPT_R * 2ull;
  if (EVP_PBE_scrypt(password.data(), password.size(),
                     reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
                     SCRYPT_N, SCRYPT_R, SCRYPT_P, max_mem,
                     out.data(), out.size()) != 1) {
    log_failure("scrypt");
    wipe(out);
    return false;
  }
  return true;
}

bool random_bytes(size_t n, Bytes& out) {
  out.assign(n, 0);
  if (n == 0) return true;
  if (RAND_bytes(out.data(), static_cast<int>(n)) != 1) {
    log_failure("RAND_bytes");
    out.clear();
    return false;
  }
  return true;
}

// =============================================================================
// AEAD
// =============================================================================

bool aead_encrypt(const Bytes& key, const Bytes& nonce, const Bytes& plain,
                  Bytes& cipher_out, Bytes& tag_out) {
  if (key.size() != KEY_SIZE || nonce.size() != NONCE_SIZE) return false;

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx ||
      EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    log_failure("chacha20-poly1305 init");
    return false;
  }

  cipher_out.assign(plain.size(), 0);
  int len = 0;
  if (!plain.empty() &&
      EVP_EncryptUpdate(ctx.get(), cipher_out.data(), &len, plain.data(),
                        static_cast<int>(plain.size())) != 1) {
    log_failure("chacha20-poly1305 encrypt");
    return false;
  }
  int fin = 0;
  unsigned char tail[16];
  if (EVP_EncryptFinal_ex(ctx.get(), tail, &fin) != 1) {
    log_failure("chacha20-poly1305 final");
    return false;
  }

  tag_out.assign(TAG_SIZE, 0);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG, static_cast<int>(TAG_SIZE), tag_out.data()) != 1) {
    log_failure("chacha20-poly1305 tag");
    return false;
  }
  return true;
}

bool aead_decrypt(const Bytes& key, const Bytes& nonce, const Bytes& cipher,
                  const Bytes& tag, Bytes& plain_out) {
  if (key.size() != KEY_SIZE || nonce.size() != NONCE_SIZE || tag.size() != TAG_SIZE) return false;

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx ||
      EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    log_failure("chacha20-poly1305 init");
    return false;
  }

  Bytes plain(cipher.size(), 0);
  int len = 0;
  if (!cipher.empty() &&
      EVP_DecryptUpdate(ctx.get(), plain.data(), &len, cipher.data(),
                        static_cast<int>(cipher.size())) != 1) {
    ERR_clear_error();
    wipe(plain);
    return false;
  }

  Bytes tag_copy(tag);
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG, static_cast<int>(TAG_SIZE), tag_copy.data()) != 1) {
    log_failure("chacha20-poly1305 tag");
    wipe(plain);
    return false;
  }

  // Tag mismatch: the plaintext buffer must never reach a caller.
  int fin = 0;
  unsigned char tail[16];
  if (EVP_DecryptFinal_ex(ctx.get(), tail, &fin) != 1) {
    ERR_clear_error();
    wipe(plain);
    return false;
  }

  plain_out.swap(plain);
  return true;
}

void wipe(Bytes& b) {
  if (!b.empty()) OPENSSL_cleanse(b.data(), b.size());
  b.clear();
}

bool equal(const Bytes& a, const Bytes& b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace hopmesh::crypto
