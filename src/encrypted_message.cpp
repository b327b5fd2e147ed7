// -----------------------------------------------------------------------------
// encrypted_message.cpp: envelope (de)serialization.
// -----------------------------------------------------------------------------
#include "hopmesh/encrypted_message.hpp"

namespace hopmesh {

const char* to_string(CryptoResult r) {
  switch (r) {
    case CryptoResult::Ok:                   return "ok";
    case CryptoResult::InvalidSignature:     return "invalid signature";
    case CryptoResult::MissingEphemeralKey:  return "missing ephemeral key";
    case CryptoResult::MissingKeyMaterial:   return "missing key material";
    case CryptoResult::DecryptFailed:        return "decrypt failed";
    case CryptoResult::WrongChannelPassword: return "wrong channel password";
    case CryptoResult::ChannelNotJoined:     return "channel not joined";
    case CryptoResult::MalformedEnvelope:    return "malformed envelope";
    case CryptoResult::InternalError:        return "internal crypto error";
  }
  return "?";
}

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

void put_field(std::vector<uint8_t>& out, const std::vector<uint8_t>& field) {
  put_u32(out, static_cast<uint32_t>(field.size()));
  out.insert(out.end(), field.begin(), field.end());
}

void put_optional(std::vector<uint8_t>& out, const std::optional<std::vector<uint8_t>>& field) {
  if (!field) {
    out.push_back(0);
    return;
  }
  out.push_back(1);
  put_field(out, *field);
}

// Cursor over the input. Every read checks the remaining length.
struct Reader {
  const uint8_t* p;
  size_t         left;

  bool u8(uint8_t& v) {
    if (left < 1) return false;
    v = *p++;
    --left;
    return true;
  }

  bool field(std::vector<uint8_t>& out) {
    if (left < 4) return false;
    const uint32_t n = (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
                       (static_cast<uint32_t>(p[2]) << 8)  |  static_cast<uint32_t>(p[3]);
    p += 4;
    left -= 4;
    if (n > left) return false;
    out.assign(p, p + n);
    p += n;
    left -= n;
    return true;
  }

  bool optional(std::optional<std::vector<uint8_t>>& out) {
    uint8_t present = 0;
    if (!u8(present)) return false;
    if (present == 0) {
      out.reset();
      return true;
    }
    if (present != 1) return false;
    std::vector<uint8_t> v;
    if (!field(v)) return false;
    out = std::move(v);
    return true;
  }
};

} // namespace

std::vector<uint8_t> EncryptedMessage::signed_bytes() const {
  std::vector<uint8_t> out;
  out.reserve(ciphertext.size() + nonce.size() + tag.size());
  out.insert(out.end(), ciphertext.begin(), ciphertext.end());
  out.insert(out.end(), nonce.begin(), nonce.end());
  out.insert(out.end(), tag.begin(), tag.end());
  return out;
}

void EncryptedMessage::serialize(std::vector<uint8_t>& out) const {
  out.clear();
  out.reserve(ciphertext.size() + nonce.size() + tag.size() + 3 * 4 + 3 * 5 + 128);
  put_field(out, ciphertext);
  put_field(out, nonce);
  put_field(out, tag);
  put_optional(out, ephemeral_public);
  put_optional(out, signature);
  put_optional(out, signing_public);
}

CryptoResult EncryptedMessage::deserialize(const uint8_t* data, size_t len, EncryptedMessage& out) {
  if (data == nullptr && len != 0) return CryptoResult::MalformedEnvelope;

  Reader r{data, len};
  EncryptedMessage m;
  if (!r.field(m.ciphertext) || !r.field(m.nonce) || !r.field(m.tag) ||
      !r.optional(m.ephemeral_public) || !r.optional(m.signature) || !r.optional(m.signing_public)) {
    return CryptoResult::MalformedEnvelope;
  }
  if (r.left != 0) return CryptoResult::MalformedEnvelope;   // trailing bytes

  out = std::move(m);
  return CryptoResult::Ok;
}

} // namespace hopmesh
