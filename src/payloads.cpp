// -----------------------------------------------------------------------------
// payloads.cpp: per-type frame bodies.
// -----------------------------------------------------------------------------
#include "hopmesh/payloads.hpp"
#include "hopmesh/crypto.hpp"

namespace hopmesh {

bool encode_announcement(const AnnouncementPayload& in, std::vector<uint8_t>& out) {
  if (in.agreement_public.size() != crypto::PUBLIC_KEY_SIZE ||
      in.signing_public.size()   != crypto::PUBLIC_KEY_SIZE) {
    return false;
  }
  const size_t nick_len = in.nickname.size() > MAX_NICKNAME_LEN ? MAX_NICKNAME_LEN : in.nickname.size();

  out.clear();
  out.reserve(1 + nick_len + 2 * crypto::PUBLIC_KEY_SIZE);
  out.push_back(static_cast<uint8_t>(nick_len));
  out.insert(out.end(), in.nickname.begin(), in.nickname.begin() + nick_len);
  out.insert(out.end(), in.agreement_public.begin(), in.agreement_public.end());
  out.insert(out.end(), in.signing_public.begin(), in.signing_public.end());
  return true;
}

bool decode_announcement(const std::vector<uint8_t>& in, AnnouncementPayload& out) {
  if (in.empty()) return false;
  const size_t nick_len = in[0];
  if (in.size() != 1 + nick_len + 2 * crypto::PUBLIC_KEY_SIZE) return false;

  auto p = in.begin() + 1;
  out.nickname.assign(p, p + nick_len);
  p += nick_len;
  out.agreement_public.assign(p, p + crypto::PUBLIC_KEY_SIZE);
  p += crypto::PUBLIC_KEY_SIZE;
  out.signing_public.assign(p, p + crypto::PUBLIC_KEY_SIZE);
  return true;
}

void encode_private(const PrivatePayload& in, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(CompactId::SIZE + in.envelope.size());
  out.insert(out.end(), in.recipient.bytes.begin(), in.recipient.bytes.end());
  out.insert(out.end(), in.envelope.begin(), in.envelope.end());
}

bool decode_private(const std::vector<uint8_t>& in, PrivatePayload& out) {
  if (in.size() <= CompactId::SIZE) return false;
  out.recipient = CompactId(in.data());
  out.envelope.assign(in.begin() + CompactId::SIZE, in.end());
  return true;
}

bool encode_channel(const ChannelPayload& in, std::vector<uint8_t>& out) {
  if (in.channel.empty() || in.channel.size() > MAX_CHANNEL_NAME_LEN) return false;
  out.clear();
  out.reserve(1 + in.channel.size() + in.envelope.size());
  out.push_back(static_cast<uint8_t>(in.channel.size()));
  out.insert(out.end(), in.channel.begin(), in.channel.end());
  out.insert(out.end(), in.envelope.begin(), in.envelope.end());
  return true;
}

bool decode_channel(const std::vector<uint8_t>& in, ChannelPayload& out) {
  if (in.empty()) return false;
  const size_t name_len = in[0];
  if (name_len == 0 || in.size() <= 1 + name_len) return false;
  out.channel.assign(in.begin() + 1, in.begin() + 1 + name_len);
  out.envelope.assign(in.begin() + 1 + name_len, in.end());
  return true;
}

} // namespace hopmesh
