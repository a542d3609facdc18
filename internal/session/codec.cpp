#include "codec.hpp"

namespace cookiesession::session {

namespace {

void PutUint64BE(uint64_t v, std::vector<uint8_t>& out) {
  for (int shift = 56; shift >= 0; shift -= 8) {
    out.push_back(static_cast<uint8_t>(v >> shift));
  }
}

uint64_t ReadUint64BE(const uint8_t* data) {
  uint64_t v = 0;
  for (size_t i = 0; i < kTimeSize; ++i) {
    v = (v << 8) | data[i];
  }
  return v;
}

} // namespace

std::vector<uint8_t> Encode(const Session& session) {
  std::vector<uint8_t> buf;
  buf.reserve(kHeaderSize + session.state.size());

  PutUint64BE(static_cast<uint64_t>(util::ToUnixSeconds(session.time)), buf);
  buf.insert(buf.end(), session.sid.begin(), session.sid.end());
  buf.insert(buf.end(), session.uid.begin(), session.uid.end());
  buf.insert(buf.end(), session.real_uid.begin(), session.real_uid.end());
  buf.insert(buf.end(), session.state.begin(), session.state.end());

  return buf;
}

DecodeResult Decode(const uint8_t* data, size_t size, const IdScheme& ids) {
  DecodeResult result;

  if (size < kHeaderSize) {
    result.status = Result::Err(ErrorCode::TooShort, "encoded session data is too short");
    return result;
  }

  const auto sid = ids.Parse(data + kTimeSize, kIdSize);
  if (!sid) {
    result.status = Result::Err(ErrorCode::MalformedIdentifier, "sid");
    return result;
  }

  const auto uid = ids.Parse(data + kTimeSize + kIdSize, kIdSize);
  if (!uid) {
    result.status = Result::Err(ErrorCode::MalformedIdentifier, "uid");
    return result;
  }

  const auto real_uid = ids.Parse(data + kTimeSize + 2 * kIdSize, kIdSize);
  if (!real_uid) {
    result.status = Result::Err(ErrorCode::MalformedIdentifier, "real_uid");
    return result;
  }

  auto& s    = result.session;
  s.valid    = true;
  s.time     = util::FromUnixSeconds(static_cast<int64_t>(ReadUint64BE(data)));
  s.sid      = *sid;
  s.uid      = *uid;
  s.real_uid = *real_uid;
  s.state.assign(reinterpret_cast<const char*>(data + kHeaderSize), size - kHeaderSize);

  return result;
}

DecodeResult Decode(const std::vector<uint8_t>& data, const IdScheme& ids) {
  return Decode(data.data(), data.size(), ids);
}

} // namespace cookiesession::session
