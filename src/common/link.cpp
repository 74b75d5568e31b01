
#include "link.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstring>

namespace scanlink {

void pack_envelope_header(Opcode op, uint32_t len, uint8_t *out) {
  out[0] = static_cast<uint8_t>(op);
  put_u32le(out + 1, len);
}

Bytes make_envelope(Opcode op, const uint8_t *data, size_t len) {
  Bytes buf(kEnvelopeHeaderSize + len);
  pack_envelope_header(op, (uint32_t)len, buf.data());
  if (len)
    std::memcpy(buf.data() + kEnvelopeHeaderSize, data, len);
  return buf;
}

Bytes make_text_envelope(const std::string &s) {
  return make_envelope(Opcode::Text, (const uint8_t *)s.data(), s.size());
}

void EnvelopeReader::feed(const uint8_t *data, size_t len) {
  if (off_ > 0 && off_ == inbuf_.size()) {
    inbuf_.clear();
    off_ = 0;
  }
  inbuf_.insert(inbuf_.end(), data, data + len);
}

bool EnvelopeReader::next(Envelope &out, std::error_code &ec) {
  ec.clear();
  if (inbuf_.size() - off_ < kEnvelopeHeaderSize)
    return false;
  const uint8_t *p = inbuf_.data() + off_;
  uint8_t op = p[0];
  if (op != static_cast<uint8_t>(Opcode::Text) &&
      op != static_cast<uint8_t>(Opcode::Binary) &&
      op != static_cast<uint8_t>(Opcode::Close)) {
    ec = Errc::MalformedEnvelope;
    return false;
  }
  uint32_t len = get_u32le(p + 1);
  if (len > max_message_size_) {
    ec = Errc::MessageTooLarge;
    return false;
  }
  size_t need = kEnvelopeHeaderSize + len;
  if (inbuf_.size() - off_ < need)
    return false;
  out.op = static_cast<Opcode>(op);
  out.payload.assign(p + kEnvelopeHeaderSize, p + need);
  off_ += need;
  if (off_ == inbuf_.size()) {
    inbuf_.clear();
    off_ = 0;
  } else if (off_ > (1u << 20)) {
    inbuf_.erase(inbuf_.begin(), inbuf_.begin() + off_);
    off_ = 0;
  }
  return true;
}

} // namespace scanlink
