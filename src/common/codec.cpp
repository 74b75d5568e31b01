
#include "codec.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace scanlink {

bool encode_frame(const Frame &frame, Bytes &out, std::error_code &ec) {
  out.clear();
  const StreamKindInfo *info = stream_kind_info(frame.kind);
  if (!info) {
    ec = Errc::UnknownStreamKind;
    return false;
  }

  DataHeader h{};
  h.stream_kind = static_cast<uint32_t>(info->kind);
  h.frame_number = frame.frame_number;
  h.shape0 = frame.shape0;
  h.shape1 = frame.shape1;
  uint64_t count = sample_count(h);
  if (count != frame.values.size() ||
      kHeaderSize + count * 4 > (uint64_t)UINT32_MAX) {
    ec = Errc::SizeMismatch;
    return false;
  }

  // any NaN sample makes both bounds NaN
  float lo = 0.0f, hi = 0.0f;
  if (!frame.values.empty()) {
    lo = hi = frame.values.front();
    for (float v : frame.values) {
      if (std::isnan(v)) {
        lo = hi = std::numeric_limits<float>::quiet_NaN();
        break;
      }
      lo = std::min(lo, v);
      hi = std::max(hi, v);
    }
  }
  h.min_value = frame.min_value ? *frame.min_value : lo;
  h.max_value = frame.max_value ? *frame.max_value : hi;
  h.reserved = 0;

  out.resize(kHeaderSize + count * 4);
  pack_header(h, out.data());
  uint8_t *p = out.data() + kHeaderSize;
  for (float v : frame.values) {
    put_f32le(p, v);
    p += 4;
  }
  ec.clear();
  return true;
}

bool decode_frame(const uint8_t *data, size_t len, DecodedFrame &out,
                  std::error_code &ec) {
  DataHeader h;
  if (!unpack_header(data, len, h, ec))
    return false;
  if (!stream_kind_info(h.stream_kind)) {
    ec = Errc::UnknownStreamKind;
    return false;
  }
  uint64_t count = sample_count(h);
  if (len != kHeaderSize + count * 4) {
    ec = Errc::SizeMismatch;
    return false;
  }
  out.hdr = h;
  out.values.resize(count);
  const uint8_t *p = data + kHeaderSize;
  for (uint64_t i = 0; i < count; i++, p += 4)
    out.values[i] = get_f32le(p);
  ec.clear();
  return true;
}

} // namespace scanlink
