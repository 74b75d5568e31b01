
#include "protocol.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstring>

namespace scanlink {

// Indexed by wire id.
static const StreamKindInfo kStreamKinds[] = {
    {StreamKind::RangeImage, "range2d", "/ws/range2d", 1,
     "2D range image (normalized distances)"},
    {StreamKind::ReflectivityImage, "reflectivity2d", "/ws/reflectivity2d", 1,
     "2D reflectivity image (normalized intensity)"},
    {StreamKind::PointCloudXyz, "points3d", "/ws/points3d", 3,
     "3D point coordinates"},
    {StreamKind::PointCloudColor, "reflectivity3d", "/ws/reflectivity3d", 3,
     "RGB colors for the point cloud"},
    {StreamKind::CombinedInterleaved, "combined2d", "/ws/combined2d", 4,
     "interleaved x, y, z, reflectivity"},
};
static_assert(sizeof(kStreamKinds) / sizeof(kStreamKinds[0]) ==
                  kStreamKindCount,
              "stream kind table must cover every kind");

const StreamKindInfo *stream_kind_info(uint32_t id) {
  if (id >= kStreamKindCount)
    return nullptr;
  return &kStreamKinds[id];
}

const StreamKindInfo *stream_kind_info(StreamKind kind) {
  return stream_kind_info(static_cast<uint32_t>(kind));
}

const StreamKindInfo *stream_kind_by_path(const std::string &path) {
  for (const auto &k : kStreamKinds)
    if (path == k.path)
      return &k;
  return nullptr;
}

const StreamKindInfo *stream_kind_by_name(const std::string &name) {
  for (const auto &k : kStreamKinds)
    if (name == k.name)
      return &k;
  return nullptr;
}

const StreamKindInfo *stream_kinds_begin() { return kStreamKinds; }
const StreamKindInfo *stream_kinds_end() {
  return kStreamKinds + kStreamKindCount;
}

static void pack_words(const char magic[4], uint32_t kind, uint32_t frame,
                       uint32_t w0, uint32_t w1, float r0, float r1,
                       uint32_t w2, uint8_t *out) {
  std::memcpy(out, magic, 4);
  put_u32le(out + 4, kind);
  put_u32le(out + 8, frame);
  put_u32le(out + 12, w0);
  put_u32le(out + 16, w1);
  put_f32le(out + 20, r0);
  put_f32le(out + 24, r1);
  put_u32le(out + 28, w2);
}

void pack_header(const DataHeader &h, uint8_t *out) {
  pack_words(kMagicData, h.stream_kind, h.frame_number, h.shape0, h.shape1,
             h.min_value, h.max_value, h.reserved, out);
}

void pack_header(const ChunkHeader &h, uint8_t *out) {
  pack_words(kMagicChunk, h.stream_kind, h.frame_number, h.chunk_index,
             h.total_chunks, h.start_offset, h.end_offset, h.chunk_length,
             out);
}

void pack_header(const EndOfFrameHeader &h, uint8_t *out) {
  pack_words(kMagicEndOfFrame, h.stream_kind, h.frame_number,
             h.total_data_size, h.total_chunks, 0.0f, 0.0f, 0, out);
}

bool peek_type(const uint8_t *data, size_t len, MessageType &type,
               std::error_code &ec) {
  if (data == nullptr || len < kHeaderSize) {
    ec = Errc::MalformedHeader;
    return false;
  }
  if (std::memcmp(data, kMagicData, 4) == 0)
    type = MessageType::Data;
  else if (std::memcmp(data, kMagicChunk, 4) == 0)
    type = MessageType::Chunk;
  else if (std::memcmp(data, kMagicEndOfFrame, 4) == 0)
    type = MessageType::EndOfFrame;
  else {
    ec = Errc::MalformedHeader;
    return false;
  }
  ec.clear();
  return true;
}

static bool expect_type(const uint8_t *data, size_t len, MessageType want,
                        std::error_code &ec) {
  MessageType got;
  if (!peek_type(data, len, got, ec))
    return false;
  if (got != want) {
    ec = Errc::MalformedHeader;
    return false;
  }
  return true;
}

bool unpack_header(const uint8_t *data, size_t len, DataHeader &h,
                   std::error_code &ec) {
  if (!expect_type(data, len, MessageType::Data, ec))
    return false;
  h.stream_kind = get_u32le(data + 4);
  h.frame_number = get_u32le(data + 8);
  h.shape0 = get_u32le(data + 12);
  h.shape1 = get_u32le(data + 16);
  h.min_value = get_f32le(data + 20);
  h.max_value = get_f32le(data + 24);
  h.reserved = get_u32le(data + 28);
  return true;
}

bool unpack_header(const uint8_t *data, size_t len, ChunkHeader &h,
                   std::error_code &ec) {
  if (!expect_type(data, len, MessageType::Chunk, ec))
    return false;
  h.stream_kind = get_u32le(data + 4);
  h.frame_number = get_u32le(data + 8);
  h.chunk_index = get_u32le(data + 12);
  h.total_chunks = get_u32le(data + 16);
  h.start_offset = get_f32le(data + 20);
  h.end_offset = get_f32le(data + 24);
  h.chunk_length = get_u32le(data + 28);
  return true;
}

bool unpack_header(const uint8_t *data, size_t len, EndOfFrameHeader &h,
                   std::error_code &ec) {
  if (!expect_type(data, len, MessageType::EndOfFrame, ec))
    return false;
  h.stream_kind = get_u32le(data + 4);
  h.frame_number = get_u32le(data + 8);
  h.total_data_size = get_u32le(data + 12);
  h.total_chunks = get_u32le(data + 16);
  return true;
}

} // namespace scanlink
