
#include "chunker.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstring>

namespace scanlink {

bool validate_plan(const ChunkPlan &plan, std::string &why) {
  if (plan.chunk_size == 0) {
    why = "chunk size must be positive";
    return false;
  }
  if ((uint64_t)plan.chunk_size + kHeaderSize > plan.max_message_size) {
    why = "chunk size plus header exceeds the maximum message size";
    return false;
  }
  if (plan.max_message_size < 2 * kHeaderSize) {
    why = "maximum message size cannot carry an end-of-frame marker";
    return false;
  }
  return true;
}

bool Chunker::split(const Bytes &message, std::vector<Bytes> &out,
                    std::error_code &ec) const {
  DataHeader original;
  if (!unpack_header(message.data(), message.size(), original, ec))
    return false;
  if (plan_.chunk_size == 0) {
    ec = Errc::SizeMismatch;
    return false;
  }

  if (message.size() <= plan_.max_message_size) {
    out.push_back(message);
    ec.clear();
    return true;
  }

  const uint8_t *payload = message.data() + kHeaderSize;
  size_t data_size = message.size() - kHeaderSize;
  if (data_size > UINT32_MAX) {
    ec = Errc::SizeMismatch;
    return false;
  }
  uint32_t total = chunk_count(data_size, plan_.chunk_size);

  out.reserve(out.size() + total + 1);
  for (uint32_t idx = 0; idx < total; idx++) {
    size_t start = (size_t)idx * plan_.chunk_size;
    size_t end = std::min(start + plan_.chunk_size, data_size);

    ChunkHeader ch{};
    ch.stream_kind = original.stream_kind;
    ch.frame_number = original.frame_number;
    ch.chunk_index = idx;
    ch.total_chunks = total;
    ch.start_offset = (float)start;
    ch.end_offset = (float)end;
    ch.chunk_length = (uint32_t)(end - start);

    Bytes chunk(kHeaderSize + (end - start));
    pack_header(ch, chunk.data());
    std::memcpy(chunk.data() + kHeaderSize, payload + start, end - start);
    out.push_back(std::move(chunk));
  }

  EndOfFrameHeader eh{};
  eh.stream_kind = original.stream_kind;
  eh.frame_number = original.frame_number;
  eh.total_data_size = (uint32_t)data_size;
  eh.total_chunks = total;
  Bytes eofr(2 * kHeaderSize);
  pack_header(eh, eofr.data());
  // original header verbatim, not re-packed
  std::memcpy(eofr.data() + kHeaderSize, message.data(), kHeaderSize);
  out.push_back(std::move(eofr));

  ec.clear();
  return true;
}

} // namespace scanlink
