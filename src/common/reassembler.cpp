
#include "reassembler.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cstring>

namespace scanlink {

std::optional<Bytes> Reassembler::push(Bytes &&message, std::error_code &ec) {
  MessageType type;
  if (!peek_type(message.data(), message.size(), type, ec)) {
    stats_.rejected++;
    return std::nullopt;
  }

  switch (type) {
  case MessageType::Data: {
    DataHeader h;
    if (!unpack_header(message.data(), message.size(), h, ec)) {
      stats_.rejected++;
      return std::nullopt;
    }
    auto it = streams_.find(h.stream_kind);
    if (it != streams_.end())
      evict_older(it->second, h.frame_number);
    stats_.delivered++;
    return std::optional<Bytes>(std::move(message));
  }
  case MessageType::Chunk: {
    ChunkHeader h;
    if (!unpack_header(message.data(), message.size(), h, ec)) {
      stats_.rejected++;
      return std::nullopt;
    }
    if (!stream_kind_info(h.stream_kind)) {
      ec = Errc::UnknownStreamKind;
      stats_.rejected++;
      return std::nullopt;
    }
    if ((uint64_t)kHeaderSize + h.chunk_length > message.size() ||
        h.chunk_index >= h.total_chunks) {
      ec = Errc::SizeMismatch;
      stats_.rejected++;
      return std::nullopt;
    }
    on_chunk(h, message);
    ec.clear();
    return std::nullopt;
  }
  case MessageType::EndOfFrame: {
    EndOfFrameHeader h;
    if (!unpack_header(message.data(), message.size(), h, ec)) {
      stats_.rejected++;
      return std::nullopt;
    }
    // buffers are only ever keyed by known kinds
    if (!stream_kind_info(h.stream_kind)) {
      ec = Errc::UnknownStreamKind;
      stats_.rejected++;
      return std::nullopt;
    }
    return on_end_of_frame(h, message, ec);
  }
  }
  ec = Errc::MalformedHeader;
  stats_.rejected++;
  return std::nullopt;
}

void Reassembler::on_chunk(const ChunkHeader &hdr, const Bytes &message) {
  auto &frames = streams_[hdr.stream_kind];
  evict_older(frames, hdr.frame_number);

  auto &buf = frames[hdr.frame_number];
  buf.total_chunks = hdr.total_chunks;
  const uint8_t *p = message.data() + kHeaderSize;
  // duplicates overwrite silently
  buf.chunks[hdr.chunk_index].assign(p, p + hdr.chunk_length);
  Logger::instance().log(LogLevel::TRACE,
                         "chunk %u/%u kind=%u frame=%u (%u bytes)",
                         hdr.chunk_index + 1, hdr.total_chunks,
                         hdr.stream_kind, hdr.frame_number, hdr.chunk_length);
}

std::optional<Bytes> Reassembler::on_end_of_frame(const EndOfFrameHeader &hdr,
                                                  const Bytes &message,
                                                  std::error_code &ec) {
  DataHeader original;
  if (!unpack_header(message.data() + kHeaderSize,
                     message.size() - kHeaderSize, original, ec)) {
    stats_.rejected++;
    return std::nullopt;
  }

  auto stream = streams_.find(hdr.stream_kind);
  FrameBuffers empty;
  FrameBuffers &frames = stream == streams_.end() ? empty : stream->second;
  auto it = frames.find(hdr.frame_number);
  size_t have = it == frames.end() ? 0 : it->second.chunks.size();
  bool empty_frame = hdr.total_chunks == 0 && have == 0;
  if (!empty_frame && (it == frames.end() || have != hdr.total_chunks)) {
    Logger::instance().log(
        LogLevel::WARN, "missing chunks for kind=%u frame=%u: got %zu of %u",
        hdr.stream_kind, hdr.frame_number, have, hdr.total_chunks);
    if (it != frames.end())
      frames.erase(it);
    stats_.dropped++;
    ec = Errc::IncompleteReassembly;
    return std::nullopt;
  }

  Bytes out(message.begin() + kHeaderSize,
            message.begin() + 2 * kHeaderSize);
  out.reserve(kHeaderSize + hdr.total_data_size);
  if (it != frames.end()) {
    for (const auto &kv : it->second.chunks)
      out.insert(out.end(), kv.second.begin(), kv.second.end());
    frames.erase(it);
  }

  if (out.size() - kHeaderSize != hdr.total_data_size) {
    Logger::instance().log(
        LogLevel::WARN, "kind=%u frame=%u reassembled %zu bytes, expected %u",
        hdr.stream_kind, hdr.frame_number, out.size() - kHeaderSize,
        hdr.total_data_size);
    stats_.dropped++;
    ec = Errc::SizeMismatch;
    return std::nullopt;
  }

  stats_.reassembled++;
  Logger::instance().log(LogLevel::DEBUG,
                         "reassembled kind=%u frame=%u from %u chunks",
                         hdr.stream_kind, hdr.frame_number, hdr.total_chunks);
  ec.clear();
  return out;
}

void Reassembler::evict_older(FrameBuffers &frames, uint32_t frame_number) {
  auto end = frames.lower_bound(frame_number);
  for (auto it = frames.begin(); it != end;) {
    Logger::instance().log(LogLevel::DEBUG,
                           "evicting stale buffer for frame=%u (%zu chunks)",
                           it->first, it->second.chunks.size());
    it = frames.erase(it);
    stats_.evicted++;
  }
}

void Reassembler::clear() { streams_.clear(); }

size_t Reassembler::pending_frames() const {
  size_t n = 0;
  for (const auto &kv : streams_)
    n += kv.second.size();
  return n;
}

} // namespace scanlink
