
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <system_error>
#include <unordered_map>
#include "protocol.hpp"

namespace scanlink {

struct ReassemblyStats {
    uint64_t delivered{0};     // Regular messages passed straight through
    uint64_t reassembled{0};
    uint64_t dropped{0};       // frames discarded at EOFR
    uint64_t evicted{0};       // buffers superseded by a newer frame
    uint64_t rejected{0};      // malformed or mismatched input
};

// Receiver side of the chunking scheme. Owned by one connection and
// cleared when that connection closes.
class Reassembler {
public:
    // Returns the Regular message ready for decoding, if any. When nothing is
    // returned, `ec` tells a buffered chunk (no error) from a dropped or
    // rejected message.
    std::optional<Bytes> push(Bytes&& message, std::error_code& ec);

    void clear();
    size_t pending_frames() const;
    const ReassemblyStats& stats() const { return stats_; }

private:
    struct ChunkBuffer {
        uint32_t total_chunks{0};
        std::map<uint32_t, Bytes> chunks;
    };
    using FrameBuffers = std::map<uint32_t, ChunkBuffer>;

    void on_chunk(const ChunkHeader& hdr, const Bytes& message);
    std::optional<Bytes> on_end_of_frame(const EndOfFrameHeader& hdr, const Bytes& message,
                                         std::error_code& ec);
    void evict_older(FrameBuffers& frames, uint32_t frame_number);

    std::unordered_map<uint32_t, FrameBuffers> streams_;
    ReassemblyStats stats_;
};

} // namespace scanlink
