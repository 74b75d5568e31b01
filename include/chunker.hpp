
#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace scanlink {

struct ChunkPlan {
    uint32_t chunk_size{kChunkSize};            // payload bytes per chunk
    uint32_t max_message_size{kMaxMessageSize}; // messages above this are split
};

// Every chunk message and the EOFR sentinel must fit max_message_size.
bool validate_plan(const ChunkPlan& plan, std::string& why);

class Chunker {
public:
    explicit Chunker(const ChunkPlan& plan) : plan_(plan) {}

    // Appends the message itself, or its chunks followed by one EOFR, to `out`.
    bool split(const Bytes& message, std::vector<Bytes>& out, std::error_code& ec) const;

    static uint32_t chunk_count(uint64_t data_size, uint32_t chunk_size) {
        return (uint32_t)((data_size + chunk_size - 1) / chunk_size);
    }

    const ChunkPlan& plan() const { return plan_; }
private:
    ChunkPlan plan_;
};

} // namespace scanlink
