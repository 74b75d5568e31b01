
#pragma once
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace scanlink {

// One unit of numeric data as produced by a frame source.
struct Frame {
    StreamKind kind{StreamKind::RangeImage};
    uint32_t frame_number{0};
    uint32_t shape0{0};
    uint32_t shape1{0};   // 0 for 1-D payloads
    std::optional<float> min_value;
    std::optional<float> max_value;
    std::vector<float> values;
};

struct DecodedFrame {
    DataHeader hdr{};
    std::vector<float> values;
};

// Builds a Regular message. On failure `out` is left empty.
bool encode_frame(const Frame& frame, Bytes& out, std::error_code& ec);

bool decode_frame(const uint8_t* data, size_t len, DecodedFrame& out, std::error_code& ec);

} // namespace scanlink
