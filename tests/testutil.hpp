
#pragma once
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <thread>
#include <vector>
#include "codec.hpp"
#include "protocol.hpp"

#include <unity.h>

namespace scanlink {
namespace test {

// A Regular message with `data_size` payload bytes of a counting pattern.
// The shape describes data_size / 4 values, so odd sizes do not decode; the
// chunker only looks at the magic.
inline Bytes make_raw_message(uint32_t kind, uint32_t frame_number, size_t data_size) {
    Bytes msg(kHeaderSize + data_size);
    DataHeader h{};
    h.stream_kind = kind;
    h.frame_number = frame_number;
    h.shape0 = (uint32_t)(data_size / 4);
    h.shape1 = 0;
    pack_header(h, msg.data());
    for (size_t i = 0; i < data_size; i++)
        msg[kHeaderSize + i] = (uint8_t)((i * 7 + frame_number) & 0xFF);
    return msg;
}

inline Frame make_frame(StreamKind kind, uint32_t frame_number, uint32_t shape0, uint32_t shape1) {
    Frame f;
    f.kind = kind;
    f.frame_number = frame_number;
    f.shape0 = shape0;
    f.shape1 = shape1;
    size_t count = (size_t)shape0 * (shape1 > 0 ? shape1 : 1);
    f.values.resize(count);
    for (size_t i = 0; i < count; i++)
        f.values[i] = (float)i * 0.25f - 3.0f;
    return f;
}

inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace test
} // namespace scanlink
