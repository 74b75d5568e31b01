
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace scanlink {

enum class Opcode : uint8_t { Text = 0x1, Binary = 0x2, Close = 0x8 };

constexpr size_t kEnvelopeHeaderSize = 5;

struct Envelope {
    Opcode op{Opcode::Binary};
    Bytes payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

void pack_envelope_header(Opcode op, uint32_t len, uint8_t* out);
Bytes make_envelope(Opcode op, const uint8_t* data, size_t len);
Bytes make_text_envelope(const std::string& s);

// Accumulates stream bytes and cuts them into envelopes.
class EnvelopeReader {
public:
    explicit EnvelopeReader(size_t max_message_size) : max_message_size_(max_message_size) {}

    void feed(const uint8_t* data, size_t len);
    // false with !ec: need more bytes. false with ec: the stream is unusable.
    bool next(Envelope& out, std::error_code& ec);
    size_t buffered() const { return inbuf_.size() - off_; }
private:
    size_t max_message_size_;
    Bytes inbuf_;
    size_t off_{0};
};

} // namespace scanlink
