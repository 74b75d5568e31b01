
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>
#include "codec.hpp"

namespace scanlink {

// Independent, order-preserving iteration over one stream kind.
class FrameCursor {
public:
    virtual ~FrameCursor() = default;
    // false without error: end of stream. false with error: source failure.
    virtual bool next(Frame& out, std::error_code& ec) = 0;
};

// Every open() starts again from the beginning of the source.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual std::unique_ptr<FrameCursor> open(StreamKind kind) = 0;
};

struct SyntheticOptions {
    uint32_t frames{100};
    uint32_t rows{128};
    uint32_t columns{1024};
};

// Rejects empty geometry and scans whose largest message payload (four
// values per sample) does not fit a 32-bit length.
bool validate_synthetic(const SyntheticOptions& opts, std::string& why);

// Deterministic generated scans, one pattern per stream kind.
class SyntheticFrameSource : public FrameSource {
public:
    explicit SyntheticFrameSource(const SyntheticOptions& opts) : opts_(opts) {}
    std::unique_ptr<FrameCursor> open(StreamKind kind) override;

    // false, leaving `out` untouched, when validate_synthetic() rejects `opts`
    static bool fill(StreamKind kind, uint32_t index, const SyntheticOptions& opts, Frame& out);
private:
    SyntheticOptions opts_;
};

// Replays a capture file made of concatenated Regular messages.
class ReplayFrameSource : public FrameSource {
public:
    explicit ReplayFrameSource(std::string path) : path_(std::move(path)) {}
    std::unique_ptr<FrameCursor> open(StreamKind kind) override;
private:
    std::string path_;
};

} // namespace scanlink
