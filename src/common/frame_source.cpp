
#include "frame_source.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <climits>
#include <cstdint>
#include <fstream>

namespace scanlink {

namespace {

constexpr float kTwoPi = 6.28318530717958647692f;

class SyntheticCursor : public FrameCursor {
public:
  SyntheticCursor(StreamKind kind, const SyntheticOptions &opts)
      : kind_(kind), opts_(opts) {}

  bool next(Frame &out, std::error_code &ec) override {
    ec.clear();
    if (index_ >= opts_.frames)
      return false;
    if (!SyntheticFrameSource::fill(kind_, index_, opts_, out)) {
      ec = Errc::SizeMismatch;
      return false;
    }
    index_++;
    return true;
  }

private:
  StreamKind kind_;
  SyntheticOptions opts_;
  uint32_t index_{0};
};

class ReplayCursor : public FrameCursor {
public:
  ReplayCursor(const std::string &path, StreamKind kind)
      : in_(path, std::ios::binary), path_(path), kind_(kind) {
    if (!in_) {
      open_error_ = std::error_code(errno ? errno : ENOENT,
                                    std::generic_category());
      return;
    }
    in_.seekg(0, std::ios::end);
    size_ = (uint64_t)in_.tellg();
    in_.seekg(0, std::ios::beg);
  }

  bool next(Frame &out, std::error_code &ec) override {
    ec = open_error_;
    if (ec)
      return false;
    for (;;) {
      uint8_t raw[kHeaderSize];
      in_.read((char *)raw, sizeof(raw));
      std::streamsize got = in_.gcount();
      if (got == 0)
        return false;
      if (got != (std::streamsize)sizeof(raw)) {
        ec = Errc::MalformedHeader;
        return false;
      }
      DataHeader h;
      if (!unpack_header(raw, sizeof(raw), h, ec))
        return false;
      uint64_t count = sample_count(h);
      uint64_t bytes = count * 4;
      uint64_t pos = (uint64_t)in_.tellg();
      if (bytes > UINT32_MAX - kHeaderSize || pos > size_ ||
          bytes > size_ - pos) {
        Logger::instance().log(LogLevel::WARN,
                               "%s: frame %u claims %llu bytes, %llu left",
                               path_.c_str(), h.frame_number,
                               (unsigned long long)bytes,
                               (unsigned long long)(size_ - std::min(pos, size_)));
        ec = Errc::SizeMismatch;
        return false;
      }
      if (h.stream_kind != static_cast<uint32_t>(kind_)) {
        in_.seekg((std::streamoff)bytes, std::ios::cur);
        if (!in_) {
          ec = Errc::SizeMismatch;
          return false;
        }
        continue;
      }
      Bytes payload(bytes);
      in_.read((char *)payload.data(), (std::streamsize)payload.size());
      if (in_.gcount() != (std::streamsize)payload.size()) {
        Logger::instance().log(LogLevel::WARN, "%s: truncated frame %u",
                               path_.c_str(), h.frame_number);
        ec = Errc::SizeMismatch;
        return false;
      }
      out.kind = kind_;
      out.frame_number = h.frame_number;
      out.shape0 = h.shape0;
      out.shape1 = h.shape1;
      out.min_value = h.min_value;
      out.max_value = h.max_value;
      out.values.resize(count);
      for (uint64_t i = 0; i < count; i++)
        out.values[i] = get_f32le(payload.data() + i * 4);
      return true;
    }
  }

private:
  std::ifstream in_;
  std::string path_;
  StreamKind kind_;
  std::error_code open_error_;
  uint64_t size_{0};
};

} // namespace

std::unique_ptr<FrameCursor> SyntheticFrameSource::open(StreamKind kind) {
  return std::unique_ptr<FrameCursor>(new SyntheticCursor(kind, opts_));
}

bool validate_synthetic(const SyntheticOptions &opts, std::string &why) {
  if (opts.rows == 0 || opts.columns == 0) {
    why = "rows and columns must be positive";
    return false;
  }
  uint64_t bytes = (uint64_t)opts.rows * opts.columns * 4 * sizeof(float);
  if (bytes > UINT32_MAX - kHeaderSize) {
    why = "a " + std::to_string(opts.rows) + "x" +
          std::to_string(opts.columns) + " scan does not fit one message";
    return false;
  }
  return true;
}

bool SyntheticFrameSource::fill(StreamKind kind, uint32_t index,
                                const SyntheticOptions &opts, Frame &out) {
  std::string why;
  if (!validate_synthetic(opts, why))
    return false;
  const uint32_t rows = opts.rows, cols = opts.columns;
  const size_t n = (size_t)rows * cols;
  const float t = 0.1f * (float)index;

  out.kind = kind;
  out.frame_number = index;
  out.min_value.reset();
  out.max_value.reset();

  auto range_at = [&](uint32_t r, uint32_t c) {
    return std::sin(kTwoPi * (float)c / (float)cols + 0.05f * (float)r + t);
  };
  auto refl_at = [&](uint32_t r, uint32_t c) {
    return 0.5f + 0.5f * std::cos(kTwoPi * (float)r / (float)rows +
                                  0.01f * (float)c - t);
  };

  switch (kind) {
  case StreamKind::RangeImage:
  case StreamKind::ReflectivityImage:
    out.shape0 = rows;
    out.shape1 = cols;
    out.values.resize(n);
    for (uint32_t r = 0; r < rows; r++)
      for (uint32_t c = 0; c < cols; c++)
        out.values[(size_t)r * cols + c] =
            kind == StreamKind::RangeImage ? range_at(r, c) : refl_at(r, c);
    break;
  case StreamKind::PointCloudXyz:
    out.shape0 = (uint32_t)n;
    out.shape1 = 3;
    out.values.resize(n * 3);
    for (uint32_t r = 0; r < rows; r++)
      for (uint32_t c = 0; c < cols; c++) {
        float az = kTwoPi * (float)c / (float)cols;
        float radius = 10.0f + 2.0f * range_at(r, c);
        float *p = &out.values[((size_t)r * cols + c) * 3];
        p[0] = radius * std::cos(az);
        p[1] = 0.1f * ((float)r - 0.5f * (float)rows);
        p[2] = radius * std::sin(az);
      }
    break;
  case StreamKind::PointCloudColor:
    out.shape0 = (uint32_t)n;
    out.shape1 = 3;
    out.values.resize(n * 3);
    for (uint32_t r = 0; r < rows; r++)
      for (uint32_t c = 0; c < cols; c++) {
        float *p = &out.values[((size_t)r * cols + c) * 3];
        p[0] = refl_at(r, c);
        p[1] = 0.0f;
        p[2] = 1.0f;
      }
    break;
  case StreamKind::CombinedInterleaved:
    out.shape0 = (uint32_t)(n * 4);
    out.shape1 = 0;
    out.values.resize(n * 4);
    for (uint32_t r = 0; r < rows; r++)
      for (uint32_t c = 0; c < cols; c++) {
        float *p = &out.values[((size_t)r * cols + c) * 4];
        p[0] = cols > 1 ? -1.0f + 2.0f * (float)c / (float)(cols - 1) : 0.0f;
        p[1] = rows > 1 ? 1.0f - 2.0f * (float)r / (float)(rows - 1) : 0.0f;
        p[2] = range_at(r, c);
        p[3] = refl_at(r, c);
      }
    break;
  }
  return true;
}

std::unique_ptr<FrameCursor> ReplayFrameSource::open(StreamKind kind) {
  return std::unique_ptr<FrameCursor>(new ReplayCursor(path_, kind));
}

} // namespace scanlink
