
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

namespace scanlink {

using Bytes = std::vector<uint8_t>;

constexpr size_t kHeaderSize = 32;
constexpr size_t kMaxMessageSize = 512 * 1024;
constexpr size_t kChunkSize = 256 * 1024;

// Wire order of the four magic bytes.
constexpr char kMagicData[4] = {'D', 'A', 'T', 'A'};
constexpr char kMagicChunk[4] = {'C', 'H', 'N', 'K'};
constexpr char kMagicEndOfFrame[4] = {'E', 'O', 'F', 'R'};

enum class MessageType : uint8_t { Data, Chunk, EndOfFrame };

enum class StreamKind : uint32_t {
    RangeImage = 0,
    ReflectivityImage = 1,
    PointCloudXyz = 2,
    PointCloudColor = 3,
    CombinedInterleaved = 4
};

constexpr size_t kStreamKindCount = 5;

struct StreamKindInfo {
    StreamKind kind;
    const char* name;
    const char* path;
    uint32_t values_per_sample;
    const char* description;
};

// nullptr for ids outside the registered set.
const StreamKindInfo* stream_kind_info(uint32_t id);
const StreamKindInfo* stream_kind_info(StreamKind kind);
const StreamKindInfo* stream_kind_by_path(const std::string& path);
const StreamKindInfo* stream_kind_by_name(const std::string& name);
const StreamKindInfo* stream_kinds_begin();
const StreamKindInfo* stream_kinds_end();

// Regular profile.
struct DataHeader {
    uint32_t stream_kind{};
    uint32_t frame_number{};
    uint32_t shape0{};
    uint32_t shape1{};
    float    min_value{};
    float    max_value{};
    uint32_t reserved{};
};

struct ChunkHeader {
    uint32_t stream_kind{};
    uint32_t frame_number{};
    uint32_t chunk_index{};
    uint32_t total_chunks{};
    float    start_offset{};
    float    end_offset{};
    uint32_t chunk_length{};
};

// Followed on the wire by the original DataHeader bytes.
struct EndOfFrameHeader {
    uint32_t stream_kind{};
    uint32_t frame_number{};
    uint32_t total_data_size{};
    uint32_t total_chunks{};
};

inline uint64_t sample_count(const DataHeader& h) {
    return (uint64_t)h.shape0 * (h.shape1 > 0 ? h.shape1 : 1);
}

void pack_header(const DataHeader& h, uint8_t* out);
void pack_header(const ChunkHeader& h, uint8_t* out);
void pack_header(const EndOfFrameHeader& h, uint8_t* out);

bool peek_type(const uint8_t* data, size_t len, MessageType& type, std::error_code& ec);
bool unpack_header(const uint8_t* data, size_t len, DataHeader& h, std::error_code& ec);
bool unpack_header(const uint8_t* data, size_t len, ChunkHeader& h, std::error_code& ec);
bool unpack_header(const uint8_t* data, size_t len, EndOfFrameHeader& h, std::error_code& ec);

} // namespace scanlink
