
#pragma once
#include <string>
#include <cstdint>
#include <cstring>

namespace scanlink {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string join_path(const std::string& dir, const std::string& file);

inline void put_u32le(uint8_t* p, uint32_t v) {
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)((v >> 8) & 0xFF);
    p[2] = (uint8_t)((v >> 16) & 0xFF);
    p[3] = (uint8_t)((v >> 24) & 0xFF);
}

inline uint32_t get_u32le(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
           ((uint32_t)p[3] << 24);
}

inline void put_f32le(uint8_t* p, float v) {
    uint32_t bits;
    std::memcpy(&bits, &v, 4);
    put_u32le(p, bits);
}

inline float get_f32le(const uint8_t* p) {
    uint32_t bits = get_u32le(p);
    float v;
    std::memcpy(&v, &bits, 4);
    return v;
}

} // namespace scanlink
