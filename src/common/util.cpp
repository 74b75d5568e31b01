
#include "util.hpp"
#include <stdexcept>

namespace scanlink {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  // "[::1]:8000"
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  if (host.empty())
    return false;
  std::string digits = s.substr(pos + 1);
  if (digits.empty() ||
      digits.find_first_not_of("0123456789") != std::string::npos)
    return false;
  try {
    unsigned long p = std::stoul(digits);
    if (p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::out_of_range &) {
    return false;
  }
}

std::string join_path(const std::string &dir, const std::string &file) {
  if (dir.empty())
    return file;
  if (dir.back() == '/')
    return dir + file;
  return dir + "/" + file;
}

} // namespace scanlink
