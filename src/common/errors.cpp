
#include "errors.hpp"
#include <string>

namespace scanlink {

namespace {

class ProtocolCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "scanlink"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::MalformedHeader:
      return "malformed header";
    case Errc::UnknownStreamKind:
      return "unknown stream kind";
    case Errc::SizeMismatch:
      return "size mismatch";
    case Errc::IncompleteReassembly:
      return "incomplete reassembly";
    case Errc::MessageTooLarge:
      return "message too large";
    case Errc::MalformedEnvelope:
      return "malformed envelope";
    }
    return "unknown scanlink error";
  }
};

} // namespace

const std::error_category &protocol_category() {
  static ProtocolCategory cat;
  return cat;
}

std::error_code make_error_code(Errc e) {
  return {static_cast<int>(e), protocol_category()};
}

} // namespace scanlink
