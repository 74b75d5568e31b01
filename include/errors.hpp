
#pragma once
#include <system_error>

namespace scanlink {

enum class Errc {
    MalformedHeader = 1,
    UnknownStreamKind,
    SizeMismatch,
    IncompleteReassembly,
    MessageTooLarge,
    MalformedEnvelope
};

const std::error_category& protocol_category();
std::error_code make_error_code(Errc e);

} // namespace scanlink

namespace std {
template <> struct is_error_code_enum<scanlink::Errc> : true_type {};
} // namespace std
