#pragma once

#include <cstdint>

namespace hufzip {

// Outcome of a decode. Every value other than Ok aborts the current operation.
enum class Status : uint8_t {
    Ok,
    BadMagic,        // input does not start with kHzMagic
    MalformedHeader, // tree header truncated or invalid
    TruncatedStream, // body ran out before the EOF symbol
};

const char* status_message(Status s);

} // namespace hufzip
