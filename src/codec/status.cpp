#include "codec/status.hpp"

namespace hufzip {

const char* status_message(Status s) {
    switch (s) {
        case Status::Ok:
            return "ok";
        case Status::BadMagic:
            return "decode: bad magic, not a hufzip stream";
        case Status::MalformedHeader:
            return "decode: malformed or truncated tree header";
        case Status::TruncatedStream:
            return "decode: stream ended before EOF symbol";
    }
    return "decode: unknown status";
}

} // namespace hufzip
