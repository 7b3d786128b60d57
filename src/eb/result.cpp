#include "eb/result.h"

namespace eb {

const char* errorName(StripError err) {
    switch (err) {
        case StripError::OK:
            return "OK";
        case StripError::CONFIG:
            return "CONFIG";
        case StripError::TRANSPORT_INIT:
            return "TRANSPORT_INIT";
        case StripError::TRANSPORT_WRITE:
            return "TRANSPORT_WRITE";
    }
    return "UNKNOWN";
}

} // namespace eb
