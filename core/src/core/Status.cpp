#include "px/core/Status.hpp"

namespace px {

const char* statusCode(Status s) {
  switch (s) {
    case Status::Ok:               return "OK";
    case Status::OutOfBounds:      return "OUT_OF_BOUNDS";
    case Status::InvalidSize:      return "INVALID_SIZE";
    case Status::InvalidHexFormat: return "INVALID_HEX_FORMAT";
    case Status::AtHistoryStart:   return "AT_HISTORY_START";
    case Status::AtHistoryEnd:     return "AT_HISTORY_END";
    case Status::InvalidScale:     return "INVALID_SCALE";
    case Status::InvalidFormat:    return "INVALID_FORMAT";
    case Status::EncodeFailed:     return "EXPORT_FAILED";
  }
  return "UNKNOWN";
}

} // namespace px
