#pragma once
#include <cstdint>

namespace px {

// Outcome of an editor operation. Everything except Ok leaves state untouched.
enum class Status : std::uint8_t {
  Ok = 0,
  OutOfBounds,
  InvalidSize,
  InvalidHexFormat,
  AtHistoryStart,
  AtHistoryEnd,
  InvalidScale,
  InvalidFormat,
  EncodeFailed
};

// Upper-snake code used on the JSON command layer, e.g. "AT_HISTORY_END".
const char* statusCode(Status s);

} // namespace px
