#include <pakx/types.hpp>

namespace pakx {

const char *toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::MalformedHeader:
    return "MalformedHeader";
  case ErrorCode::MalformedDirectory:
    return "MalformedDirectory";
  case ErrorCode::OutOfBounds:
    return "OutOfBounds";
  case ErrorCode::NameTooLong:
    return "NameTooLong";
  case ErrorCode::InvalidName:
    return "InvalidName";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::IoFailure:
    return "IoFailure";
  case ErrorCode::UnsafePath:
    return "UnsafePath";
  }
  return "Unknown";
}

} // namespace pakx
