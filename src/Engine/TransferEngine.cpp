#include "TransferEngine.hpp"

const char* toString(TransferError::Kind kind) {
  switch (kind) {
    case TransferError::Kind::ResolutionFailure:
      return "resolution failure";
    case TransferError::Kind::IOFailure:
      return "I/O failure";
    default:
      return "unknown failure";
  }
}
