#include "split_reader/error.hpp"
#include <utility>

namespace sr {

const char* to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Config: return "config";
    case ErrorKind::Io:     return "io";
  }
  return "unknown";
}

bool fail(Error* err, ErrorKind kind, std::string message) {
  if (err) { err->kind = kind; err->message = std::move(message); }
  return false;
}

SplitReadError::SplitReadError(ErrorKind kind, const std::string& what, std::string cause)
  : std::runtime_error(what), kind_(kind), cause_(std::move(cause)) {}

SplitReadError::SplitReadError(const Error& e)
  : SplitReadError(e.kind, std::string(to_string(e.kind)) + " error: " + e.message, e.message) {}

}
