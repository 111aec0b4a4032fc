#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace sr {

// Configuration errors come from schema sources (bad literal, bad URL).
// I/O errors come from the container (open, read, corrupt block).
enum class ErrorKind { Config, Io };

const char* to_string(ErrorKind k) noexcept;

struct Error {
  ErrorKind   kind = ErrorKind::Io;
  std::string message;
};

// Fill *err if the caller asked for it; always returns false so call sites
// can `return fail(err, ...)`.
bool fail(Error* err, ErrorKind kind, std::string message);

// The single exception type that leaves the library.
class SplitReadError : public std::runtime_error {
public:
  SplitReadError(ErrorKind kind, const std::string& what, std::string cause = {});
  explicit SplitReadError(const Error& e);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& cause() const noexcept { return cause_; }

private:
  ErrorKind   kind_;
  std::string cause_;
};

}
