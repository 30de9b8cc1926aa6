#pragma once

#include <stdexcept>
#include <string>

namespace farstore {

enum class ErrorKind {
  UnsupportedType,   // value matches no classifier category
  NameCollision,     // object name equals the reserved aggregate key
  MalformedArchive,  // structure, length or field mismatch on read
  UnknownTypeTag,    // entry tag not known to the running registry
  InvalidName,       // empty name, '/' or leading '$'
  Io,
};

inline const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::UnsupportedType: return "unsupported-type";
    case ErrorKind::NameCollision: return "name-collision";
    case ErrorKind::MalformedArchive: return "malformed-archive";
    case ErrorKind::UnknownTypeTag: return "unknown-type-tag";
    case ErrorKind::InvalidName: return "invalid-name";
    case ErrorKind::Io: return "io";
  }
  return "unknown";
}

struct Error : public std::runtime_error {
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

#define FARSTORE_THROW(kind, msg) \
  throw ::farstore::Error(::farstore::ErrorKind::kind, std::string("[farstore] ") + (msg))

} // namespace farstore
