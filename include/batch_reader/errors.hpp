#pragma once
#include <stdexcept>
#include <string>

namespace br {

// Open/read/seek/metadata failure. Message carries the OS cause.
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed record or unreadable header row.
class FormatError : public std::runtime_error {
public:
  explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

// "<what>: <strerror(err)>"
std::string describe_errno(const std::string& what, int err);

}
