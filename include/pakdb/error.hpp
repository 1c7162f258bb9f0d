#pragma once
#include <stdexcept>
#include <string>

namespace pakdb {

// Root of every error thrown by the library.
class PakError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Failure while building: codec, index extraction, builder reuse, finalize I/O.
class BuildError : public PakError {
public:
  using PakError::PakError;
};

class EncodeError : public BuildError {
public:
  using BuildError::BuildError;
};

class IndexExtractionError : public BuildError {
public:
  using BuildError::BuildError;
};

// Bad magic, unsupported version, truncated or corrupt artifact.
class FormatError : public PakError {
public:
  using PakError::PakError;
};

// Value kind vs index kind, or pointer tag vs requested record type.
class TypeMismatchError : public PakError {
public:
  using PakError::PakError;
};

class DecodeError : public PakError {
public:
  using PakError::PakError;
};

} // namespace pakdb
