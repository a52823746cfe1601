#pragma once
#include <stdexcept>
#include <string>

namespace repochurn {

// Root of every failure an analysis run can surface.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed framing, unexpected status or content type, missing sentinel.
class ProtocolError : public Error {
public:
  using Error::Error;
};

// The remote advertised the null object id as HEAD.
class EmptyRepositoryError : public Error {
public:
  EmptyRepositoryError() : Error("repository is empty (no HEAD commit)") {}
};

// A tree entry that is neither a blob nor a tree (e.g. a submodule).
class UnsupportedObjectKindError : public Error {
public:
  using Error::Error;
};

// The negotiation response carried no pack.
class TransferNotFoundError : public Error {
public:
  TransferNotFoundError() : Error("no transfer payload found in response") {}
};

// Missing or malformed object, corrupt pack.
class ObjectError : public Error {
public:
  using Error::Error;
};

// Network-level failure reported by the HTTP client.
class TransportError : public Error {
public:
  using Error::Error;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace repochurn
