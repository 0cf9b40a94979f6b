#pragma once
#include <stdexcept>
#include <string>

namespace psm {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Stale or out-of-range device handle. Re-enumerate and retry.
class DeviceIndexError : public Error {
public:
  using Error::Error;
};

// Listing or fetch failed at the device boundary.
class TransportError : public Error {
public:
  using Error::Error;
};

// Metadata missing, unreadable or malformed for one file.
class ExtractionError : public Error {
public:
  using Error::Error;
};

// SQLite or local filesystem write failure.
class StorageError : public Error {
public:
  using Error::Error;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

} // namespace psm
