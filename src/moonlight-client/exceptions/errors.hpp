#pragma once

#include <stdexcept>
#include <string>

namespace lynx {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Connection refused, DNS failure, timeout or any other socket level error
 */
class TransportError : public Error {
public:
  using Error::Error;
};

/**
 * Non success status code or a malformed document
 */
class ProtocolError : public Error {
public:
  using Error::Error;
};

/**
 * The host answered, but refused to authenticate us (or we refused to trust it)
 */
class AuthenticationError : public Error {
public:
  using Error::Error;
};

class WrongPinError : public Error {
public:
  using Error::Error;
};

/**
 * The host lacks a feature required by the requested stream (HDR, 4K, codec)
 */
class CapabilityError : public Error {
public:
  using Error::Error;
};

/**
 * Operation invalid in the current lifecycle state
 */
class StateError : public Error {
public:
  using Error::Error;
};

class NotPairedError : public StateError {
public:
  using StateError::StateError;
};

class AlreadyActiveError : public StateError {
public:
  using StateError::StateError;
};

class NotFoundError : public Error {
public:
  using Error::Error;
};

} // namespace lynx
