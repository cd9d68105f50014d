#pragma once
#include <stdexcept>
#include <string>

namespace gitrelay {

// Malformed or out-of-sequence protocol input. Ends the session.
struct ProtocolError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Backend I/O failure (network, permission, quota, a failing rclone call).
struct TransportError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A path the caller required is absent from the backend.
struct NotFoundError : TransportError {
  using TransportError::TransportError;
};

// Fetched bytes do not hash to the id they were requested under.
struct IntegrityError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Bytes that are not a well-formed loose object.
struct MalformedObjectError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace gitrelay
