#pragma once

#include <stdexcept>
#include <string>

namespace ucibridge
{
  struct BridgeError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // Engine executable missing, not runnable, or rejected by the OS.
  struct SpawnError : BridgeError
  {
    using BridgeError::BridgeError;
  };

  // The child exited or its streams were closed; the bridge is unusable.
  struct ProcessClosedError : BridgeError
  {
    using BridgeError::BridgeError;
  };

  struct WriteError : ProcessClosedError
  {
    using ProcessClosedError::ProcessClosedError;
  };

  struct HandshakeError : BridgeError
  {
    using BridgeError::BridgeError;
  };

  struct EngineNotReadyError : BridgeError
  {
    using BridgeError::BridgeError;
  };

  struct TimeoutError : BridgeError
  {
    using BridgeError::BridgeError;
  };

  struct UnsupportedOptionError : BridgeError
  {
    using BridgeError::BridgeError;
  };

  struct InvalidOptionValueError : BridgeError
  {
    using BridgeError::BridgeError;
  };

  struct ConfigError : BridgeError
  {
    using BridgeError::BridgeError;
  };

} // namespace ucibridge
