#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by the acquisition pipeline.
class DaqError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The data-source hook failed. Fatal to the loop that ran it.
class AcquisitionError : public DaqError {
public:
  using DaqError::DaqError;
};

// Connect, send or receive on an instrument session failed.
class ConnectionError : public DaqError {
public:
  using DaqError::DaqError;
};

// Invalid construction parameters. Raised eagerly, never during a run.
class ConfigurationError : public DaqError {
public:
  using DaqError::DaqError;
};
