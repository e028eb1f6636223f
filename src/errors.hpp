#pragma once

// C/C++
#include <stdexcept>
#include <string>

// torch
#include <c10/util/StringUtil.h>

namespace biokin {

//! Invalid configuration: time step, time axis, window length or split ratios
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(std::string const& msg)
      : std::runtime_error(msg) {}
};

//! Non-finite state or loss encountered during integration or training
class NumericalError : public std::runtime_error {
 public:
  explicit NumericalError(std::string const& msg) : std::runtime_error(msg) {}
};

//! State/channel dimension mismatch between data, kinetics and learner
class DataShapeError : public std::runtime_error {
 public:
  explicit DataShapeError(std::string const& msg) : std::runtime_error(msg) {}
};

}  // namespace biokin

//! Throw `err_type` with a message assembled from the remaining arguments
//! when `cond` is false, e.g.
//! BIOKIN_CHECK(dt > 0., ConfigurationError, "dt = ", dt, " must be > 0");
#define BIOKIN_CHECK(cond, err_type, ...)                                \
  do {                                                                   \
    if (!(cond)) {                                                       \
      throw ::biokin::err_type(::c10::str(__VA_ARGS__));                 \
    }                                                                    \
  } while (0)
