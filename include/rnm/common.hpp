#pragma once

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "rnm/util/id_string.hpp"

namespace rnm {

enum class PortDirection { In, Out };

const char* to_string(PortDirection d);

struct Indent {
    int mN = 0;
    explicit Indent(int n)
        : mN(n) {}
};
std::ostream& operator<<(std::ostream& os, const Indent& i);

// Diagnostics go to an optional stream; a null stream drops the message.
void info(std::ostream* diag, const std::string& msg, int indent = 0);
void warn(std::ostream* diag, const std::string& msg, int indent = 0);
void error(std::ostream* diag, const std::string& msg, int indent = 0);

class RenameError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// Bad configuration or interchange input; the caller must fix it.
class ConfigError : public RenameError {
  public:
    using RenameError::RenameError;
};

// A skip target that is not local to a single module.
class InvalidAddressError : public ConfigError {
  public:
    using ConfigError::ConfigError;
};

// The input IR broke an assumption of the renamer; the run is aborted.
class InternalError : public RenameError {
  public:
    explicit InternalError(const std::string& msg)
        : RenameError("internal error: " + msg) {}
};

} // namespace rnm
