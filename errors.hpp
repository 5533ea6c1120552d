/**
 * 10/19/2026
 *
 * Exception types thrown by the labeling and crack detection functions
 * InvalidInput: empty, ragged or wrongly typed images
 * InvalidConfiguration: connectivity, threshold, kernel or shape filter values out of range
 */

#pragma once
#include <stdexcept>
#include <string>

namespace crackscan
{

// Base class so callers can catch every crackscan failure in one place
class Error : public std::runtime_error
{
public:
    explicit Error(const std::string &what) : std::runtime_error(what) {}
};

class InvalidInput : public Error
{
public:
    explicit InvalidInput(const std::string &what) : Error("invalid input: " + what) {}
};

class InvalidConfiguration : public Error
{
public:
    explicit InvalidConfiguration(const std::string &what) : Error("invalid configuration: " + what) {}
};

} // namespace crackscan
