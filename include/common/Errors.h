#pragma once

#include <stdexcept>
#include <string>

namespace gridlab {

class GridLabError : public std::runtime_error {
public:
    explicit GridLabError(const std::string& message) : std::runtime_error(message) {}
};

// Too few usable price points in the requested range
class InsufficientDataError : public GridLabError {
public:
    explicit InsufficientDataError(const std::string& message) : GridLabError(message) {}
};

// Unrecognized grid geometry name
class InvalidGridTypeError : public GridLabError {
public:
    explicit InvalidGridTypeError(const std::string& message) : GridLabError(message) {}
};

class InvalidParameterError : public GridLabError {
public:
    explicit InvalidParameterError(const std::string& message) : GridLabError(message) {}
};

// Price file missing or unreadable
class DataLoadError : public GridLabError {
public:
    explicit DataLoadError(const std::string& message) : GridLabError(message) {}
};

class BacktestTimeoutError : public GridLabError {
public:
    explicit BacktestTimeoutError(const std::string& message) : GridLabError(message) {}
};

} // namespace gridlab
