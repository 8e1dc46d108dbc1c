#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace dfl {

class ScanError : public std::runtime_error {
public:
    ScanError(const std::string& what, std::string location)
        : std::runtime_error(what), location_(std::move(location)) {}

    const std::string& location() const { return location_; }

private:
    std::string location_;
};

class DepthExceededError : public ScanError {
public:
    DepthExceededError(std::size_t max_depth, std::string location);

    std::size_t max_depth() const { return max_depth_; }

private:
    std::size_t max_depth_;
};

class SizeExceededError : public ScanError {
public:
    SizeExceededError(std::size_t max_bytes, std::string location);

    std::size_t max_bytes() const { return max_bytes_; }

private:
    std::size_t max_bytes_;
};

// A payload node that holds none of the supported value kinds.
class TypeError : public ScanError {
public:
    using ScanError::ScanError;
};

}  // namespace dfl
