#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace weft {

// An API was called out of order (e.g. Children::child before render).
class UsageError : public std::logic_error {
public:
    explicit UsageError(const std::string& what) : std::logic_error(what) {}
};

// A scope was forked after it started closing.
class ScopeClosedError : public std::runtime_error {
public:
    explicit ScopeClosedError(const std::string& what) : std::runtime_error(what) {}
};

// Thrown at a cancellation checkpoint once the owning scope is closing.
// Not a failure: finalizers still run and nothing is reported as a defect.
class Interrupted : public std::exception {
public:
    const char* what() const noexcept override { return "interrupted"; }
};

// One or more unexpected failures, e.g. finalizers that threw during close.
class DefectError : public std::runtime_error {
public:
    DefectError(const std::string& what, std::vector<std::exception_ptr> causes)
        : std::runtime_error(what), causes_(std::move(causes)) {}

    const std::vector<std::exception_ptr>& causes() const { return causes_; }

private:
    std::vector<std::exception_ptr> causes_;
};

// Best-effort message of a captured exception.
std::string describe_exception(const std::exception_ptr& error);

} // namespace weft
