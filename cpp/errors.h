#pragma once
#include <stdexcept>
#include <string>

namespace txguard {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Malformed request; raised before any state is touched.
class InvalidTransaction : public Error {
public:
    explicit InvalidTransaction(const std::string& what) : Error(what) {}
};

class StateUnavailable : public Error {
public:
    explicit StateUnavailable(const std::string& what) : Error(what) {}
};

class ScorerUnavailable : public Error {
public:
    explicit ScorerUnavailable(const std::string& what) : Error(what) {}
};

class ScorerContractViolation : public Error {
public:
    explicit ScorerContractViolation(const std::string& what) : Error(what) {}
};

class Timeout : public Error {
public:
    explicit Timeout(const std::string& what) : Error(what) {}
};

// Too many calls already in flight to start another.
class Overloaded : public Error {
public:
    explicit Overloaded(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace txguard
