#pragma once

#include <stdexcept>
#include <string>

namespace switchboard {

class SwitchboardError : public std::runtime_error {
public:
    explicit SwitchboardError(const std::string& message) : std::runtime_error(message) {}
};

// Transition not legal from the current state. Never retried automatically.
class StateConflict : public SwitchboardError {
public:
    explicit StateConflict(const std::string& message) : SwitchboardError(message) {}
};

class SlotConflict : public SwitchboardError {
public:
    explicit SlotConflict(const std::string& message) : SwitchboardError(message) {}
};

class ResourceExhausted : public SwitchboardError {
public:
    explicit ResourceExhausted(const std::string& message) : SwitchboardError(message) {}
};

class TransportError : public SwitchboardError {
public:
    explicit TransportError(const std::string& message) : SwitchboardError(message) {}
};

class NotFound : public SwitchboardError {
public:
    explicit NotFound(const std::string& message) : SwitchboardError(message) {}
};

// A value outside one of the closed enumerations.
class InvalidValue : public SwitchboardError {
public:
    explicit InvalidValue(const std::string& message) : SwitchboardError(message) {}
};

class StoreError : public SwitchboardError {
public:
    explicit StoreError(const std::string& message) : SwitchboardError(message) {}
};

}
