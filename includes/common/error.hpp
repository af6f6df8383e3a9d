#pragma once

#include <stdexcept>
#include <string>

namespace soda {

// Raised for setup failures. Per-event failures never surface as exceptions.
class SodaError : public std::runtime_error {
public:
    enum class Kind {
        LibraryLoad,
        Creation,
        Serialization,
        InvalidState
    };

    SodaError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace soda
