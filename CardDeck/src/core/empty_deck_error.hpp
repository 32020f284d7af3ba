#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace Cards {

// thrown when someone asks for a card and the deck has none left
class EmptyDeckError : public std::runtime_error {
public:
    explicit EmptyDeckError(const std::string& message)
        : std::runtime_error(message) {}

    // keeps the exception that led to this one, if there was one
    EmptyDeckError(const std::string& message, std::exception_ptr cause)
        : std::runtime_error(message), cause_(std::move(cause)) {}

    // null when constructed without a cause
    std::exception_ptr cause() const { return cause_; }

private:
    std::exception_ptr cause_;
};

}
