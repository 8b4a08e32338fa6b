#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace rowscroll::layout {

// Misuse of the layout by its host. Never recovered from inside the layout.
class PreconditionViolation : public std::logic_error {
public:
    PreconditionViolation(std::string component, const std::string& message);

    const std::string& component() const noexcept { return component_; }

private:
    std::string component_;
};

// Logs the failure and throws PreconditionViolation when condition is false.
void require(bool condition, std::string_view component, const std::string& message);

}
