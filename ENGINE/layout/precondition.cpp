#include "layout/precondition.hpp"

#include <utility>

#include "utils/log.hpp"

namespace rowscroll::layout {

PreconditionViolation::PreconditionViolation(std::string component, const std::string& message)
: std::logic_error("[" + component + "] " + message),
  component_(std::move(component)) {}

void require(bool condition, std::string_view component, const std::string& message) {
    if (condition) {
        return;
    }
    rowscroll::log::error(component, "Precondition violated: " + message);
    throw PreconditionViolation(std::string(component), message);
}

}
