#include "errors.hpp"
#include <utility>

ValidationError::ValidationError(std::vector<FieldError> errors)
    : std::runtime_error(build_message(errors))
    , errors_(std::move(errors))
{}

bool ValidationError::has_field(const std::string& field) const {
    for (const auto& e : errors_) {
        if (e.field == field) return true;
    }
    return false;
}

std::string ValidationError::build_message(const std::vector<FieldError>& errors) {
    std::string msg = "Validation failed: ";
    for (size_t i = 0; i < errors.size(); i++) {
        if (i > 0) msg += ", ";
        msg += errors[i].field + " (" + errors[i].message + ")";
    }
    return msg;
}
