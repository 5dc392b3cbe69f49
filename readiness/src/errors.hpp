#pragma once

#include <stdexcept>
#include <string>
#include <vector>

struct FieldError {
    std::string field;
    std::string message;
};

// Hard input failure: every violated field is reported at once
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(std::vector<FieldError> errors);

    const std::vector<FieldError>& errors() const { return errors_; }
    bool has_field(const std::string& field) const;

private:
    std::vector<FieldError> errors_;

    static std::string build_message(const std::vector<FieldError>& errors);
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Invalid scoring config: " + message) {}
};
