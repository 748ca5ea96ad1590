// store_errors.hpp
#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind { Validation, NotFound };

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation_error";
        case ErrorKind::NotFound:   return "not_found";
    }
    return "unknown";
}

// Errors raised by the store and the tool adapter. They are reported at the
// point of the call and never leave partial state behind.
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& what_arg)
        : std::runtime_error(what_arg), kind_(kind) {}
    ErrorKind kind() const { return kind_; }
    const char* kind_name() const { return error_kind_name(kind_); }

private:
    ErrorKind kind_;
};

class ValidationError : public StoreError {
public:
    explicit ValidationError(const std::string& what_arg)
        : StoreError(ErrorKind::Validation, what_arg) {}
};

class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& what_arg)
        : StoreError(ErrorKind::NotFound, what_arg) {}
};
