#pragma once

#include <stdexcept>
#include <string>

namespace coedit::collab {

enum class ErrorKind { Validation, Permission, NotFound, Transport, Persistence };

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation:  return "validation";
        case ErrorKind::Permission:  return "permission";
        case ErrorKind::NotFound:    return "not_found";
        case ErrorKind::Transport:   return "transport";
        case ErrorKind::Persistence: return "persistence";
    }
    return "unknown";
}

class CollabError : public std::runtime_error {
public:
    CollabError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Malformed or out-of-bounds operation or frame. Reported to the sender only.
class ValidationError : public CollabError {
public:
    explicit ValidationError(const std::string& what) : CollabError(ErrorKind::Validation, what) {}
};

class PermissionError : public CollabError {
public:
    explicit PermissionError(const std::string& what) : CollabError(ErrorKind::Permission, what) {}
};

class NotFoundError : public CollabError {
public:
    explicit NotFoundError(const std::string& what) : CollabError(ErrorKind::NotFound, what) {}
};

class TransportError : public CollabError {
public:
    explicit TransportError(const std::string& what) : CollabError(ErrorKind::Transport, what) {}
};

class PersistenceError : public CollabError {
public:
    explicit PersistenceError(const std::string& what) : CollabError(ErrorKind::Persistence, what) {}
};

} // namespace coedit::collab
