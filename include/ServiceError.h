#ifndef TXTREADER_SERVICEERROR_H
#define TXTREADER_SERVICEERROR_H

#include <stdexcept>
#include <string>

//
// ServiceError: a client-correctable failure of a core operation.
// Storage failures are plain std::runtime_error and never a ServiceError.
//
enum class ErrorKind {
    InvalidRange,       // position/length outside the book
    NotFound,           // unknown book/chapter
    Forbidden,          // book belongs to someone else and is private
    BadRequest,         // malformed or missing request fields
    UnsupportedFormat,  // not a .txt file, or not valid UTF-8
    TooLarge            // upload exceeds maxfilesize
};

class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const std::string& reason)
        : std::runtime_error(reason), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    // short machine-readable name sent back to clients as "error"
    const char* name() const;

    // numeric application code sent back to clients as "code"
    int code() const;

private:
    ErrorKind kind_;
};

#endif // TXTREADER_SERVICEERROR_H
