#include "ServiceError.h"

const char* ServiceError::name() const {
    switch (kind_) {
        case ErrorKind::InvalidRange:      return "invalid_range";
        case ErrorKind::NotFound:          return "not_found";
        case ErrorKind::Forbidden:         return "forbidden";
        case ErrorKind::BadRequest:        return "invalid_request";
        case ErrorKind::UnsupportedFormat: return "unsupported_format";
        case ErrorKind::TooLarge:          return "too_large";
    }
    return "invalid_request";
}

// 2xxx codes are book-related failures, 400 is a generic validation failure
int ServiceError::code() const {
    switch (kind_) {
        case ErrorKind::InvalidRange:      return 2001;
        case ErrorKind::NotFound:          return 2001;
        case ErrorKind::Forbidden:         return 2002;
        case ErrorKind::UnsupportedFormat: return 2003;
        case ErrorKind::TooLarge:          return 2004;
        case ErrorKind::BadRequest:        return 400;
    }
    return 400;
}
