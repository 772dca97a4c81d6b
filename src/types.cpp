#include "codecstore/types.hpp"

namespace codecstore {

const char* to_string(Status s) {
    switch (s) {
        case Status::Ok:            return "ok";
        case Status::NoInit:        return "no-init";
        case Status::NameNotFound:  return "name-not-found";
        case Status::AlreadyExists: return "already-exists";
        case Status::BadValue:      return "bad-value";
        case Status::Malformed:     return "malformed";
        case Status::IoError:       return "io-error";
    }
    return "unknown";
}

} // namespace codecstore
