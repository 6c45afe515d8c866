#include "status.hpp"

const char* status_token(Status status) {
    switch (status) {
        case Status::Pending:  return "pending";
        case Status::Complete: return "complete";
        case Status::Error:    return "error";
        case Status::Unknown:  break;
    }
    return "unknown";
}

Status parse_status(const std::string& token) {
    if (token == "pending") return Status::Pending;
    if (token == "complete") return Status::Complete;
    if (token == "error") return Status::Error;
    return Status::Unknown;
}
