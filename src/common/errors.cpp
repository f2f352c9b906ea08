#include "common/errors.hpp"

namespace tempo {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::DuplicateDocument: return "DuplicateDocument";
        case ErrorCode::UnknownDocument: return "UnknownDocument";
        case ErrorCode::IncomparableTimestamp: return "IncomparableTimestamp";
        case ErrorCode::TimestampParse: return "TimestampParse";
    }
    return "Unknown";
}

std::string result_status_to_string(ResultStatus status) {
    switch (status) {
        case ResultStatus::Complete: return "complete";
        case ResultStatus::NoPath: return "no_path";
        case ResultStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace tempo
