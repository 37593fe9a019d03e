#include "rockseg/core/exception.h"
#include <sstream>

namespace rockseg {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_EMPTY_INPUT:
            return "ERROR_EMPTY_INPUT";
        case ResultCode::ERROR_INVALID_SEED:
            return "ERROR_INVALID_SEED";
        case ResultCode::ERROR_DEGENERATE_GEOMETRY:
            return "ERROR_DEGENERATE_GEOMETRY";
        case ResultCode::ERROR_STAGE_ORDER:
            return "ERROR_STAGE_ORDER";
        case ResultCode::ERROR_EXTERNAL_COMPONENT:
            return "ERROR_EXTERNAL_COMPONENT";
        case ResultCode::ERROR_CANCELLED:
            return "ERROR_CANCELLED";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace rockseg
