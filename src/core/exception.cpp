#include "passcheck/core/exception.h"
#include <sstream>

namespace passcheck {
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
        case ResultCode::ERROR_INVALID_INPUT:
            return "ERROR_INVALID_INPUT";
        case ResultCode::ERROR_INVALID_ARGUMENT:
            return "ERROR_INVALID_ARGUMENT";
        case ResultCode::ERROR_NOT_INITIALIZED:
            return "ERROR_NOT_INITIALIZED";
        case ResultCode::ERROR_CONFIGURATION:
            return "ERROR_CONFIGURATION";
        case ResultCode::ERROR_MODEL_LOAD:
            return "ERROR_MODEL_LOAD";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_CHECK_FAILURE:
            return "ERROR_CHECK_FAILURE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace passcheck
