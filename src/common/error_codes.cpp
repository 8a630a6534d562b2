#include "termbar/common/error_codes.hpp"

namespace termbar {
namespace common {

namespace {

std::string composeMessage(ErrorCode code, const std::string& message, const ErrorContext& context) {
    std::string result = ErrorCodeHelper::toString(code);
    result += ": ";
    result += message.empty() ? ErrorCodeHelper::getMessage(code) : message;

    std::string ctx = formatContext(context);
    if (!ctx.empty()) {
        result += " (" + ctx + ")";
    }
    return result;
}

}

TermbarError::TermbarError(ErrorCode code)
    : TermbarError(code, "", ErrorContext{}) {}

TermbarError::TermbarError(ErrorCode code, const std::string& message)
    : TermbarError(code, message, ErrorContext{}) {}

TermbarError::TermbarError(ErrorCode code, const std::string& message, const ErrorContext& context)
    : std::runtime_error(composeMessage(code, message, context)),
      code_(code),
      context_(context) {}

}}
