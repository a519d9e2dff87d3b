#include "progressbar/core/error_codes.hpp"
#include <utility>

namespace progressbar {
namespace core {

ProgressError::ProgressError(ProgressErrorCode code, common::ErrorContext context)
    : std::runtime_error(buildMessage(code, context)),
      code_(code),
      context_(std::move(context)) {}

std::string ProgressError::buildMessage(ProgressErrorCode code, const common::ErrorContext& context) {
    std::string message = std::string(ProgressErrorCodeHelper::toString(code)) + ": " +
                          ProgressErrorCodeHelper::getMessage(code);

    std::string details = common::formatContext(context);
    if (!details.empty()) {
        message += " (" + details + ")";
    }
    return message;
}

}}
