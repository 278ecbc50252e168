#pragma once

#include <stdexcept>
#include <string>

enum class RemediationResultCode {
    SUCCESS = 0,
    INPUT_INVALID,
    GENERATION_FAILED,
    GENERATION_TIMEOUT,
    CONFIRMATION_REQUIRED,
    AUDIT_WRITE_FAILED,
};

inline const char* ToString(RemediationResultCode code) {
    switch (code) {
    case RemediationResultCode::SUCCESS:
        return "success";
    case RemediationResultCode::INPUT_INVALID:
        return "input_error";
    case RemediationResultCode::GENERATION_FAILED:
        return "generation_error";
    case RemediationResultCode::GENERATION_TIMEOUT:
        return "generation_timeout";
    case RemediationResultCode::CONFIRMATION_REQUIRED:
        return "confirmation_required";
    case RemediationResultCode::AUDIT_WRITE_FAILED:
        return "audit_write_error";
    }

    return "unknown";
}

// Status code reported by the decision endpoints for each result.
inline unsigned HttpStatusFor(RemediationResultCode code) {
    switch (code) {
    case RemediationResultCode::SUCCESS:
        return 200;
    case RemediationResultCode::INPUT_INVALID:
        return 422;
    case RemediationResultCode::CONFIRMATION_REQUIRED:
        return 400;
    case RemediationResultCode::GENERATION_TIMEOUT:
        return 504;
    case RemediationResultCode::GENERATION_FAILED:
    case RemediationResultCode::AUDIT_WRITE_FAILED:
        return 500;
    }

    return 500;
}

class RemediationResultException : public std::runtime_error {
public:
    RemediationResultException(RemediationResultCode code, const std::string& message)
        : std::runtime_error(message)
        , code_{code} {}

    RemediationResultCode Code() const { return code_; }

private:
    RemediationResultCode code_;
};
