#pragma once
#include <stdexcept>
#include <string>

enum class LedgerErrorCode {
    NotFound,
    Conflict,            // 状态不允许该操作，例如修改已结束的执行
    Busy,
    ConstraintViolation,
    IOError,
    Corruption,
    InternalError
};

std::string toString(LedgerErrorCode code);

// 账本读写失败，执行过程中遇到即视为致命错误
class LedgerError: public std::runtime_error {
public:
    LedgerError(LedgerErrorCode code, const std::string& message)
        : std::runtime_error(message), errorCode(code) {}

    LedgerErrorCode code() const {
        return errorCode;
    }

private:
    LedgerErrorCode errorCode;
};
