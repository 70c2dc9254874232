#pragma once

#include "core/result.hpp"
#include <QLoggingCategory>

namespace waypool::service {

using LogCategory = const QLoggingCategory& (*)();

/**
 * Log an Internal failure with its full message before it leaves the
 * service layer. Business failures pass through untouched.
 */
template<typename T>
[[nodiscard]] Result<T, Error> log_internal(LogCategory category,
                                            const char* operation,
                                            Result<T, Error> result) {
    if (result.is_err() && !result.unwrap_err().is_business()) {
        qCCritical(category) << operation << "failed:" << result.unwrap_err().message.c_str();
    }
    return result;
}

} // namespace waypool::service
