// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Beacon - A contextual-bandit product recommendation engine
 * Copyright (C) 2024 Max Qian
 */

#ifndef BEACON_CORE_EXCEPTION_HPP
#define BEACON_CORE_EXCEPTION_HPP

#include <string>
#include <utility>

#include "atom/error/exception.hpp"

namespace beacon {

/**
 * @brief Reason attached to a rejected event or request
 */
enum class ValidationReason {
    MissingField,
    InvalidValue,
    UnknownAction,
    InvalidTimestamp
};

[[nodiscard]] inline auto validationReasonToString(ValidationReason reason)
    -> std::string {
    switch (reason) {
        case ValidationReason::MissingField:
            return "missing_field";
        case ValidationReason::InvalidValue:
            return "invalid_value";
        case ValidationReason::UnknownAction:
            return "unknown_action";
        case ValidationReason::InvalidTimestamp:
            return "invalid_timestamp";
    }
    return "invalid_value";
}

/**
 * @brief Malformed interaction event or recommendation request
 *
 * Carries a machine-readable reason so the service layer can answer with a
 * reason code instead of a free-form message.
 */
class ValidationError : public atom::error::Exception {
public:
    template <typename... Args>
    ValidationError(const char* file, int line, const char* func,
                    ValidationReason reason, Args&&... args)
        : atom::error::Exception(file, line, func,
                                 std::forward<Args>(args)...),
          reason_(reason) {}

    [[nodiscard]] auto reason() const noexcept -> ValidationReason {
        return reason_;
    }

private:
    ValidationReason reason_;
};

// The user is unknown to the engine and to the interaction history source.
// A known user without history is not an error.
class UserNotFoundError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

// No catalog snapshot was ever loaded, or a catalog source failed.
class CatalogUnavailableError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

// Eligible pool is empty and the engine is configured to fail on it.
class NoCandidatesError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

class ConfigError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

// Failure of a durable arm statistics backend.
class StoreError : public atom::error::Exception {
    using atom::error::Exception::Exception;
};

#define THROW_VALIDATION_ERROR(reason, ...)                          \
    throw beacon::ValidationError(ATOM_FILE_NAME, ATOM_FILE_LINE,    \
                                  ATOM_FUNC_NAME, reason, __VA_ARGS__)

#define THROW_USER_NOT_FOUND(...)                                    \
    throw beacon::UserNotFoundError(ATOM_FILE_NAME, ATOM_FILE_LINE,  \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_CATALOG_UNAVAILABLE(...)                                    \
    throw beacon::CatalogUnavailableError(ATOM_FILE_NAME, ATOM_FILE_LINE, \
                                          ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_NO_CANDIDATES(...)                                     \
    throw beacon::NoCandidatesError(ATOM_FILE_NAME, ATOM_FILE_LINE,  \
                                    ATOM_FUNC_NAME, __VA_ARGS__)

#define THROW_CONFIG_ERROR(...)                                             \
    throw beacon::ConfigError(ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, \
                              __VA_ARGS__)

#define THROW_STORE_ERROR(...)                                              \
    throw beacon::StoreError(ATOM_FILE_NAME, ATOM_FILE_LINE, ATOM_FUNC_NAME, \
                             __VA_ARGS__)

}  // namespace beacon

#endif  // BEACON_CORE_EXCEPTION_HPP
