#pragma once
/**
 * @file ProfileLoader.h
 * @brief JSON schema document -> validated `ApplianceProfile`.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Modules/Ebus/Schema/ProfileTypes.h"

/** @brief Why a load failed and where (JSON path such as `circuits[0].messages[1].request_map[2].data_type`). */
struct ProfileLoadError {
    ErrorCode code = ErrorCode::None;
    char where[96] = {0};
};

/**
 * @brief Parse and validate a schema document into `out`.
 *
 * `out` is cleared first and cleared again on failure, so callers that need
 * to keep serving should load into a spare profile and swap on success.
 */
bool loadApplianceProfile(const char* json, size_t len, ApplianceProfile& out, ProfileLoadError& err);

/** @brief Same as above for a NUL-terminated document. */
bool loadApplianceProfile(const char* json, ApplianceProfile& out, ProfileLoadError& err);
