#pragma once
/**
 * @file AutodiscoveryFormatter.h
 * @brief Home Assistant discovery documents, one per known (circuit, field).
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/Ebus/Schema/ProfileTypes.h"

struct DiscoveryDocument {
    char topic[Limits::Ha::TopicBuf] = {0};
    char payload[Limits::Ha::PayloadBuf] = {0};
};

/** @brief Lower-case alphanumerics, every other character becomes `_`. */
void sanitizeId(const char* in, char* out, size_t outLen);

/** @brief `<root>/sensor/<node id>/<object id>/config`. */
bool buildDiscoveryTopic(const ApplianceProfile& profile,
                         const char* circuit,
                         const char* fieldName,
                         char* out,
                         size_t outLen);

/**
 * @brief Expand the profile's payload template for one field.
 *
 * Every string value of the template (nested objects and arrays included)
 * goes through `formatTopic`; `<field_value>` stays verbatim.
 * @return false with `code` = CapacityExceeded, BadSchemaJson or TopicTruncated.
 */
bool formatAutodiscovery(const ApplianceProfile& profile,
                         const Circuit& circuit,
                         const FieldMapping& field,
                         DiscoveryDocument& out,
                         ErrorCode& code);

/** @brief Visitor for `forEachKnownField`; return false to stop. */
typedef bool (*KnownFieldFn)(void* ctx, const Circuit& circuit, const FieldMapping& field);

/**
 * @brief Visit each distinct (circuit, field name) once, in declaration order.
 * @return number of fields visited.
 */
uint16_t forEachKnownField(const ApplianceProfile& profile, KnownFieldFn fn, void* ctx);
