#pragma once
/**
 * @file TopicFormatter.h
 * @brief `<placeholder>` expansion for publish topics and discovery payloads.
 *
 * Vocabulary: `<circuit>` / `<circuit_name>`, `<field_name>`, `<field_value>`,
 * `<unit>`, `<appliance>`, `<bus>`. A placeholder whose value is not set in the
 * context, an unknown placeholder or an unterminated `<` is copied verbatim.
 * Expansion is a single left-to-right pass: substituted text is not rescanned.
 */

#include <stddef.h>
#include <stdint.h>

/** @brief Values available to one expansion. `nullptr` means "not available". */
struct TemplateContext {
    const char* appliance = nullptr;
    const char* bus = nullptr;
    const char* circuit = nullptr;
    const char* fieldName = nullptr;
    const char* unit = nullptr;
    bool hasValue = false;
    double value = 0.0;
};

enum class Placeholder : uint8_t {
    None = 0,
    Circuit,
    FieldName,
    FieldValue,
    Unit,
    Appliance,
    Bus
};

/** @brief Map a placeholder name (without brackets) to its token. */
Placeholder placeholderFromName(const char* name, size_t len);

/**
 * @brief Stable numeric text: `%.6f` with trailing zeros and dot removed.
 * `-0` renders as `0`. Magnitudes from 1e15 up use `%.15g` (`4.294967295e+31`),
 * so any finite double fits `Limits::Mqtt::Buffers::Value`. Returns false on truncation.
 */
bool formatValue(double v, char* out, size_t outLen);

/**
 * @brief Expand `tpl` into `out`.
 * @return false when `out` is too small (output is truncated but terminated).
 */
bool formatTopic(const char* tpl, const TemplateContext& ctx, char* out, size_t outLen);
