#pragma once
/**
 * @file ProfileTypes.h
 * @brief In-memory appliance profile built by `ProfileLoader`.
 *
 * The profile is a set of fixed pools (circuits, messages, fields). Circuits
 * reference a contiguous message range and each message references contiguous
 * field ranges, so declaration order is preserved for first-match-wins.
 * Once loaded, a profile is only read.
 */

#include <stddef.h>
#include <stdint.h>
#include "Core/SystemLimits.h"
#include "Modules/Ebus/Decode/DataType.h"
#include "Modules/Ebus/Match/BytePattern.h"

/** @brief Matching criteria for one telegram direction. */
struct PatternSpec {
    BytePattern src;
    BytePattern dst;
    bool hasPbsb = false;
    uint16_t pbsb = 0;
    BytePattern data;
};

/** @brief One extractable value. */
struct FieldMapping {
    char name[Limits::Profile::Buffers::FieldName] = {0};
    uint16_t offset = 0;
    DataType type = DataType::Invalid;
    double factor = 1.0;
    char unit[Limits::Profile::Buffers::Unit] = {0};
};

/** @brief Contiguous slice of `ApplianceProfile::fields`. */
struct FieldMapRef {
    uint16_t first = 0;
    uint8_t count = 0;
    bool present = false;
};

struct MessageDefinition {
    char comment[Limits::Profile::Buffers::Comment] = {0};
    char topicTemplate[Limits::Profile::Buffers::TopicTemplate] = {0};
    bool hasRequestPattern = false;
    PatternSpec request;
    bool hasResponsePattern = false;
    PatternSpec response;
    FieldMapRef requestMap;
    FieldMapRef responseMap;
};

struct Circuit {
    char name[Limits::Profile::Buffers::CircuitName] = {0};
    uint16_t firstMessage = 0;
    uint16_t messageCount = 0;
};

struct PresenceRule {
    bool valid = false;
    PatternSpec request;
    PatternSpec response;
};

struct AutodiscoveryConfig {
    bool enabled = false;
    char topicRoot[Limits::Profile::Buffers::DiscoveryTopic] = {0};
    /** @brief Payload template kept as compact JSON text. */
    char payloadTemplate[Limits::Profile::Buffers::DiscoveryPayload] = {0};
};

struct ApplianceProfile {
    char appliance[Limits::Profile::Buffers::Appliance] = {0};
    char bus[Limits::Profile::Buffers::Bus] = {0};
    PresenceRule presence;
    AutodiscoveryConfig autodiscovery;

    Circuit circuits[Limits::Profile::MaxCircuits];
    uint8_t circuitCount = 0;
    MessageDefinition messages[Limits::Profile::MaxMessages];
    uint16_t messageCount = 0;
    FieldMapping fields[Limits::Profile::MaxFields];
    uint16_t fieldCount = 0;

    void clear();

    /** @brief Index of the circuit with this name, or -1. */
    int findCircuit(const char* name) const;

    const FieldMapping* mapFields(const FieldMapRef& ref) const
    {
        return (ref.present && ref.count > 0) ? &fields[ref.first] : nullptr;
    }
};
