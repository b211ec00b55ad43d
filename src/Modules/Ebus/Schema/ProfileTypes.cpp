/**
 * @file ProfileTypes.cpp
 * @brief Implementation file.
 */
#include "Modules/Ebus/Schema/ProfileTypes.h"
#include <string.h>

void ApplianceProfile::clear()
{
    appliance[0] = '\0';
    bus[0] = '\0';
    presence = PresenceRule{};
    autodiscovery = AutodiscoveryConfig{};
    for (uint8_t i = 0; i < circuitCount; ++i) circuits[i] = Circuit{};
    for (uint16_t i = 0; i < messageCount; ++i) messages[i] = MessageDefinition{};
    for (uint16_t i = 0; i < fieldCount; ++i) fields[i] = FieldMapping{};
    circuitCount = 0;
    messageCount = 0;
    fieldCount = 0;
}

int ApplianceProfile::findCircuit(const char* name) const
{
    if (!name) return -1;
    for (uint8_t i = 0; i < circuitCount; ++i) {
        if (strcmp(circuits[i].name, name) == 0) return i;
    }
    return -1;
}
