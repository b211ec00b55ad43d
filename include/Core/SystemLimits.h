#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief Log ring length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 64;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 32;
/** @brief JSON capacity for `ConfigStore::applyJson` patches. */
constexpr size_t JsonConfigApplyBuf = 1024;
/** @brief Maximum number of modules handled by `ModuleManager`. */
constexpr uint8_t MaxModules = 8;
/** @brief Maximum number of services held by `ServiceRegistry`. */
constexpr uint8_t MaxServices = 16;
/** @brief Maximum number of log sinks held by `LogSinkRegistry`. */
constexpr uint8_t MaxLogSinks = 4;

/** @brief eBUS wire limits. */
namespace Ebus {
/** @brief Maximum request or response data length (`NN` byte). */
constexpr uint8_t MaxDataLen = 16;
/** @brief Bytes per `feed` call when replaying a capture file. */
constexpr size_t RxBufLen = 256;
}  // namespace Ebus

/** @brief Appliance profile capacities and string buffer sizes. */
namespace Profile {

/** @brief Circuits per profile. */
constexpr uint8_t MaxCircuits = 16;
/** @brief Message definitions across all circuits of a profile. */
constexpr uint16_t MaxMessages = 128;
/** @brief Field mappings across all messages of a profile. */
constexpr uint16_t MaxFields = 384;
/** @brief Field mappings in one request or response map. */
constexpr uint8_t MaxFieldsPerMap = 16;
/** @brief Payload pattern bytes (eBUS data never exceeds 16 bytes). */
constexpr uint8_t MaxPatternBytes = Ebus::MaxDataLen;

namespace Buffers {
constexpr size_t Appliance = 48;
constexpr size_t Bus = 32;
constexpr size_t CircuitName = 32;
constexpr size_t FieldName = 40;
constexpr size_t Unit = 16;
constexpr size_t Comment = 96;
constexpr size_t TopicTemplate = 160;
constexpr size_t DiscoveryTopic = 96;
constexpr size_t DiscoveryPayload = 1024;
}  // namespace Buffers

/** @brief JSON capacity for a full schema document in `ProfileLoader`. */
constexpr size_t JsonSchemaDoc = 32768;

}  // namespace Profile

/** @brief Gateway publish limits. */
namespace Mqtt {
namespace Buffers {
/** @brief Expanded topic length for one publish record. */
constexpr size_t Topic = 192;
/** @brief Value payload text (`12`, `-0.75`, `4.294967295e+31`). Fits any `formatValue` output. */
constexpr size_t Value = 32;
}  // namespace Buffers

/** @brief Publish records produced by one telegram (request map + response map). */
constexpr uint8_t MaxRecordsPerTelegram = 2 * Profile::MaxFieldsPerMap;
}  // namespace Mqtt

/** @brief Home Assistant auto-discovery limits. */
namespace Ha {
/** @brief JSON capacity used to expand one discovery payload template. */
constexpr size_t JsonDiscoveryDoc = 3072;
/** @brief Serialized discovery payload buffer in `AutodiscoveryFormatter`. */
constexpr size_t PayloadBuf = 1536;
/** @brief Discovery topic buffer (`<root>/sensor/<node>/<object>/config`). */
constexpr size_t TopicBuf = 256;
/** @brief Sanitized object id buffer. */
constexpr size_t ObjectIdBuf = 96;
}  // namespace Ha

/** @brief Presence probe defaults. */
namespace Presence {
/** @brief Default probe timeout in ms for `ebus.probe_timeout_ms`. */
constexpr int32_t DefaultTimeoutMs = 1000;
}  // namespace Presence

}  // namespace Limits
