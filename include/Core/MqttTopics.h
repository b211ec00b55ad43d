#pragma once
/**
 * @file MqttTopics.h
 * @brief Standard MQTT topic pieces shared across modules.
 */

namespace MqttTopics {

/** @brief Home Assistant discovery component used for decoded fields. */
constexpr char ComponentSensor[] = "sensor";
/** @brief Discovery document suffix (`<root>/<component>/<node>/<object>/config`). */
constexpr char SuffixConfig[] = "config";
/** @brief Default discovery root when the profile does not name one. */
constexpr char DefaultDiscoveryRoot[] = "homeassistant";

}  // namespace MqttTopics
