#pragma once
/**
 * @file EbusGatewayModule.h
 * @brief Telegram -> publish records gateway, discovery and presence.
 */
#include <atomic>
#include <stddef.h>
#include <stdint.h>
#include "Core/Module.h"
#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Core/Services/Services.h"
#include "Domain/EbusDefaults.h"
#include "Modules/Ebus/Schema/ProfileTypes.h"
#include "Modules/Ebus/Schema/ProfileLoader.h"
#include "Modules/Ebus/Telegram/EbusWireParser.h"
#include "Modules/Ebus/Presence/PresenceEvaluator.h"

/** @brief One value ready for the broker. */
struct PublishRecord {
    char topic[Limits::Mqtt::Buffers::Topic] = {0};
    char value[Limits::Mqtt::Buffers::Value] = {0};
    double numeric = 0.0;
    const char* fieldName = nullptr;
    const char* unit = nullptr;
};

/** @brief What happened while decoding one telegram. */
struct DecodeReport {
    uint8_t matched = 0;       ///< message definitions that matched (0..2)
    bool noMatch = false;
    uint8_t decodeErrors = 0;  ///< messages skipped on OutOfRange / UnknownType
    uint8_t truncated = 0;     ///< records dropped on topic overflow
    ErrorCode lastError = ErrorCode::None;
};

/** @brief Counters since start. */
struct GatewayStats {
    uint32_t telegrams;
    uint32_t noMatch;
    uint32_t decodeErrors;
    uint32_t published;
    uint32_t publishFailed;
    uint32_t discoveryPublished;
    ErrorCode lastPublishError;  ///< NotReady (broker down) or PublishFailed (client refused)
};

/** @brief Config values owned by the gateway. */
struct EbusGatewayConfig {
    uint8_t masterAddr = EbusDefaults::MasterAddress;
    int32_t probeTimeoutMs = Limits::Presence::DefaultTimeoutMs;
    uint8_t mqttQos = 0;
    bool mqttRetain = false;
    bool haRetain = true;
};

/**
 * @brief Module that turns telegrams into MQTT publishes using the active profile.
 *
 * The profile is swapped atomically with `setProfile`; decoding only reads it.
 * Uses the `mqtt` (MqttService) and `ebusbus` (EbusBusService) services when
 * the host registered them.
 */
class EbusGatewayModule : public Module {
public:
    EbusGatewayModule();

    /** @brief Module id. */
    const char* moduleId() const override { return "ebus"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register config variables. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Resolve broker and bus services. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Log the final counters. */
    void onShutdown() override;

    /** @brief Swap the active profile (nullptr disables decoding). The caller keeps it alive. */
    void setProfile(const ApplianceProfile* profile);
    const ApplianceProfile* profile() const { return profile_.load(std::memory_order_acquire); }

    /**
     * @brief Load `json` into `spare` and activate it on success.
     * On failure the active profile is left untouched.
     */
    bool reloadProfile(const char* json, size_t len, ApplianceProfile& spare, ProfileLoadError& err);

    /**
     * @brief Match and decode one telegram without side effects.
     * @return number of records written to `out`.
     */
    static uint8_t decode(const ApplianceProfile& profile,
                          const Telegram& t,
                          PublishRecord* out,
                          uint8_t outCap,
                          DecodeReport* report = nullptr);

    /** @brief Decode with the active profile and publish every record. */
    uint8_t onTelegram(const Telegram& t);
    /** @brief TelegramCallback adapter, ctx = EbusGatewayModule*. */
    static void onWireTelegram(void* ctx, const Telegram& t);

    /** @brief Feed raw adapter bytes through the internal wire parser. */
    void feed(const uint8_t* bytes, size_t n);
    const EbusWireParser& wireParser() const { return parser_; }

    /** @brief Publish one discovery document per known field. @return documents published. */
    uint16_t publishAutodiscovery();

    /** @brief Run the profile's presence rule once through the bus service. */
    PresenceState checkPresence(ErrorCode* why = nullptr);

    GatewayStats stats() const;
    const EbusGatewayConfig& config() const { return cfgData; }

private:
    ErrorCode publish(const char* topic, const char* payload, bool retain);
    const MqttService* mqtt();
    const EbusBusService* bus();

    static bool publishDiscoveryField(void* ctx, const Circuit& circuit, const FieldMapping& field);

    std::atomic<const ApplianceProfile*> profile_{nullptr};
    ServiceRegistry* services_ = nullptr;
    const MqttService* mqttSvc_ = nullptr;
    const EbusBusService* busSvc_ = nullptr;

    EbusWireParser parser_;

    EbusGatewayConfig cfgData;
    ConfigVariable<uint8_t,0> masterAddrVar_{"master_addr", "ebus", ConfigType::UInt8, &cfgData.masterAddr, 0};
    ConfigVariable<int32_t,0> probeTimeoutVar_{"probe_timeout_ms", "ebus", ConfigType::Int32, &cfgData.probeTimeoutMs, 0};
    ConfigVariable<uint8_t,0> qosVar_{"qos", "mqtt", ConfigType::UInt8, &cfgData.mqttQos, 0};
    ConfigVariable<bool,0> retainVar_{"retain", "mqtt", ConfigType::Bool, &cfgData.mqttRetain, 0};
    ConfigVariable<bool,0> haRetainVar_{"retain", "ha", ConfigType::Bool, &cfgData.haRetain, 0};

    std::atomic<uint32_t> telegrams_{0};
    std::atomic<uint32_t> noMatch_{0};
    std::atomic<uint32_t> decodeErrors_{0};
    std::atomic<uint32_t> published_{0};
    std::atomic<uint32_t> publishFailed_{0};
    std::atomic<uint32_t> discoveryPublished_{0};
    std::atomic<ErrorCode> lastPublishError_{ErrorCode::None};
};
