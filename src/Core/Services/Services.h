#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "IEbusBus.h"
#include "ILogger.h"
#include "IMqtt.h"
