#pragma once
/**
 * @file AzanModuleDataModel.h
 * @brief Azan scheduler runtime data model contribution.
 */

#include <stdint.h>

#include "Modules/PrayerTimesModule/TimeTable.h"

constexpr uint8_t AZAN_KIND_NONE = 0xFF;

/** @brief Read-only projection of the scheduler state. */
struct AzanRuntimeData {
    uint8_t status = 0;                  // AzanStatus
    uint8_t activeKind = AZAN_KIND_NONE; // kind of the active session
    uint8_t nextKind = AZAN_KIND_NONE;
    uint64_t nextEpoch = 0;
    uint64_t kindEpoch[PRAYER_SCHEDULED_COUNT] = {0, 0, 0, 0, 0, 0};
    CivilDate tableDay{};
    bool tableValid = false;
    char source[TIMETABLE_SOURCE_MAX] = {0};
    char hijri[TIMETABLE_HIJRI_MAX] = {0};
    uint16_t lastError = 0;              // ErrorCode
    uint32_t refreshCount = 0;
    uint32_t refreshFailCount = 0;
};
