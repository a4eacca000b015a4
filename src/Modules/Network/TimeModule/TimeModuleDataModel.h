#pragma once
/**
 * @file TimeModuleDataModel.h
 * @brief Time module runtime data model contribution.
 */

/** @brief Time runtime status. */
struct TimeRuntimeData {
    bool timeReady = false;
};

// MODULE_DATA_MODEL: TimeRuntimeData time
