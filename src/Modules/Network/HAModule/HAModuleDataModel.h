#pragma once
/**
 * @file HAModuleDataModel.h
 * @brief Home Assistant runtime data model contribution.
 */

struct HARuntimeData {
    bool autoconfigPublished = false;
};

// MODULE_DATA_MODEL: HARuntimeData ha
