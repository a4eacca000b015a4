#pragma once
/**
 * @file Runtime.h
 * @brief Aggregated runtime helpers for modules.
 */

// Public runtime helpers are aggregated at build time.
#include "Core/Generated/ModuleRuntime_Generated.h"
