#pragma once

#include <nlohmann/json.hpp>

#include "core/scramble/ScrambleOptions.h"

/**
 * @file OptionsJson.h
 * @brief ScrambleOptions 与 JSON 对象之间的映射。
 *
 * 键名：minLength、seed、preserveCase、scrambleProbability。
 * 未识别的键以及类型不符的值一律忽略，对应字段保持未设置。
 */

ScrambleOptions optionsFromJson(const nlohmann::json& node);

/// 只写出已设置的字段。
nlohmann::json optionsToJson(const ScrambleOptions& options);
