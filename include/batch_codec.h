/*
 * This file is part of PowerGuard Actuator (PGuard).
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef PGUARD_BATCH_CODEC_H
#define PGUARD_BATCH_CODEC_H

#include "types.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Decodes a recommendation batch: an array, or an object with an "actionables" array.
// Every array element yields exactly one record, malformed ones included
// (they fail validation later). Returns false only when the document is unusable.
bool ParseBatch(const std::string& text, std::vector<ActionableRecord>& out, std::string& error);
bool ParseBatch(const nlohmann::json& doc, std::vector<ActionableRecord>& out, std::string& error);

ActionableRecord RecordFromJson(const nlohmann::json& j, size_t index);

nlohmann::json ResultToJson(const ExecutionResult& r);
std::optional<ExecutionResult> ResultFromJson(const nlohmann::json& j);
nlohmann::json ResultsToJson(const std::vector<ExecutionResult>& results);

// dump() that substitutes U+FFFD for invalid UTF-8 instead of throwing
std::string DumpJson(const nlohmann::json& j, int indent = -1);

#endif // PGUARD_BATCH_CODEC_H
