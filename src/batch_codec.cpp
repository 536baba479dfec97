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

#include "batch_codec.h"

using json = nlohmann::json;

namespace {

    std::string ScalarToString(const json& v)
    {
        if (v.is_string()) return v.get<std::string>();
        if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
        return v.dump();
    }

    // First present, non-null key wins
    const json* FindAny(const json& j, std::initializer_list<const char*> keys)
    {
        for (const char* k : keys) {
            auto it = j.find(k);
            if (it != j.end() && !it->is_null()) return &(*it);
        }
        return nullptr;
    }
}

ActionableRecord RecordFromJson(const json& j, size_t index)
{
    ActionableRecord rec;
    rec.id = "#" + std::to_string(index);
    if (!j.is_object()) return rec;

    if (const json* id = FindAny(j, { "id" })) {
        std::string s = ScalarToString(*id);
        if (!s.empty()) rec.id = s;
    }
    if (const json* type = FindAny(j, { "type" }); type && type->is_string()) {
        rec.type = type->get<std::string>();
    }
    if (const json* target = FindAny(j, { "target", "app", "packageName", "package_name" })) {
        rec.target = ScalarToString(*target);
    }
    if (const json* mode = FindAny(j, { "requestedMode", "requested_mode", "newMode", "new_mode" })) {
        rec.requestedMode = ScalarToString(*mode);
    }
    if (const json* reason = FindAny(j, { "reason" })) {
        rec.reason = ScalarToString(*reason);
    }
    if (const json* params = FindAny(j, { "parameters" }); params && params->is_object()) {
        for (auto it = params->begin(); it != params->end(); ++it) {
            if (it.value().is_null()) continue;
            rec.parameters[it.key()] = ScalarToString(it.value());
        }
    }
    // Legacy top-level flag
    if (const json* enabled = FindAny(j, { "enabled" })) {
        rec.parameters.emplace("enabled", ScalarToString(*enabled));
    }
    return rec;
}

bool ParseBatch(const json& doc, std::vector<ActionableRecord>& out, std::string& error)
{
    const json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object()) {
        auto it = doc.find("actionables");
        if (it != doc.end() && it->is_array()) list = &(*it);
    }

    if (!list) {
        error = "expected an array of actionables";
        return false;
    }

    out.clear();
    out.reserve(list->size());
    size_t index = 0;
    for (const auto& entry : *list) {
        out.push_back(RecordFromJson(entry, index++));
    }
    return true;
}

bool ParseBatch(const std::string& text, std::vector<ActionableRecord>& out, std::string& error)
{
    json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        error = "invalid JSON";
        return false;
    }
    return ParseBatch(doc, out, error);
}

json ResultToJson(const ExecutionResult& r)
{
    json j;
    j["id"] = r.actionableId;
    j["status"] = StatusName(r.status);
    j["detail"] = r.detail;
    j["completed_at"] = r.completedAt;
    j["type"] = r.type;
    j["target"] = r.target;
    j["tier"] = TierName(r.tier);
    return j;
}

std::optional<ExecutionResult> ResultFromJson(const json& j)
{
    if (!j.is_object()) return std::nullopt;

    auto id = j.find("id");
    auto status = j.find("status");
    auto completed = j.find("completed_at");
    if (id == j.end() || !id->is_string()) return std::nullopt;
    if (status == j.end() || !status->is_string()) return std::nullopt;
    if (completed == j.end() || !completed->is_number_unsigned()) return std::nullopt;

    auto parsedStatus = ParseStatus(status->get<std::string>());
    if (!parsedStatus) return std::nullopt;

    ExecutionResult r;
    r.actionableId = id->get<std::string>();
    r.status = *parsedStatus;
    r.completedAt = completed->get<uint64_t>();
    r.detail = j.value("detail", "");
    r.type = j.value("type", "");
    r.target = j.value("target", "");
    r.tier = ParseTier(j.value("tier", "")).value_or(CapabilityTier::Unavailable);
    return r;
}

json ResultsToJson(const std::vector<ExecutionResult>& results)
{
    json arr = json::array();
    for (const auto& r : results) arr.push_back(ResultToJson(r));
    return arr;
}

std::string DumpJson(const json& j, int indent)
{
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}
