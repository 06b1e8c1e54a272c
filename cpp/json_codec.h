#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "config.h"
#include "engine.h"
#include "types.h"

namespace txguard {

// Request body. Throws InvalidTransaction on missing or mistyped fields.
Transaction transaction_from_json(const nlohmann::json& j);

nlohmann::json to_json(const FeatureVector& f);
nlohmann::json to_json(const RuleHit& h);
nlohmann::json to_json(const Verdict& v);
nlohmann::json to_json(const EngineConfig& c);

// Missing keys keep their defaults; mistyped values throw ConfigError.
// The result is validated.
EngineConfig config_from_json(const nlohmann::json& j);
EngineConfig load_config_file(const std::string& path);

// Decides one input line and returns the document to print for it: the
// verdict, or {"line", "error", "detail"[, "transaction_id"]} when the line
// is not a valid transaction.
nlohmann::json process_line(DecisionEngine& engine, const std::string& line, std::size_t lineno);

} // namespace txguard
