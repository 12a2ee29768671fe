#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace enginehost {

using json = nlohmann::json;

// The part of an engine's parameter document the core itself understands.
// Everything else stays in `raw` for the engine and its collaborators.
struct EngineParams {
	std::string engineId;
	std::string engineFactory;
	std::string mirrorType;
	std::string mirrorLocation;
	json raw = json::object();

	bool mirroring() const { return !mirrorType.empty(); }
};

namespace params {

extern const std::vector<std::string> kRequiredTopLevel;

json parse(const std::string &text);

// Fails on the first missing or malformed key with a ValidationError naming it.
// Unknown keys are ignored.
EngineParams parseAndValidate(const json &raw, const std::vector<std::string> &requiredKeys = kRequiredTopLevel);
EngineParams parseAndValidate(const std::string &text, const std::vector<std::string> &requiredKeys = kRequiredTopLevel);

bool isValidEngineId(const std::string &id);

// Sub-tree under key, or an empty object when absent. Non-object values are a ValidationError.
json section(const json &raw, const std::string &key);

// Readers over one component's sub-tree. `path` prefixes the key in error messages
// ("algorithm" + "num" -> "algorithm.num").
std::string requireString(const json &obj, const std::string &key, const std::string &path = "");
std::optional<std::string> optString(const json &obj, const std::string &key, const std::string &path = "");
int intOr(const json &obj, const std::string &key, int fallback, const std::string &path = "");
double doubleOr(const json &obj, const std::string &key, double fallback, const std::string &path = "");
bool boolOr(const json &obj, const std::string &key, bool fallback, const std::string &path = "");
std::optional<std::vector<std::string>> optStringList(const json &obj, const std::string &key, const std::string &path = "");

} // namespace params

} // namespace enginehost
