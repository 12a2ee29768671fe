#include "params.hpp"

#include <cctype>
#include <cstdint>
#include <limits>

#include "errors.hpp"

namespace enginehost {
namespace params {

const std::vector<std::string> kRequiredTopLevel = {"engineId", "engineFactory"};

namespace {

std::string qualified(const std::string &path, const std::string &key) {
	return path.empty() ? key : path + "." + key;
}

const char *typeName(const json &v) {
	return v.type_name();
}

} // namespace

json parse(const std::string &text) {
	json raw = json::parse(text, nullptr, false);
	if (raw.is_discarded()) throw validationError("", "parameters are not valid JSON");
	return raw;
}

bool isValidEngineId(const std::string &id) {
	if (id.empty() || id.size() > 128) return false;
	if (id == "." || id == "..") return false;
	for (unsigned char c : id) {
		if (!std::isalnum(c) && c != '_' && c != '-' && c != '.') return false;
	}
	return true;
}

EngineParams parseAndValidate(const std::string &text, const std::vector<std::string> &requiredKeys) {
	return parseAndValidate(parse(text), requiredKeys);
}

EngineParams parseAndValidate(const json &raw, const std::vector<std::string> &requiredKeys) {
	if (!raw.is_object()) throw validationError("", "parameters must be a JSON object");
	for (const auto &key : requiredKeys) {
		if (!raw.contains(key) || raw[key].is_null()) {
			throw validationError(key, "missing required parameter \"" + key + "\"");
		}
	}

	EngineParams out;
	out.raw = raw;
	if (auto id = optString(raw, "engineId")) {
		if (!isValidEngineId(*id)) {
			throw validationError("engineId", "engineId must be 1-128 characters of [A-Za-z0-9_.-]: \"" + *id + "\"");
		}
		out.engineId = *id;
	}
	if (auto factory = optString(raw, "engineFactory")) {
		if (factory->empty()) throw validationError("engineFactory", "engineFactory must not be empty");
		out.engineFactory = *factory;
	}

	auto mirrorType = optString(raw, "mirrorType");
	if (mirrorType && !mirrorType->empty()) {
		if (*mirrorType != "localfs" && *mirrorType != "file") {
			throw validationError("mirrorType", "unsupported mirrorType \"" + *mirrorType + "\", use \"localfs\" or \"file\"");
		}
		out.mirrorType = *mirrorType;
	}
	if (auto location = optString(raw, "mirrorLocation")) out.mirrorLocation = *location;
	return out;
}

json section(const json &raw, const std::string &key) {
	if (!raw.is_object() || !raw.contains(key) || raw[key].is_null()) return json::object();
	const auto &v = raw[key];
	if (!v.is_object()) throw validationError(key, "\"" + key + "\" must be an object, got " + typeName(v));
	return v;
}

std::string requireString(const json &obj, const std::string &key, const std::string &path) {
	auto v = optString(obj, key, path);
	if (!v) throw validationError(qualified(path, key), "missing required parameter \"" + qualified(path, key) + "\"");
	return *v;
}

std::optional<std::string> optString(const json &obj, const std::string &key, const std::string &path) {
	if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return std::nullopt;
	const auto &v = obj[key];
	if (!v.is_string()) {
		throw validationError(qualified(path, key), "\"" + qualified(path, key) + "\" must be a string, got " + typeName(v));
	}
	return v.get<std::string>();
}

int intOr(const json &obj, const std::string &key, int fallback, const std::string &path) {
	if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return fallback;
	const auto &v = obj[key];
	if (!v.is_number_integer()) {
		throw validationError(qualified(path, key), "\"" + qualified(path, key) + "\" must be an integer, got " + typeName(v));
	}
	bool inRange = v.is_number_unsigned() ? v.get<uint64_t>() <= (uint64_t)std::numeric_limits<int>::max()
										   : v.get<int64_t>() >= std::numeric_limits<int>::min() &&
												 v.get<int64_t>() <= std::numeric_limits<int>::max();
	if (!inRange) {
		throw validationError(qualified(path, key), "\"" + qualified(path, key) + "\" is out of range: " + v.dump());
	}
	return (int)v.get<int64_t>();
}

double doubleOr(const json &obj, const std::string &key, double fallback, const std::string &path) {
	if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return fallback;
	const auto &v = obj[key];
	if (!v.is_number()) {
		throw validationError(qualified(path, key), "\"" + qualified(path, key) + "\" must be a number, got " + typeName(v));
	}
	return v.get<double>();
}

bool boolOr(const json &obj, const std::string &key, bool fallback, const std::string &path) {
	if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return fallback;
	const auto &v = obj[key];
	if (!v.is_boolean()) {
		throw validationError(qualified(path, key), "\"" + qualified(path, key) + "\" must be a boolean, got " + typeName(v));
	}
	return v.get<bool>();
}

std::optional<std::vector<std::string>> optStringList(const json &obj, const std::string &key, const std::string &path) {
	if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) return std::nullopt;
	const auto &v = obj[key];
	if (!v.is_array()) {
		throw validationError(qualified(path, key), "\"" + qualified(path, key) + "\" must be an array of strings");
	}
	std::vector<std::string> out;
	for (const auto &item : v) {
		if (!item.is_string()) {
			throw validationError(qualified(path, key), "\"" + qualified(path, key) + "\" must be an array of strings");
		}
		out.push_back(item.get<std::string>());
	}
	return out;
}

} // namespace params
} // namespace enginehost
