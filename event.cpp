#include "event.hpp"

#include "errors.hpp"
#include "params.hpp"
#include "util.hpp"

namespace enginehost {

namespace {

std::string requireNonEmpty(const json &body, const std::string &key) {
	auto v = params::requireString(body, key);
	if (v.empty()) throw validationError(key, "\"" + key + "\" must not be empty");
	return v;
}

int64_t timeField(const json &body, const std::string &key, int64_t fallback) {
	auto text = params::optString(body, key);
	if (!text) return fallback;
	auto parsed = parseIsoTime(*text);
	if (!parsed) throw validationError(key, "\"" + key + "\" is not an ISO-8601 timestamp: \"" + *text + "\"");
	return *parsed;
}

} // namespace

Event Event::fromJson(const json &body, int64_t acceptedAt) {
	if (!body.is_object()) throw validationError("", "event must be a JSON object");

	Event ev;
	ev.entityType = requireNonEmpty(body, "entityType");
	ev.entityId = requireNonEmpty(body, "entityId");
	ev.event = requireNonEmpty(body, "event");
	ev.targetEntityType = params::optString(body, "targetEntityType");
	ev.targetEntityId = params::optString(body, "targetEntityId");
	if (ev.targetEntityType.has_value() != ev.targetEntityId.has_value()) {
		const char *missing = ev.targetEntityType ? "targetEntityId" : "targetEntityType";
		throw validationError(missing, std::string("\"") + missing + "\" is required when the other target field is set");
	}

	if (body.contains("properties") && !body["properties"].is_null()) {
		if (!body["properties"].is_object()) throw validationError("properties", "\"properties\" must be an object");
		ev.properties = body["properties"];
	}

	ev.eventTime = timeField(body, "eventTime", acceptedAt);
	ev.creationTime = acceptedAt;
	return ev;
}

Event Event::fromStored(const json &body) {
	Event ev = fromJson(body, nowEpochMs());
	ev.creationTime = timeField(body, "creationTime", ev.creationTime);
	return ev;
}

json Event::toJson() const {
	json out{{"entityType", entityType}, {"entityId", entityId}, {"event", event}};
	if (targetEntityType) out["targetEntityType"] = *targetEntityType;
	if (targetEntityId) out["targetEntityId"] = *targetEntityId;
	if (!properties.empty()) out["properties"] = properties;
	out["eventTime"] = formatIso(eventTime);
	out["creationTime"] = formatIso(creationTime);
	return out;
}

} // namespace enginehost
