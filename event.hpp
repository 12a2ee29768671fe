#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace enginehost {

using json = nlohmann::json;

struct Event {
	std::string entityType;
	std::string entityId;
	std::string event;
	std::optional<std::string> targetEntityType;
	std::optional<std::string> targetEntityId;
	json properties = json::object();
	int64_t eventTime{0};
	int64_t creationTime{0};

	// `$set`, `$unset`, `$delete` and any other name starting with '$'.
	bool isReserved() const { return !event.empty() && event[0] == '$'; }

	// Validates and builds an event; creationTime is stamped with `acceptedAt`.
	static Event fromJson(const json &body, int64_t acceptedAt);

	// Rebuilds an event read back from storage; keeps the stored creationTime.
	static Event fromStored(const json &body);

	json toJson() const;
};

} // namespace enginehost
