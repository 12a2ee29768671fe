#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine.hpp"

namespace enginehost {

using json = nlohmann::json;

// Lambda-style engine: indicator events accumulate in the Dataset and an
// explicit train() ranks items by how often the first indicator targets them.
// With algorithm.realtimeProperties the engine also takes $set/$unset/$delete
// on items between runs, which makes it Mixed.
class ScaffoldEngine : public Engine {
public:
	static constexpr const char *kType = "scaffold";

	explicit ScaffoldEngine(EngineContext ctx);

	void init(const json &params) override;
	Capabilities capabilities() const override;
	void validateEvent(const Event &event) const override;
	json input(const Event &event) override;
	json applyIncremental(const Event &event) override;
	json train() override;
	json query(const json &query) override;
	void destroy() override;
	json status() const override;

private:
	struct Settings {
		std::vector<std::string> indicators;
		int num{20};
		bool realtimeProperties{false};
	};

	static Settings parseSettings(const json &params);
	bool isIndicator(const Settings &settings, const std::string &name) const;

	EngineContext ctx_;
	mutable std::mutex mu_;
	Settings settings_;
	bool initialized_{false};
	uint64_t eventCount_{0};
	std::shared_ptr<const json> model_;
};

} // namespace enginehost
