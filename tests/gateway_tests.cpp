/*
Gateway helpers and command line configuration tests.
*/
#include "test_support.hpp"

#include "config.hpp"
#include "gateway.hpp"

using namespace enginehost;
using namespace enginehost::testing;

static int test_status_mapping(void)
{
	EXPECT(statusFor(ErrorKind::Validation) == drogon::k400BadRequest, "validation is 400");
	EXPECT(statusFor(ErrorKind::NotFound) == drogon::k404NotFound, "not found is 404");
	EXPECT(statusFor(ErrorKind::DuplicateId) == drogon::k409Conflict, "duplicate is 409");
	EXPECT(statusFor(ErrorKind::UnsupportedUpdate) == drogon::k409Conflict, "unsupported update is 409");
	EXPECT(statusFor(ErrorKind::AlreadyTraining) == drogon::k409Conflict, "already training is 409");
	EXPECT(statusFor(ErrorKind::StorageFailure) == drogon::k503ServiceUnavailable, "storage is 503");
	EXPECT(statusFor(ErrorKind::AlgorithmFailure) == drogon::k500InternalServerError, "algorithm is 500");

	json body = EngineError(ErrorKind::DuplicateId, "engine already exists: a", "engineId", "a").toJson();
	EXPECT(body["ok"] == false && body["error"] == "duplicate-id", "error body kind");
	EXPECT(body["field"] == "engineId" && body["engineId"] == "a", "error body names field and id");
	return 0;
}

static int test_jsoncpp_bridge(void)
{
	json doc{{"engineId", "reco-1"},
			 {"mirrorType", nullptr},
			 {"algorithm", {{"num", 5}, {"ratio", 0.25}, {"flag", true}, {"eventNames", {"buy", "view"}}}},
			 {"offset", -3}};
	Json::Value converted = toJsoncpp(doc);
	EXPECT(converted.isObject(), "object converted");
	EXPECT(converted["engineId"].asString() == "reco-1", "string member");
	EXPECT(converted["mirrorType"].isNull(), "null member");
	EXPECT(converted["algorithm"]["num"].asInt() == 5, "integer member");
	EXPECT(converted["algorithm"]["eventNames"].size() == 2, "array member");
	EXPECT(converted["offset"].asInt() == -3, "negative integer");

	json back = fromJsoncpp(converted);
	EXPECT(back["algorithm"]["ratio"] == 0.25 && back["algorithm"]["flag"] == true, "float and bool back");
	EXPECT(back["algorithm"]["eventNames"] == json::array({"buy", "view"}), "array back");
	EXPECT(back["offset"] == -3 && back["mirrorType"].is_null(), "sign and null back");
	return 0;
}

static int test_command_line(void)
{
	std::vector<std::string> args{"enginehost_server", "--store=json", "--port=8123", "--train-workers=3",
								  "--engines=scaffold, kappa", "--auth=off", "--redis-lock-ttl-ms=10", "positional"};
	std::vector<char *> argv;
	for (auto &a : args) argv.push_back(&a[0]);

	auto parsed = parseArgs((int)argv.size(), argv.data());
	EXPECT(parsed.count("positional") == 0, "positional arguments ignored");
	EXPECT(parsed["store"] == "json", "key=value parsed");

	Config c = loadConfig((int)argv.size(), argv.data());
	EXPECT(c.storeBackend == "json", "store backend");
	EXPECT(c.port == 8123, "port");
	EXPECT(c.trainWorkers == 3, "train workers");
	EXPECT(c.enabledEngines == std::vector<std::string>({"scaffold", "kappa"}), "engine list trimmed");
	EXPECT(!c.authEnabled, "auth switched off");
	EXPECT(c.redisLockTtlMs == 1000, "lock ttl floor");
	EXPECT(c.mirrorRoot == c.baseDir / "mirrors", "mirror root defaults under base dir");
	return 0;
}

int main(void)
{
	if (test_status_mapping() != 0) return 1;
	if (test_jsoncpp_bridge() != 0) return 1;
	if (test_command_line() != 0) return 1;
	return 0;
}
