#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <drogon/drogon.h>
#include <nlohmann/json.hpp>

#include "cluster.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "registry.hpp"
#include "router.hpp"

namespace enginehost {

using json = nlohmann::json;

json fromJsoncpp(const Json::Value &v);
Json::Value toJsoncpp(const json &v);

drogon::HttpStatusCode statusFor(ErrorKind kind);

// REST surface over Router and EngineRegistry. Owns the listener; the core
// never sees a request object.
class GatewayServer {
public:
	GatewayServer(std::shared_ptr<EngineRegistry> registry, std::shared_ptr<Router> router,
				  std::shared_ptr<EngineCatalog> catalog, std::shared_ptr<ClusterCoordinator> cluster, const Config &config);

	// Blocks until drogon's event loop quits.
	void listen();

private:
	using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

	void setupRoutes();

	// Runs fn and turns its value or its EngineError into the response body.
	void handle(const drogon::HttpRequestPtr &req, Callback &&cb, const std::function<json()> &fn,
				drogon::HttpStatusCode okCode = drogon::k200OK);

	json parseRequestBody(const drogon::HttpRequestPtr &req) const;
	bool authOK(const drogon::HttpRequestPtr &req);
	json systemStatus() const;

	void respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code = drogon::k200OK);
	void unauthorized(const Callback &cb);

	std::shared_ptr<EngineRegistry> registry_;
	std::shared_ptr<Router> router_;
	std::shared_ptr<EngineCatalog> catalog_;
	std::shared_ptr<ClusterCoordinator> cluster_;
	Config config_;
	std::chrono::steady_clock::time_point startedAt_;

	struct AuthError {
		std::string error;
		std::string message;
		drogon::HttpStatusCode code{drogon::k401Unauthorized};
	};
	static thread_local AuthError lastAuthError_;
	static thread_local bool hasAuthError_;
};

} // namespace enginehost
