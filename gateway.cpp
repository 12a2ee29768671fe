#include "gateway.hpp"

#include <iostream>
#include <regex>

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>

namespace enginehost {

json fromJsoncpp(const Json::Value &v) {
	switch (v.type()) {
	case Json::nullValue: return nullptr;
	case Json::intValue: return (int64_t)v.asInt64();
	case Json::uintValue: return (uint64_t)v.asUInt64();
	case Json::realValue: return v.asDouble();
	case Json::stringValue: return v.asString();
	case Json::booleanValue: return v.asBool();
	case Json::arrayValue: {
		json out = json::array();
		for (const auto &item : v) out.push_back(fromJsoncpp(item));
		return out;
	}
	case Json::objectValue: {
		json out = json::object();
		for (auto it = v.begin(); it != v.end(); ++it) {
			out[it.name()] = fromJsoncpp(*it);
		}
		return out;
	}
	default:
		return nullptr;
	}
}

Json::Value toJsoncpp(const json &v) {
	if (v.is_null()) return Json::Value();
	if (v.is_boolean()) return Json::Value(v.get<bool>());
	if (v.is_number_integer()) return Json::Value((Json::Int64)v.get<long long>());
	if (v.is_number_unsigned()) return Json::Value((Json::UInt64)v.get<unsigned long long>());
	if (v.is_number_float()) return Json::Value(v.get<double>());
	if (v.is_string()) return Json::Value(v.get<std::string>());
	if (v.is_array()) {
		Json::Value arr(Json::arrayValue);
		for (const auto &item : v) arr.append(toJsoncpp(item));
		return arr;
	}
	if (v.is_object()) {
		Json::Value obj(Json::objectValue);
		for (auto it = v.begin(); it != v.end(); ++it) obj[it.key()] = toJsoncpp(it.value());
		return obj;
	}
	return Json::Value();
}

drogon::HttpStatusCode statusFor(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::Validation: return drogon::k400BadRequest;
	case ErrorKind::NotFound: return drogon::k404NotFound;
	case ErrorKind::DuplicateId:
	case ErrorKind::UnsupportedUpdate:
	case ErrorKind::AlreadyTraining: return drogon::k409Conflict;
	case ErrorKind::StorageFailure: return drogon::k503ServiceUnavailable;
	case ErrorKind::AlgorithmFailure: return drogon::k500InternalServerError;
	}
	return drogon::k500InternalServerError;
}

thread_local GatewayServer::AuthError GatewayServer::lastAuthError_{};
thread_local bool GatewayServer::hasAuthError_ = false;

GatewayServer::GatewayServer(std::shared_ptr<EngineRegistry> registry, std::shared_ptr<Router> router,
							 std::shared_ptr<EngineCatalog> catalog, std::shared_ptr<ClusterCoordinator> cluster, const Config &config)
	: registry_(std::move(registry)), router_(std::move(router)), catalog_(std::move(catalog)), cluster_(std::move(cluster)),
	  config_(config) {
	startedAt_ = std::chrono::steady_clock::now();
	if (!config_.authEnabled) std::cout << "[Gateway] authentication disabled" << std::endl;
	setupRoutes();
}

void GatewayServer::listen() {
	std::cout << "[Gateway] listening on " << config_.host << ":" << config_.port << std::endl;
	drogon::app().addListener(config_.host, (uint16_t)config_.port);
	drogon::app().run();
}

json GatewayServer::parseRequestBody(const drogon::HttpRequestPtr &req) const {
	auto payload = req->getJsonObject();
	if (payload) return fromJsoncpp(*payload);
	auto body = req->getBody();
	if (body.empty()) return json::object();
	json parsed = json::parse(body.begin(), body.end(), nullptr, false);
	if (parsed.is_discarded()) throw validationError("", "request body is not valid JSON");
	return parsed;
}

bool GatewayServer::authOK(const drogon::HttpRequestPtr &req) {
	hasAuthError_ = false;
	if (!config_.authEnabled) return true;
	if (req->method() == drogon::Options) return true;
	if (req->path() == "/system/status") return true;
	auto auth = req->getHeader("authorization");
	std::string token;
	static const std::regex bearer("^Bearer\\s+(.+)$", std::regex::icase);
	std::smatch m;
	if (std::regex_match(auth, m, bearer) && m.size() >= 2) token = m[1].str();
	if (token.empty()) {
		lastAuthError_ = {"unauthorized", "", drogon::k401Unauthorized};
		hasAuthError_ = true;
		return false;
	}
	try {
		auto dec = jwt::decode<jwt::traits::nlohmann_json>(token);
		jwt::verify<jwt::traits::nlohmann_json>()
			.allow_algorithm(jwt::algorithm::hs256{config_.jwtSecret})
			.verify(dec);
		return true;
	} catch (const std::exception &e) {
		lastAuthError_ = {"invalid-token", e.what(), drogon::k401Unauthorized};
		hasAuthError_ = true;
		return false;
	}
}

void GatewayServer::respondJson(const Callback &cb, const json &j, drogon::HttpStatusCode code) {
	auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(j));
	resp->setStatusCode(code);
	cb(resp);
}

void GatewayServer::unauthorized(const Callback &cb) {
	if (hasAuthError_) {
		json payload{{"ok", false}, {"error", lastAuthError_.error}};
		if (!lastAuthError_.message.empty()) payload["message"] = lastAuthError_.message;
		respondJson(cb, payload, lastAuthError_.code);
		return;
	}
	respondJson(cb, json{{"ok", false}, {"error", "unauthorized"}}, drogon::k401Unauthorized);
}

void GatewayServer::handle(const drogon::HttpRequestPtr &req, Callback &&cb, const std::function<json()> &fn,
						   drogon::HttpStatusCode okCode) {
	if (!authOK(req)) return unauthorized(cb);
	try {
		json result = fn();
		respondJson(cb, json{{"ok", true}, {"result", result}}, okCode);
	} catch (const EngineError &e) {
		if (e.kind() == ErrorKind::StorageFailure || e.kind() == ErrorKind::AlgorithmFailure) {
			std::cerr << "[Gateway] " << req->methodString() << " " << req->path() << ": " << e.what() << std::endl;
		}
		respondJson(cb, e.toJson(), statusFor(e.kind()));
	} catch (const std::exception &e) {
		std::cerr << "[Gateway] " << req->methodString() << " " << req->path() << ": " << e.what() << std::endl;
		respondJson(cb, json{{"ok", false}, {"error", "internal-error"}, {"message", "internal error"}},
					drogon::k500InternalServerError);
	}
}

json GatewayServer::systemStatus() const {
	auto uptime = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt_).count();
	return json{{"uptimeSeconds", uptime},
				{"engines", registry_->size()},
				{"engineTypes", catalog_->list()},
				{"restore", registry_->restoreReport()},
				{"store", config_.storeBackend},
				{"mirrorRoot", config_.mirrorRoot.string()},
				{"cluster", cluster_ ? cluster_->status() : json{{"enabled", false}}}};
}

void GatewayServer::setupRoutes() {
	auto &app = drogon::app();

	app.registerHandler("/system/status", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		handle(req, std::move(cb), [this]() { return systemStatus(); });
	}, {drogon::Get});

	app.registerHandler("/engines", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		handle(req, std::move(cb), [this]() { return registry_->list(); });
	}, {drogon::Get});

	app.registerHandler("/engines", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		handle(req, std::move(cb), [this, req]() {
			std::string id = registry_->create(parseRequestBody(req));
			return json{{"engineId", id}};
		}, drogon::k201Created);
	}, {drogon::Post});

	app.registerHandler("/engines/{1}", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, id]() { return registry_->status(id); });
	}, {drogon::Get});

	app.registerHandler("/engines/{1}", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, req, id]() {
			registry_->update(id, parseRequestBody(req));
			return json{{"engineId", id}, {"updated", true}};
		});
	}, {drogon::Post});

	app.registerHandler("/engines/{1}", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, id]() {
			registry_->destroy(id);
			return json{{"engineId", id}, {"destroyed", true}};
		});
	}, {drogon::Delete});

	app.registerHandler("/engines/{1}/events", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, req, id]() { return router_->input(id, parseRequestBody(req)); }, drogon::k201Created);
	}, {drogon::Post});

	app.registerHandler("/engines/{1}/queries", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, req, id]() { return router_->query(id, parseRequestBody(req)); });
	}, {drogon::Post});

	app.registerHandler("/engines/{1}/train", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, id]() { return router_->train(id); }, drogon::k202Accepted);
	}, {drogon::Post});

	app.registerHandler("/engines/{1}/replay", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, req, id]() {
			json body = parseRequestBody(req);
			std::string source = id;
			if (body.is_object() && body.contains("source")) {
				if (!body["source"].is_string()) throw validationError("source", "\"source\" must be an engine id");
				source = body["source"].get<std::string>();
			}
			return router_->replay(source, id);
		});
	}, {drogon::Post});

	app.registerHandler("/engines/{1}/mirror", [this](const drogon::HttpRequestPtr &req, Callback &&cb, const std::string &id) {
		handle(req, std::move(cb), [this, id]() { return router_->mirrorReport(id); });
	}, {drogon::Get});
}

} // namespace enginehost
