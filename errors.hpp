#pragma once

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace enginehost {

using json = nlohmann::json;

enum class ErrorKind {
	Validation,
	NotFound,
	DuplicateId,
	UnsupportedUpdate,
	AlreadyTraining,
	StorageFailure,
	AlgorithmFailure
};

const char *errorKindName(ErrorKind kind);

class EngineError : public std::runtime_error {
public:
	EngineError(ErrorKind kind, const std::string &message, std::string field = "", std::string engineId = "")
		: std::runtime_error(message), kind_(kind), field_(std::move(field)), engineId_(std::move(engineId)) {}

	ErrorKind kind() const { return kind_; }
	const std::string &field() const { return field_; }
	const std::string &engineId() const { return engineId_; }

	// Copy with the engine id filled in, keeps an existing one.
	EngineError withEngine(const std::string &engineId) const;

	json toJson() const;

private:
	ErrorKind kind_;
	std::string field_;
	std::string engineId_;
};

inline EngineError validationError(const std::string &field, const std::string &message) {
	return EngineError(ErrorKind::Validation, message, field);
}

inline EngineError notFound(const std::string &engineId) {
	return EngineError(ErrorKind::NotFound, "engine not found: " + engineId, "engineId", engineId);
}

inline EngineError storageFailure(const std::string &message, const std::string &engineId = "") {
	return EngineError(ErrorKind::StorageFailure, message, "", engineId);
}

// Runs an engine call and rethrows anything that is not already an EngineError
// as AlgorithmFailure tagged with the instance and the operation name.
template <typename Fn>
auto guardAlgorithm(const std::string &engineId, const char *operation, Fn &&fn) -> decltype(fn()) {
	try {
		return fn();
	} catch (const EngineError &e) {
		throw e.withEngine(engineId);
	} catch (const std::exception &e) {
		throw EngineError(ErrorKind::AlgorithmFailure,
						  std::string(operation) + " failed: " + e.what(), "", engineId);
	} catch (...) {
		throw EngineError(ErrorKind::AlgorithmFailure,
						  std::string(operation) + " failed with a non-standard exception", "", engineId);
	}
}

} // namespace enginehost
