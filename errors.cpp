#include "errors.hpp"

namespace enginehost {

const char *errorKindName(ErrorKind kind) {
	switch (kind) {
	case ErrorKind::Validation: return "validation-error";
	case ErrorKind::NotFound: return "not-found";
	case ErrorKind::DuplicateId: return "duplicate-id";
	case ErrorKind::UnsupportedUpdate: return "unsupported-update";
	case ErrorKind::AlreadyTraining: return "already-training";
	case ErrorKind::StorageFailure: return "storage-failure";
	case ErrorKind::AlgorithmFailure: return "algorithm-failure";
	}
	return "internal-error";
}

EngineError EngineError::withEngine(const std::string &engineId) const {
	if (!engineId_.empty() || engineId.empty()) return *this;
	return EngineError(kind_, what(), field_, engineId);
}

json EngineError::toJson() const {
	json out{{"ok", false}, {"error", errorKindName(kind_)}, {"message", what()}};
	if (!field_.empty()) out["field"] = field_;
	if (!engineId_.empty()) out["engineId"] = engineId_;
	return out;
}

} // namespace enginehost
