/*
Engine registry lifecycle tests: create, update, destroy and restore.
*/
#include "test_support.hpp"

using namespace enginehost;
using namespace enginehost::testing;

static std::size_t namespaceSize(Host &h, const std::string &id)
{
	return NamespacedStore(h.datasets, id).entries("").size();
}

static int test_create_and_duplicate(void)
{
	Host h("reg_create");
	EXPECT(h.registry->create(scriptedParams("r1")) == "r1", "create returns id");
	EXPECT(h.registry->contains("r1") && h.registry->size() == 1, "registered");

	auto rec = h.metadata->get(EngineRegistry::metadataKey("r1"));
	EXPECT(rec.has_value(), "metadata persisted");
	EXPECT((*rec)["engineFactory"] == "scripted" && (*rec)["params"] == scriptedParams("r1"), "metadata holds the raw params");

	json st = h.registry->status("r1");
	EXPECT(st["state"] == "active", "active after create");
	EXPECT(st["discipline"] == "periodic", "scripted defaults to periodic");
	EXPECT(st["training"]["state"] == "idle", "training idle");
	EXPECT(st["mirror"]["enabled"] == false, "mirroring off");

	try {
		h.registry->create(scriptedParams("r1"));
		EXPECT(false, "duplicate create accepted");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::DuplicateId, "duplicate kind");
		EXPECT(e.engineId() == "r1", "duplicate names the id");
	}
	EXPECT(h.registry->size() == 1, "duplicate left registry unchanged");

	h.registry->create(kappaParams("r0"));
	json list = h.registry->list();
	EXPECT(list.size() == 2 && list[0]["engineId"] == "r0" && list[1]["engineId"] == "r1", "list sorted by id");
	EXPECT(list[0]["discipline"] == "continuous", "kappa is continuous");
	return 0;
}

static int test_concurrent_create_same_id(void)
{
	Host h("reg_race");
	std::atomic<int> created{0};
	std::atomic<int> duplicates{0};
	std::vector<std::thread> threads;
	for (int i = 0; i < 6; i++) {
		threads.emplace_back([&]() {
			try {
				h.registry->create(scaffoldParams("same"));
				created++;
			} catch (const EngineError &e) {
				if (e.kind() == ErrorKind::DuplicateId) duplicates++;
			}
		});
	}
	for (auto &t : threads) t.join();
	EXPECT(created == 1, "exactly one create wins");
	EXPECT(duplicates == 5, "the rest see DuplicateId");
	EXPECT(h.registry->size() == 1, "one instance live");
	return 0;
}

static int test_create_rollback(void)
{
	Host h("reg_rollback");
	json bad = scriptedParams("rb", true);
	bad["algorithm"] = json{{"failInit", true}};
	try {
		h.registry->create(bad);
		EXPECT(false, "failing init accepted");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::Validation, "engine validation error kept");
		EXPECT(e.field() == "algorithm.failInit", "engine field kept");
	}
	EXPECT(!h.registry->contains("rb"), "nothing registered");
	EXPECT(!h.metadata->get(EngineRegistry::metadataKey("rb")), "no metadata left");
	EXPECT(!h.mirror->isEnabled("rb"), "mirror not left open");
	EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.orchestrator->state("rb"); }), "not attached");

	json exploding = scriptedParams("rb");
	exploding["algorithm"] = json{{"throwInit", true}};
	EXPECT(throwsKind(ErrorKind::AlgorithmFailure, [&]() { h.registry->create(exploding); }), "engine exception is an algorithm failure");
	EXPECT(namespaceSize(h, "rb") == 0, "namespace empty after rollback");

	try {
		h.registry->create(json{{"engineId", "rb"}, {"engineFactory", "no.such.Engine"}});
		EXPECT(false, "unknown factory accepted");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::Validation && e.field() == "engineFactory", "unknown factory names the field");
	}
	EXPECT(throwsKind(ErrorKind::Validation, [&]() { h.registry->create(json{{"engineFactory", "scripted"}}); }), "missing id");

	h.registry->create(scriptedParams("rb"));
	EXPECT(h.registry->contains("rb"), "same id usable after failures");
	return 0;
}

static int test_update(void)
{
	Host h("reg_update");
	h.registry->create(scaffoldParams("u1"));
	h.router->input("u1", event("buy", "a", "i1"));
	h.router->input("u1", event("view", "a", "i2"));

	json next = scaffoldParams("u1", true);
	next["engineFactory"] = "com.actionml.engines.scaffold.ScaffoldEngine";
	next["algorithm"]["num"] = 3;
	h.registry->update("u1", next);
	json st = h.registry->status("u1");
	EXPECT(st["params"]["algorithm"]["num"] == 3, "new params stored");
	EXPECT(datasetCount(*h.registry, "u1") == 2, "dataset survives update");
	EXPECT(st["mirror"]["enabled"] == true, "mirroring switched on by update");
	EXPECT((*h.metadata->get(EngineRegistry::metadataKey("u1")))["params"]["algorithm"]["num"] == 3, "metadata rewritten");

	try {
		h.registry->update("u1", kappaParams("u1"));
		EXPECT(false, "factory change accepted");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::UnsupportedUpdate && e.field() == "engineFactory", "factory change refused");
	}
	EXPECT(throwsKind(ErrorKind::Validation, [&]() { h.registry->update("u1", scaffoldParams("other")); }), "id mismatch");
	EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.registry->update("ghost", scaffoldParams("ghost")); }), "unknown id");

	json flip = scaffoldParams("u1");
	flip["algorithm"]["realtimeProperties"] = true;
	EXPECT(throwsKind(ErrorKind::UnsupportedUpdate, [&]() { h.registry->update("u1", flip); }), "realtime toggle refused");
	st = h.registry->status("u1");
	EXPECT(st["state"] == "active", "active again after a refused update");
	EXPECT(st["params"]["algorithm"]["num"] == 3, "previous params still in force");
	return 0;
}

static int test_update_refused_by_engine(void)
{
	Host h("reg_locked");
	json locked = scriptedParams("l1");
	locked["algorithm"] = json{{"lockedInit", true}, {"label", "first"}};
	h.registry->create(locked);

	json change = locked;
	change["algorithm"]["label"] = "second";
	try {
		h.registry->update("l1", change);
		EXPECT(false, "locked update accepted");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::UnsupportedUpdate, "engine refusal kind");
		EXPECT(e.engineId() == "l1", "refusal tagged with the id");
	}
	EXPECT(h.router->query("l1", json::object())["label"] == "first", "engine keeps old config");
	EXPECT(h.registry->status("l1")["params"]["algorithm"]["label"] == "first", "registry keeps old params");

	h.scripted->incremental = true;
	EXPECT(throwsKind(ErrorKind::UnsupportedUpdate, [&]() { h.registry->update("l1", scriptedParams("l1")); }),
		   "discipline change refused");
	h.scripted->incremental = false;
	EXPECT(h.registry->status("l1")["discipline"] == "periodic", "discipline unchanged");
	return 0;
}

static int test_destroy(void)
{
	Host h("reg_destroy");
	EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.registry->destroy("nope"); }), "destroy unknown");

	h.registry->create(scaffoldParams("d1", true));
	h.registry->create(scaffoldParams("d2"));
	h.router->input("d1", event("buy", "a", "i1"));
	h.router->input("d1", event("buy", "b", "i1"));
	h.router->input("d2", event("buy", "c", "i1"));
	EXPECT(namespaceSize(h, "d1") > 0, "d1 has data");

	h.registry->destroy("d1");
	EXPECT(!h.registry->contains("d1"), "d1 gone");
	EXPECT(namespaceSize(h, "d1") == 0, "d1 namespace erased");
	EXPECT(!h.metadata->get(EngineRegistry::metadataKey("d1")), "d1 metadata erased");
	EXPECT(fs::exists(h.mirror->logFile("d1")), "mirror history kept");
	EXPECT(!h.mirror->isEnabled("d1"), "mirror closed");
	EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.router->input("d1", event("buy", "a", "i1")); }), "input after destroy");
	EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.router->query("d1", json::object()); }), "query after destroy");
	EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.registry->destroy("d1"); }), "second destroy");

	EXPECT(datasetCount(*h.registry, "d2") == 1, "neighbour untouched");

	h.registry->create(scaffoldParams("d1"));
	EXPECT(datasetCount(*h.registry, "d1") == 0, "recreated instance starts empty");
	return 0;
}

static int test_destroy_waits_for_training(void)
{
	Host h("reg_destroy_train");
	h.registry->create(scriptedParams("t1"));
	h.scripted->hold();
	h.router->train("t1");
	bool started = h.scripted->waitTrainEntered(1, std::chrono::milliseconds(5000));

	std::atomic<bool> done{false};
	bool blocked = false;
	bool unroutable = false;
	{
		std::vector<std::thread> remover;
		ScopedJoin join(remover, [&]() { h.scripted->release(); });
		remover.emplace_back([&]() {
			h.registry->destroy("t1");
			done = true;
		});
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
		blocked = !done;
		unroutable = !h.registry->contains("t1");
	}
	EXPECT(started, "train started");
	EXPECT(blocked, "destroy blocked by the run");
	EXPECT(unroutable, "unroutable while tearing down");
	EXPECT(done, "destroy finished");
	EXPECT(!h.metadata->get(EngineRegistry::metadataKey("t1")), "metadata erased");
	return 0;
}

static int test_mirror_location_is_fixed(void)
{
	Host h("reg_mirror_move");
	h.registry->create(scaffoldParams("m1", true));
	h.router->input("m1", event("buy", "a", "i1"));
	h.router->input("m1", event("buy", "b", "i1"));
	fs::path original = h.mirror->logFile("m1");

	json moved = scaffoldParams("m1", true);
	moved["mirrorLocation"] = (h.dir.path() / "elsewhere").string();
	moved["algorithm"]["num"] = 9;
	try {
		h.registry->update("m1", moved);
		EXPECT(false, "mirror relocation accepted");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::UnsupportedUpdate, "relocation is an unsupported update");
		EXPECT(e.field() == "mirrorLocation" && e.engineId() == "m1", "relocation names the field");
	}
	json st = h.registry->status("m1");
	EXPECT(st["state"] == "active", "active after the refusal");
	EXPECT(st["params"]["algorithm"]["num"] == 5, "previous params still in force");
	EXPECT(h.mirror->logFile("m1") == original, "log stays where it was");
	EXPECT(h.router->input("m1", event("buy", "c", "i1"))["sequence"] == 3, "numbering continues in place");

	h.registry->destroy("m1");
	EXPECT(throwsKind(ErrorKind::UnsupportedUpdate, [&]() { h.registry->create(moved); }), "re-create elsewhere refused");
	EXPECT(!h.registry->contains("m1"), "refused re-create left nothing registered");
	EXPECT(!fs::exists(h.dir.path() / "elsewhere" / "m1" / "events.jsonl"), "no second log started");

	h.registry->create(scaffoldParams("m1", true));
	EXPECT(h.router->replay("m1", "m1")["replayed"] == 3, "every accepted event replayable");
	EXPECT(h.router->input("m1", event("buy", "d", "i1"))["sequence"] == 4, "re-create continues the sequence");

	h.registry->create(scaffoldParams("m2", true));
	json fresh = scaffoldParams("m2", true);
	fresh["mirrorLocation"] = (h.dir.path() / "elsewhere").string();
	h.registry->update("m2", fresh);
	EXPECT(h.mirror->logFile("m2") == h.dir.path() / "elsewhere" / "m2" / "events.jsonl", "an empty log may move");
	EXPECT(h.router->input("m2", event("buy", "a", "i1"))["sequence"] == 1, "moved log starts at one");
	return 0;
}

static int test_id_locks_released(void)
{
	Host h("reg_id_locks");
	for (int i = 0; i < 20; i++) {
		std::string id = "ghost-" + std::to_string(i);
		EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.registry->destroy(id); }), "destroy of an unknown id");
		EXPECT(throwsKind(ErrorKind::NotFound, [&]() { h.registry->update(id, scriptedParams(id)); }), "update of an unknown id");
	}
	json bad = scriptedParams("bad");
	bad["algorithm"] = json{{"failInit", true}};
	EXPECT(throwsKind(ErrorKind::Validation, [&]() { h.registry->create(bad); }), "failed create");
	EXPECT(h.registry->lockedIds() == 0, "no locks kept for ids that never lived");

	h.registry->create(scriptedParams("kept"));
	h.registry->update("kept", scriptedParams("kept"));
	EXPECT(h.registry->lockedIds() == 0, "no lock kept between operations");
	h.registry->destroy("kept");

	std::atomic<int> duplicates{0};
	std::vector<std::thread> threads;
	{
		ScopedJoin join(threads);
		for (int i = 0; i < 4; i++) {
			threads.emplace_back([&]() {
				try {
					h.registry->create(scriptedParams("raced"));
				} catch (const EngineError &e) {
					if (e.kind() == ErrorKind::DuplicateId) duplicates++;
				}
			});
		}
	}
	EXPECT(h.registry->contains("raced") && duplicates == 3, "one racer created the engine");
	EXPECT(h.registry->lockedIds() == 0, "racing creates release their lock");
	return 0;
}

static int test_restore(void)
{
	Host h("reg_restore");
	h.registry->create(scaffoldParams("s1", true));
	h.registry->create(kappaParams("k1"));
	for (int i = 0; i < 4; i++) h.router->input("s1", event("buy", "u" + std::to_string(i), "i1"));
	h.router->input("k1", event("buy", "u", "i7"));
	h.router->train("s1");
	EXPECT(h.orchestrator->waitUntilSettled("s1", std::chrono::milliseconds(5000)), "trained");

	h.reopen();
	EXPECT(h.registry->size() == 0, "nothing live before restore");
	json report = h.registry->restoreAll();
	EXPECT(report["restored"].size() == 2, "both restored");
	EXPECT(report["failed"].empty(), "no failures");
	EXPECT(h.registry->restoreReport() == report, "report kept");

	EXPECT(datasetCount(*h.registry, "s1") == 4, "scaffold dataset survives restart");
	EXPECT(h.registry->status("s1")["engine"]["model"]["trained"] == true, "scaffold model survives restart");
	EXPECT(h.router->query("k1", json{{"item", "i7"}})["score"] == 2.0, "kappa scores survive restart");
	EXPECT(h.mirror->isEnabled("s1"), "mirroring resumed");
	EXPECT(h.router->input("s1", event("buy", "u9", "i1"))["sequence"] == 5, "mirror numbering continues");
	return 0;
}

static int test_restore_reports_bad_records(void)
{
	Host h("reg_restore_bad");
	h.registry->create(scaffoldParams("good"));
	h.metadata->put(EngineRegistry::metadataKey("gone"),
					json{{"engineId", "gone"}, {"params", json{{"engineId", "gone"}, {"engineFactory", "retired.Engine"}}}});
	h.metadata->put(EngineRegistry::metadataKey("odd"),
					json{{"engineId", "odd"}, {"params", json{{"engineId", "other"}, {"engineFactory", "scripted"}}}});
	h.metadata->put(EngineRegistry::metadataKey("empty"), json{{"engineId", "empty"}});
	h.metadata->flush();

	h.reopen();
	json report = h.registry->restoreAll();
	EXPECT(report["restored"] == json::array({"good"}), "good record restored");
	EXPECT(report["failed"].size() == 3, "three failures reported");
	for (const auto &f : report["failed"]) {
		std::string id = f["engineId"].get<std::string>();
		if (id == "gone") EXPECT(f["kind"] == "validation-error", "unknown factory reported as validation");
		if (id == "odd") EXPECT(f["kind"] == "storage-failure", "mismatched key reported as storage failure");
		if (id == "empty") EXPECT(f["kind"] == "storage-failure", "missing params reported as storage failure");
	}
	EXPECT(h.registry->contains("good") && !h.registry->contains("gone"), "failures do not block others");
	EXPECT(h.metadata->get(EngineRegistry::metadataKey("gone")).has_value(), "failed record kept for inspection");
	return 0;
}

static int test_isolation(void)
{
	Host h("reg_isolation");
	h.registry->create(scriptedParams("a"));
	h.registry->create(scriptedParams("b"));
	h.router->input("a", event("buy", "x", "i1"));
	h.router->input("a", event("buy", "y", "i1"));
	EXPECT(datasetCount(*h.registry, "a") == 2, "a counted");
	EXPECT(datasetCount(*h.registry, "b") == 0, "b untouched");

	h.router->train("a");
	EXPECT(h.orchestrator->waitUntilSettled("a", std::chrono::milliseconds(5000)), "a trained");
	EXPECT(h.router->query("a", json::object())["model"] == 1, "a has a model");
	EXPECT(h.router->query("b", json::object())["model"] == 0, "b has none");
	return 0;
}

int main(void)
{
	if (test_create_and_duplicate() != 0) return 1;
	if (test_concurrent_create_same_id() != 0) return 1;
	if (test_create_rollback() != 0) return 1;
	if (test_update() != 0) return 1;
	if (test_update_refused_by_engine() != 0) return 1;
	if (test_destroy() != 0) return 1;
	if (test_destroy_waits_for_training() != 0) return 1;
	if (test_mirror_location_is_fixed() != 0) return 1;
	if (test_id_locks_released() != 0) return 1;
	if (test_restore() != 0) return 1;
	if (test_restore_reports_bad_records() != 0) return 1;
	if (test_isolation() != 0) return 1;
	return 0;
}
