/*
Parameter parsing and validation tests.
*/
#include "test_support.hpp"

using namespace enginehost;
using namespace enginehost::testing;

static int test_required_top_level(void)
{
	EngineError err(ErrorKind::Validation, "");
	try {
		params::parseAndValidate(json{{"engineFactory", "scaffold"}});
		EXPECT(false, "missing engineId accepted");
	} catch (const EngineError &e) {
		err = e;
	}
	EXPECT(err.kind() == ErrorKind::Validation, "missing engineId kind");
	EXPECT(err.field() == "engineId", "missing engineId field");

	try {
		params::parseAndValidate(json{{"engineId", "a"}});
		EXPECT(false, "missing engineFactory accepted");
	} catch (const EngineError &e) {
		EXPECT(e.field() == "engineFactory", "missing engineFactory field");
	}

	EXPECT(throwsKind(ErrorKind::Validation, []() { params::parseAndValidate(json::array()); }), "array root rejected");
	EXPECT(throwsKind(ErrorKind::Validation, []() { params::parseAndValidate(std::string("{not json")); }), "bad text rejected");
	return 0;
}

static int test_typed_top_level(void)
{
	json raw{{"engineId", "reco-1"},
			 {"engineFactory", "scaffold"},
			 {"mirrorType", "localfs"},
			 {"mirrorLocation", "/tmp/mirrors"},
			 {"algorithm", {{"num", 4}}},
			 {"somethingElse", {1, 2, 3}}};
	EngineParams p = params::parseAndValidate(raw);
	EXPECT(p.engineId == "reco-1", "engineId");
	EXPECT(p.engineFactory == "scaffold", "engineFactory");
	EXPECT(p.mirroring(), "mirroring on");
	EXPECT(p.mirrorLocation == "/tmp/mirrors", "mirrorLocation");
	EXPECT(p.raw == raw, "raw document kept untouched");

	json plain{{"engineId", "x"}, {"engineFactory", "kappa"}};
	EXPECT(!params::parseAndValidate(plain).mirroring(), "mirroring off by default");
	return 0;
}

static int test_engine_id_rules(void)
{
	EXPECT(params::isValidEngineId("reco-1"), "dash id");
	EXPECT(params::isValidEngineId("a.b_c"), "dot underscore id");
	EXPECT(!params::isValidEngineId(""), "empty id");
	EXPECT(!params::isValidEngineId(".."), "dotdot id");
	EXPECT(!params::isValidEngineId("a/b"), "slash id");
	EXPECT(!params::isValidEngineId("a:b"), "colon id");
	EXPECT(!params::isValidEngineId(std::string(129, 'a')), "long id");
	EXPECT(params::isValidEngineId(std::string(128, 'a')), "128 char id");

	try {
		params::parseAndValidate(json{{"engineId", "bad id"}, {"engineFactory", "x"}});
		EXPECT(false, "space in id accepted");
	} catch (const EngineError &e) {
		EXPECT(e.field() == "engineId", "bad id field");
	}
	try {
		params::parseAndValidate(json{{"engineId", 7}, {"engineFactory", "x"}});
		EXPECT(false, "numeric id accepted");
	} catch (const EngineError &e) {
		EXPECT(e.field() == "engineId", "numeric id field");
	}
	return 0;
}

static int test_mirror_type(void)
{
	try {
		params::parseAndValidate(json{{"engineId", "a"}, {"engineFactory", "x"}, {"mirrorType", "hdfs"}});
		EXPECT(false, "unknown mirrorType accepted");
	} catch (const EngineError &e) {
		EXPECT(e.field() == "mirrorType", "mirrorType field");
	}
	EngineParams p = params::parseAndValidate(json{{"engineId", "a"}, {"engineFactory", "x"}, {"mirrorType", ""}});
	EXPECT(!p.mirroring(), "empty mirrorType means off");
	return 0;
}

static int test_component_readers(void)
{
	json raw{{"algorithm", {{"num", 3}, {"names", {"a", "b"}}, {"flag", true}, {"ratio", 0.5}}}};
	json algo = params::section(raw, "algorithm");
	EXPECT(params::intOr(algo, "num", 9, "algorithm") == 3, "intOr present");
	EXPECT(params::intOr(algo, "missing", 9, "algorithm") == 9, "intOr fallback");
	EXPECT(params::boolOr(algo, "flag", false, "algorithm"), "boolOr");
	EXPECT(params::doubleOr(algo, "ratio", 1.0, "algorithm") == 0.5, "doubleOr");
	auto names = params::optStringList(algo, "names", "algorithm");
	EXPECT(names && names->size() == 2, "optStringList");
	EXPECT(!params::optString(algo, "absent", "algorithm"), "absent optString");
	EXPECT(params::section(raw, "dataset").empty(), "missing section is empty");

	try {
		params::intOr(json{{"num", "three"}}, "num", 1, "algorithm");
		EXPECT(false, "string accepted as int");
	} catch (const EngineError &e) {
		EXPECT(e.field() == "algorithm.num", "qualified field name");
	}
	EXPECT(throwsKind(ErrorKind::Validation, []() { params::section(json{{"algorithm", 5}}, "algorithm"); }),
		   "non-object section rejected");
	return 0;
}

static int test_integer_range(void)
{
	json wide = json::parse(R"({"num": 4294967297, "low": -2147483649, "max": 2147483647, "min": -2147483648})");
	try {
		params::intOr(wide, "num", 1, "algorithm");
		EXPECT(false, "64-bit value narrowed");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::Validation && e.field() == "algorithm.num", "too large for int");
	}
	EXPECT(throwsKind(ErrorKind::Validation, [&]() { params::intOr(wide, "low", 1, "algorithm"); }), "too small for int");
	EXPECT(params::intOr(wide, "max", 1, "algorithm") == 2147483647, "int max kept");
	EXPECT(params::intOr(wide, "min", 1, "algorithm") == -2147483647 - 1, "int min kept");
	return 0;
}

int main(void)
{
	if (test_required_top_level() != 0) return 1;
	if (test_typed_top_level() != 0) return 1;
	if (test_engine_id_rules() != 0) return 1;
	if (test_mirror_type() != 0) return 1;
	if (test_component_readers() != 0) return 1;
	if (test_integer_range() != 0) return 1;
	return 0;
}
