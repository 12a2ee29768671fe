/*
Event parsing tests.
*/
#include "test_support.hpp"

using namespace enginehost;
using namespace enginehost::testing;

static int test_minimal_event(void)
{
	const int64_t accepted = 1700000000123;
	Event ev = Event::fromJson(json{{"entityType", "user"}, {"entityId", "u1"}, {"event", "view"}}, accepted);
	EXPECT(ev.entityType == "user" && ev.entityId == "u1" && ev.event == "view", "required fields");
	EXPECT(!ev.targetEntityType && !ev.targetEntityId, "no target");
	EXPECT(ev.properties.is_object() && ev.properties.empty(), "empty properties");
	EXPECT(ev.eventTime == accepted, "eventTime defaults to acceptance");
	EXPECT(ev.creationTime == accepted, "creationTime stamped");
	EXPECT(!ev.isReserved(), "not reserved");
	return 0;
}

static int test_event_time(void)
{
	json body = event("buy", "u1", "i1");
	body["eventTime"] = "2024-03-01T10:15:30.250+02:00";
	Event ev = Event::fromJson(body, 5);
	auto expected = parseIsoTime("2024-03-01T08:15:30.250Z");
	EXPECT(expected.has_value(), "reference time parses");
	EXPECT(ev.eventTime == *expected, "offset applied");
	EXPECT(ev.creationTime == 5, "creationTime independent of eventTime");

	body["eventTime"] = "yesterday";
	try {
		Event::fromJson(body, 5);
		EXPECT(false, "bad eventTime accepted");
	} catch (const EngineError &e) {
		EXPECT(e.kind() == ErrorKind::Validation, "bad eventTime kind");
		EXPECT(e.field() == "eventTime", "bad eventTime field");
	}
	return 0;
}

static int test_rejections(void)
{
	EXPECT(throwsKind(ErrorKind::Validation, []() { Event::fromJson(json::array(), 0); }), "non-object");
	EXPECT(throwsKind(ErrorKind::Validation, []() { Event::fromJson(json{{"entityType", "user"}, {"event", "x"}}, 0); }),
		   "missing entityId");
	EXPECT(throwsKind(ErrorKind::Validation, []() {
		Event::fromJson(json{{"entityType", "user"}, {"entityId", ""}, {"event", "x"}}, 0);
	}), "empty entityId");

	json half{{"entityType", "user"}, {"entityId", "u"}, {"event", "x"}, {"targetEntityType", "item"}};
	try {
		Event::fromJson(half, 0);
		EXPECT(false, "half target accepted");
	} catch (const EngineError &e) {
		EXPECT(e.field() == "targetEntityId", "half target names the missing field");
	}

	json props{{"entityType", "user"}, {"entityId", "u"}, {"event", "x"}, {"properties", "oops"}};
	try {
		Event::fromJson(props, 0);
		EXPECT(false, "string properties accepted");
	} catch (const EngineError &e) {
		EXPECT(e.field() == "properties", "properties field");
	}
	return 0;
}

static int test_stored_form(void)
{
	json body = event("buy", "u1", "i9");
	body["properties"] = json{{"price", 3.5}};
	body["eventTime"] = "2024-01-02T03:04:05.006Z";
	Event original = Event::fromJson(body, 1704164645999);
	json stored = original.toJson();
	EXPECT(stored["creationTime"] == "2024-01-02T03:04:05.999Z", "creationTime rendered");

	Event back = Event::fromStored(stored);
	EXPECT(back.creationTime == original.creationTime, "creationTime preserved");
	EXPECT(back.eventTime == original.eventTime, "eventTime preserved");
	EXPECT(back.targetEntityId && *back.targetEntityId == "i9", "target preserved");
	EXPECT(back.properties["price"] == 3.5, "properties preserved");

	Event special = Event::fromJson(json{{"entityType", "item"}, {"entityId", "i1"}, {"event", "$set"}}, 0);
	EXPECT(special.isReserved(), "$set reserved");
	return 0;
}

int main(void)
{
	if (test_minimal_event() != 0) return 1;
	if (test_event_time() != 0) return 1;
	if (test_rejections() != 0) return 1;
	if (test_stored_form() != 0) return 1;
	return 0;
}
