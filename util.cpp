#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>

namespace enginehost {

std::string getEnv(const std::string &key, const std::string &fallback) {
	const char *v = std::getenv(key.c_str());
	if (!v) return fallback;
	return std::string(v);
}

bool boolFrom(const std::string &value, bool fallback) {
	std::string v = trimCopy(value);
	if (v.empty()) return fallback;
	std::transform(v.begin(), v.end(), v.begin(), ::tolower);
	return !(v == "0" || v == "false" || v == "off" || v == "no");
}

std::string trimCopy(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(start, end - start + 1);
}

std::vector<std::string> splitList(const std::string &s, char sep) {
	std::vector<std::string> out;
	std::string item;
	std::istringstream in(s);
	while (std::getline(in, item, sep)) {
		item = trimCopy(item);
		if (!item.empty()) out.push_back(item);
	}
	return out;
}

bool parseNumberLike(const std::string &s, double &out) {
	std::string t = trimCopy(s);
	if (t.empty()) {
		out = 0.0;
		return true;
	}
	if (t == "NaN" || t == "+NaN" || t == "-NaN") {
		out = std::numeric_limits<double>::quiet_NaN();
		return true;
	}
	if (t == "Infinity" || t == "+Infinity") {
		out = std::numeric_limits<double>::infinity();
		return true;
	}
	if (t == "-Infinity") {
		out = -std::numeric_limits<double>::infinity();
		return true;
	}

	int sign = 1;
	std::string body = t;
	if (body[0] == '+' || body[0] == '-') {
		if (body[0] == '-') sign = -1;
		body = body.substr(1);
	}

	auto radixOf = [](const std::string &b) {
		if (b.size() < 2 || b[0] != '0') return 0;
		char p = (char)std::tolower((unsigned char)b[1]);
		if (p == 'x') return 16;
		if (p == 'b') return 2;
		if (p == 'o') return 8;
		return 0;
	};

	try {
		int radix = radixOf(body);
		if (radix != 0) {
			std::string digits = body.substr(2);
			size_t idx = 0;
			unsigned long long v = std::stoull(digits, &idx, radix);
			if (idx != digits.size()) return false;
			out = (double)v * sign;
			return true;
		}
		size_t idx = 0;
		double v = std::stod(t, &idx);
		if (idx != t.size()) return false;
		out = v;
		return true;
	} catch (const std::exception &) {
		return false;
	}
}

double numberOr(const std::string &s, double fallback) {
	double v = 0.0;
	if (!parseNumberLike(s, v)) return fallback;
	if (!std::isfinite(v)) return fallback;
	if (v == 0.0) return fallback;
	return v;
}

void ensureDir(const fs::path &dir) {
	if (!fs::exists(dir)) fs::create_directories(dir);
}

int64_t nowEpochMs() {
	return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string formatIso(int64_t epochMs) {
	std::time_t t = (std::time_t)(epochMs / 1000);
	int64_t ms = epochMs % 1000;
	if (ms < 0) {
		ms += 1000;
		t -= 1;
	}
	std::tm tm{};
#ifdef _WIN32
	gmtime_s(&tm, &t);
#else
	gmtime_r(&t, &tm);
#endif
	char buf[64];
	std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
	std::ostringstream oss;
	oss << buf << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
	return oss.str();
}

std::string nowIso() {
	return formatIso(nowEpochMs());
}

namespace {

bool readDigits(const std::string &s, size_t &pos, size_t count, int &out) {
	if (pos + count > s.size()) return false;
	int v = 0;
	for (size_t i = 0; i < count; i++) {
		char c = s[pos + i];
		if (!std::isdigit((unsigned char)c)) return false;
		v = v * 10 + (c - '0');
	}
	pos += count;
	out = v;
	return true;
}

bool expect(const std::string &s, size_t &pos, char c) {
	if (pos >= s.size() || s[pos] != c) return false;
	pos++;
	return true;
}

// Howard Hinnant's days_from_civil.
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
	y -= m <= 2;
	const int64_t era = (y >= 0 ? y : y - 399) / 400;
	const unsigned yoe = (unsigned)(y - era * 400);
	const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + (int64_t)doe - 719468;
}

} // namespace

std::optional<int64_t> parseIsoTime(const std::string &text) {
	std::string s = trimCopy(text);
	size_t pos = 0;
	int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
	if (!readDigits(s, pos, 4, year) || !expect(s, pos, '-')) return std::nullopt;
	if (!readDigits(s, pos, 2, month) || !expect(s, pos, '-')) return std::nullopt;
	if (!readDigits(s, pos, 2, day)) return std::nullopt;
	if (pos >= s.size() || (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ')) return std::nullopt;
	pos++;
	if (!readDigits(s, pos, 2, hour) || !expect(s, pos, ':')) return std::nullopt;
	if (!readDigits(s, pos, 2, minute) || !expect(s, pos, ':')) return std::nullopt;
	if (!readDigits(s, pos, 2, second)) return std::nullopt;
	if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
		return std::nullopt;
	}

	int millis = 0;
	if (pos < s.size() && s[pos] == '.') {
		pos++;
		size_t start = pos;
		int scale = 100;
		while (pos < s.size() && std::isdigit((unsigned char)s[pos])) {
			millis += (s[pos] - '0') * scale;
			scale /= 10;
			pos++;
		}
		if (pos == start) return std::nullopt;
	}

	int offsetMinutes = 0;
	if (pos >= s.size()) return std::nullopt;
	if (s[pos] == 'Z' || s[pos] == 'z') {
		pos++;
	} else if (s[pos] == '+' || s[pos] == '-') {
		int sign = s[pos] == '-' ? -1 : 1;
		pos++;
		int oh = 0, om = 0;
		if (!readDigits(s, pos, 2, oh)) return std::nullopt;
		if (pos < s.size() && s[pos] == ':') pos++;
		if (!readDigits(s, pos, 2, om)) return std::nullopt;
		offsetMinutes = sign * (oh * 60 + om);
	} else {
		return std::nullopt;
	}
	if (pos != s.size()) return std::nullopt;

	int64_t days = daysFromCivil(year, (unsigned)month, (unsigned)day);
	int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - (int64_t)offsetMinutes * 60;
	return seconds * 1000 + millis;
}

std::string randomHex(size_t bytes) {
	std::random_device rd;
	std::uniform_int_distribution<int> dist(0, 255);
	std::ostringstream oss;
	oss << std::hex << std::setfill('0');
	for (size_t i = 0; i < bytes; i++) {
		int v = dist(rd);
		oss << std::setw(2) << (v & 0xff);
	}
	return oss.str();
}

} // namespace enginehost
