#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace enginehost {

namespace fs = std::filesystem;

std::string getEnv(const std::string &key, const std::string &fallback = "");
bool boolFrom(const std::string &value, bool fallback = true);
std::string trimCopy(const std::string &s);
std::vector<std::string> splitList(const std::string &s, char sep = ',');

// Lenient numeric parse: accepts decimal, 0x/0b/0o prefixes and NaN/Infinity.
bool parseNumberLike(const std::string &s, double &out);
double numberOr(const std::string &s, double fallback);

void ensureDir(const fs::path &dir);

int64_t nowEpochMs();
std::string formatIso(int64_t epochMs);
std::string nowIso();

// ISO-8601 "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)" to epoch milliseconds.
std::optional<int64_t> parseIsoTime(const std::string &text);

std::string randomHex(size_t bytes);

} // namespace enginehost
