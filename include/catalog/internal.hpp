#pragma once
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <string_view>

namespace catalog::internal {

// Monotonic timestamp helper for metrics (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock timestamp (milliseconds since epoch).
inline uint64_t WallClockMillis() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// Formats a wall-clock time as ISO-8601 UTC with millisecond precision,
// e.g. "2024-05-01T12:00:00.123Z".
inline std::string FormatIso8601(uint64_t millis_since_epoch) {
  std::time_t secs = static_cast<std::time_t>(millis_since_epoch / 1000);
  std::tm tm{};
  gmtime_r(&secs, &tm);

  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::string out(buf, n);

  char ms[8];
  std::snprintf(ms, sizeof(ms), ".%03uZ",
                static_cast<unsigned>(millis_since_epoch % 1000));
  out += ms;
  return out;
}

inline std::string Trim(std::string_view s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(start, end - start + 1));
}

// ASCII case folding only; names are compared without Unicode normalization.
inline std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

inline bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

inline bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) return true;
  return ToLower(haystack).find(ToLower(needle)) != std::string::npos;
}

// Key used for the duplicate-name check: trimmed and case-folded.
inline std::string NameKey(std::string_view name) {
  return ToLower(Trim(name));
}

// Number of UTF-8 code points; length limits count characters, not bytes.
inline size_t Utf8Length(std::string_view s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

}  // namespace catalog::internal
