#include "lib.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>

// printf-style message, prefixed with the call site, thrown as std::runtime_error
void error(const std::string& msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);

    // first pass only sizes the output
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, msg.c_str(), args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        va_end(args);
        throw std::runtime_error("Error: Failed to determine required buffer size.");
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), msg.c_str(), args);
    va_end(args);

    throw std::runtime_error(where(file, line, buffer.data()));
}

std::string where(const char* file, int line, const std::string& msg) {
    std::stringstream ss;
    const char* base = file;
    for (const char* p = file; *p; ++p) {
        if (*p == '/' || *p == '\\') base = p + 1;
    }
    ss << base << ":" << line << ": " << msg;
    return ss.str();
}

std::string join(const StrList& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    if (!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
    for (char c : s) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    }
    return true;
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

static std::tm utc_tm(int64_t unix_ms) {
    std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
    std::tm tm {};
    gmtime_r(&secs, &tm);
    return tm;
}

std::string timestamp_ms(int64_t unix_ms) {
    std::tm tm = utc_tm(unix_ms);
    return std::format("{:04}{:02}{:02}{:02}{:02}{:02}{:03}",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(unix_ms % 1000));
}

std::string timestamp_ms() {
    return timestamp_ms(now_ms());
}

int64_t parse_timestamp_ms(const std::string& ts) {
    if (ts.size() != 17) return -1;
    for (char c : ts) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return -1;
    }
    auto num = [&](size_t pos, size_t len) { return std::stoi(ts.substr(pos, len)); };
    std::tm tm {};
    tm.tm_year = num(0, 4) - 1900;
    tm.tm_mon = num(4, 2) - 1;
    tm.tm_mday = num(6, 2);
    tm.tm_hour = num(8, 2);
    tm.tm_min = num(10, 2);
    tm.tm_sec = num(12, 2);
    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return -1;
    return static_cast<int64_t>(secs) * 1000 + num(14, 3);
}

std::string iso_utc(int64_t unix_ms) {
    std::tm tm = utc_tm(unix_ms);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(unix_ms % 1000));
}
