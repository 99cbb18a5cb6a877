#include "../include/renko/utils.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace renko {

std::string trim(const std::string& input) {
    std::size_t start = 0;
    while (start < input.size() && std::isspace(static_cast<unsigned char>(input[start])) != 0) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
        --end;
    }
    return input.substr(start, end - start);
}

std::string lowercase(std::string input) {
    for (char& ch : input) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return input;
}

long long epoch_seconds_to_ms(double seconds) {
    if (!std::isfinite(seconds) || std::abs(seconds) > kMaxEpochSeconds) {
        throw std::invalid_argument("Epoch timestamp out of range: " + std::to_string(seconds));
    }
    return std::llround(seconds * 1000.0);
}

static bool parse_epoch_seconds(const std::string& t, long long* out_ms) {
    char* end_ptr = nullptr;
    errno = 0;
    double v = std::strtod(t.c_str(), &end_ptr);
    if (end_ptr == t.c_str() || *end_ptr != '\0') {
        return false;
    }
    if (errno != 0 || !std::isfinite(v)) {
        throw std::invalid_argument("Epoch timestamp out of range: " + t);
    }
    *out_ms = epoch_seconds_to_ms(v);
    return true;
}

long long parse_timestamp_ms(const std::string& text) {
    std::string t = trim(text);
    if (t.empty()) {
        throw std::invalid_argument("Empty timestamp");
    }
    long long epoch_ms = 0;
    if (parse_epoch_seconds(t, &epoch_ms)) return epoch_ms;

    if (t.size() < 19) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }
    std::string head = t.substr(0, 19);
    if (head[10] == 'T') head[10] = ' ';

    std::tm tm = {};
    std::istringstream ss(head);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Invalid timestamp: " + text);
    }
    long long ms = static_cast<long long>(timegm(&tm)) * 1000;

    std::size_t pos = 19;
    if (pos < t.size() && t[pos] == '.') {
        ++pos;
        int digits = 0;
        long long frac = 0;
        while (pos < t.size() && std::isdigit(static_cast<unsigned char>(t[pos]))) {
            if (digits < 3) {
                frac = frac * 10 + (t[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) throw std::invalid_argument("Invalid timestamp: " + text);
        while (digits < 3) {
            frac *= 10;
            ++digits;
        }
        ms += frac;
    }

    std::string zone = t.substr(pos);
    if (zone.empty() || zone == "Z") return ms;
    if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':' &&
        std::isdigit(static_cast<unsigned char>(zone[1])) && std::isdigit(static_cast<unsigned char>(zone[2])) &&
        std::isdigit(static_cast<unsigned char>(zone[4])) && std::isdigit(static_cast<unsigned char>(zone[5]))) {
        int hh = (zone[1] - '0') * 10 + (zone[2] - '0');
        int mm = (zone[4] - '0') * 10 + (zone[5] - '0');
        long long offset_ms = (hh * 3600LL + mm * 60LL) * 1000;
        return zone[0] == '+' ? ms - offset_ms : ms + offset_ms;
    }
    throw std::invalid_argument("Invalid timestamp zone: " + text);
}

std::string format_timestamp_iso(long long ms) {
    long long secs = ms / 1000;
    long long rem = ms % 1000;
    if (rem < 0) {
        rem += 1000;
        --secs;
    }
    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf);
    if (rem != 0) {
        std::ostringstream oss;
        oss << '.' << std::setw(3) << std::setfill('0') << rem;
        out += oss.str();
    }
    return out;
}

std::string candles_to_csv(const std::vector<Candle>& candles) {
    std::ostringstream ss;
    ss << std::setprecision(10);
    ss << "date,open,high,low,close,volume\n";
    for (const auto& c : candles) {
        ss << format_timestamp_iso(c.time) << ","
           << c.open << ","
           << c.high << ","
           << c.low << ","
           << c.close << ","
           << c.volume << "\n";
    }
    return ss.str();
}

std::string bricks_to_csv(const std::vector<RenkoBrick>& bricks) {
    std::ostringstream ss;
    ss << std::setprecision(10);
    ss << "date,value,size,open,high,low,close,dir\n";
    for (const auto& b : bricks) {
        ss << format_timestamp_iso(b.brick_time) << ","
           << b.value << ","
           << b.size << ","
           << b.open << ","
           << b.high << ","
           << b.low << ","
           << b.close << ","
           << b.dir << "\n";
    }
    return ss.str();
}

} // namespace renko
