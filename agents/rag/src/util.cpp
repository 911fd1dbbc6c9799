#include "../include/util.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <sstream>

std::string read_text_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    if (!f) throw InvalidArgument("cannot open file: " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string replace_newlines(const std::string& text) {
    std::string out = text;
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    return out;
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    std::stringstream ss(s);
    while (std::getline(ss, cur, sep)) {
        auto t = trim(cur);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

std::vector<std::vector<std::string>> parse_csv(const std::string& text, char delimiter) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool quoted = false;
    bool row_has_data = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') { field += '"'; ++i; }
                else quoted = false;
            } else {
                field += c;
            }
            continue;
        }
        if (c == '"') { quoted = true; row_has_data = true; }
        else if (c == delimiter) { row.push_back(field); field.clear(); row_has_data = true; }
        else if (c == '\r') { /* CRLF */ }
        else if (c == '\n') {
            if (row_has_data || !field.empty()) {
                row.push_back(field);
                rows.push_back(std::move(row));
            }
            row.clear(); field.clear(); row_has_data = false;
        } else { field += c; row_has_data = true; }
    }
    if (quoted) throw InvalidArgument("unterminated quoted field in CSV");
    if (row_has_data || !field.empty()) {
        row.push_back(field);
        rows.push_back(std::move(row));
    }
    return rows;
}

double cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 1.0;
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += (double)a[i] * (double)b[i];
        na += (double)a[i] * (double)a[i];
        nb += (double)b[i] * (double)b[i];
    }
    if (na == 0.0 || nb == 0.0) return 1.0;
    return 1.0 - dot / (std::sqrt(na) * std::sqrt(nb));
}

std::string format_iso8601(std::chrono::system_clock::time_point t) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
    long long secs = us / 1000000;
    long long frac = us % 1000000;
    if (frac < 0) { frac += 1000000; --secs; }
    std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::string out(buf);
    if (frac != 0) {
        char fbuf[8];
        std::snprintf(fbuf, sizeof(fbuf), ".%06lld", frac);
        out += fbuf;
    }
    return out;
}

std::chrono::system_clock::time_point parse_iso8601(const std::string& text) {
    const std::string s = trim(text);
    auto bad = [&]() { return InvalidArgument("bad ISO-8601 timestamp: '" + text + "'"); };
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    double second = 0.0;
    int used = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &used) != 3) throw bad();
    size_t pos = (size_t)used;
    std::chrono::minutes offset{0};
    if (pos < s.size()) {
        if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') throw bad();
        ++pos;
        if (std::sscanf(s.c_str() + pos, "%2d:%2d%n", &hour, &minute, &used) != 2) throw bad();
        pos += (size_t)used;
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (pos >= s.size() || !std::isdigit((unsigned char)s[pos])) throw bad();
            if (std::sscanf(s.c_str() + pos, "%lf%n", &second, &used) != 1) throw bad();
            pos += (size_t)used;
        }
        // Zone designator: 'Z', +HH:MM, +HHMM or nothing (UTC).
        std::string zone = s.substr(pos);
        if (zone == "Z" || zone == "z") {
        } else if (!zone.empty()) {
            if (zone[0] != '+' && zone[0] != '-') throw bad();
            int oh = 0, om = 0;
            bool ok = false;
            if (zone.size() == 6 && zone[3] == ':') {
                ok = std::sscanf(zone.c_str() + 1, "%2d:%2d", &oh, &om) == 2;
            } else if (zone.size() == 5) {
                ok = std::sscanf(zone.c_str() + 1, "%2d%2d", &oh, &om) == 2;
            }
            ok = ok && std::all_of(zone.begin() + 1, zone.end(),
                                   [](char c){ return std::isdigit((unsigned char)c) || c == ':'; });
            if (!ok) throw bad();
            if (oh > 23 || om > 59) throw InvalidArgument("out of range UTC offset in '" + text + "'");
            offset = std::chrono::minutes(oh * 60 + om) * (zone[0] == '-' ? -1 : 1);
        }
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 || minute > 59 ||
        second < 0.0 || second >= 61.0) {
        throw InvalidArgument("out of range ISO-8601 timestamp: '" + text + "'");
    }
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = 0;
    std::time_t secs = timegm(&tm);
    auto whole = std::chrono::system_clock::from_time_t(secs);
    auto frac = std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::duration<double>(second));
    return whole + frac - offset;
}
