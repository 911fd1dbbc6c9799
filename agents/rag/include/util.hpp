#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

std::string read_text_file(const std::filesystem::path& p);

// Replaces every '\n' and '\r' with a space.
std::string replace_newlines(const std::string& text);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char sep);

// Splits CSV text into rows of fields; handles quoted fields with doubled quotes.
std::vector<std::vector<std::string>> parse_csv(const std::string& text, char delimiter);

// 1 - cosine similarity; 1.0 when either vector has zero norm.
double cosine_distance(const std::vector<float>& a, const std::vector<float>& b);

// "YYYY-MM-DDTHH:MM:SS[.ffffff]" in UTC.
std::string format_iso8601(std::chrono::system_clock::time_point t);
// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM[:SS[.f]]" or the 'T' form, with an
// optional 'Z' or +HH:MM / +HHMM offset (UTC when absent). Trailing text is rejected.
std::chrono::system_clock::time_point parse_iso8601(const std::string& text);
