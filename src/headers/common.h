#pragma once
/**
 * Memeforge - Common header
 * Shared includes, using declarations, globals, and utility declarations
 */

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <array>
#include <memory>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <cstdint>
#include <cctype>
#include <ctime>
#include <mutex>
#include <chrono>
#include <thread>
#include <algorithm>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <functional>
#include <utility>

// ─── Type aliases & namespace shortcuts ─────────────────────────────────────

using json = nlohmann::json;
namespace fs = std::filesystem;

using std::string;
using std::vector;
using std::map;
using std::multimap;
using std::set;
using std::mutex;
using std::thread;
using std::cout;
using std::cerr;
using std::endl;
using std::array;
using std::unique_ptr;
using std::shared_ptr;
using std::lock_guard;
using std::function;
using std::ofstream;
using std::ifstream;
using std::istringstream;
using std::pair;
using std::optional;
using std::to_string;

// Query parameters sorted by name; repeated names keep arrival order.
// Same shape as httplib::Params.
using QueryParams = multimap<string, string>;

// ─── Global variables ───────────────────────────────────────────────────────

extern string g_imagemagick_path;  // Full path to magick or convert (empty = not found)
extern string g_curl_path;         // Full path to curl (empty = not found)
extern string g_hostname;          // Machine hostname (set at startup)

// ─── Safe JSON accessors (handles null values) ──────────────────────────────

template<typename T>
T json_num(const json& j, const string& key, T def) {
    if (j.contains(key) && j[key].is_number()) return j[key].get<T>();
    return def;
}

string json_str(const json& j, const string& key, const string& def = "");
bool   json_bool(const json& j, const string& key, bool def);

// ─── String / file utilities ────────────────────────────────────────────────

string to_lower(string s);
string escape_arg(const string& arg);
string fingerprint(const string& value);   // FNV-1a, 16 hex chars
string read_file_binary(const string& path);
bool   write_file_binary(const string& path, const string& data);
string mime_from_ext(const string& ext);
bool   parse_int(const string& raw, int& out);

// ─── Shell execution ────────────────────────────────────────────────────────

string exec_command(const string& cmd, int& exit_code);
string exec_command(const string& cmd);

// ─── Path and executable finding ────────────────────────────────────────────

string find_executable(const string& name, const vector<string>& extra_paths = {});
string find_imagemagick();
string find_curl();
string imagemagick_cmd();  // Returns escaped magick path, or bare "convert" fallback
string curl_cmd();         // Returns escaped curl path, or bare "curl" fallback

// ─── Remote calls ───────────────────────────────────────────────────────────

struct HttpReply {
    int    status = 0;     // 0 = transport failure
    string body;
};

// Download `url` into `dest` via curl. Returns false (and leaves no file) on failure.
bool   curl_download(const string& url, const string& dest, int timeout_seconds);

// POST a JSON payload via curl. Extra headers are "Name: value" lines.
HttpReply curl_post_json(const string& url, const json& payload,
                         const vector<string>& headers, int timeout_seconds);
