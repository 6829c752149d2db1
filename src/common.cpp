/**
 * Memeforge - Common utilities implementation
 */

#include "common.h"

#ifndef _WIN32
#include <sys/wait.h>
#endif

// ─── Global variable definitions ────────────────────────────────────────────

string g_imagemagick_path;
string g_curl_path;
string g_hostname;

// ─── JSON helpers ───────────────────────────────────────────────────────────

string json_str(const json& j, const string& key, const string& def) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<string>();
    return def;
}

bool json_bool(const json& j, const string& key, bool def) {
    if (!j.contains(key)) return def;
    const auto& v = j[key];

    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number()) return v.get<int>() != 0;
    if (v.is_string()) {
        string s = to_lower(v.get<string>());
        return s == "true" || s == "1" || s == "yes" || s == "on";
    }
    return def;
}

// ─── String utilities ───────────────────────────────────────────────────────

string to_lower(string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

string escape_arg(const string& arg) {
#ifdef _WIN32
    string escaped = "\"";

    for (char c : arg) {
        if (c == '"') escaped += "\\\"";
        else escaped += c;
    }

    escaped += "\"";
    return escaped;
#else
    string escaped = "'";

    for (char c : arg) {
        if (c == '\'') escaped += "'\\''";
        else escaped += c;
    }

    escaped += "'";
    return escaped;
#endif
}

string fingerprint(const string& value) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : value) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
    return string(buf, 16);
}

bool parse_int(const string& raw, int& out) {
    if (raw.empty()) return false;
    try {
        size_t used = 0;
        int v = std::stoi(raw, &used);
        if (used != raw.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// ─── Shell execution ────────────────────────────────────────────────────────

string exec_command(const string& cmd, int& exit_code) {
    string result;
    array<char, 4096> buffer;

#ifdef _WIN32
    string full_cmd = "\"" + cmd + " 2>&1\"";
    unique_ptr<FILE, decltype(&_pclose)> pipe(_popen(full_cmd.c_str(), "r"), _pclose);
#else
    string full_cmd = cmd + " 2>&1";
    unique_ptr<FILE, decltype(&pclose)> pipe(popen(full_cmd.c_str(), "r"), pclose);
#endif

    if (!pipe) { exit_code = -1; return "Failed to execute command"; }

    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    // Capture the real process exit code
#ifdef _WIN32
    exit_code = _pclose(pipe.release());
#else
    int raw = pclose(pipe.release());
    exit_code = WIFEXITED(raw) ? WEXITSTATUS(raw) : -1;
#endif
    return result;
}

string exec_command(const string& cmd) {
    int code;
    return exec_command(cmd, code);
}

// ─── Executable finding ─────────────────────────────────────────────────────

string find_executable(const string& name, const vector<string>& extra_paths) {
    string result;
    array<char, 4096> buf;
#ifdef _WIN32
    string wcmd = "where.exe " + name + " 2>&1";
    unique_ptr<FILE, decltype(&_pclose)> pipe(_popen(wcmd.c_str(), "r"), _pclose);
#else
    string wcmd = "which " + name + " 2>&1";
    unique_ptr<FILE, decltype(&pclose)> pipe(popen(wcmd.c_str(), "r"), pclose);
#endif

    if (pipe) {
        while (fgets(buf.data(), buf.size(), pipe.get()) != nullptr) { result += buf.data(); }
    }

    auto nl = result.find('\n');

    if (nl != string::npos) result = result.substr(0, nl);
    result.erase(std::remove(result.begin(), result.end(), '\r'), result.end());

    std::error_code ec;
    if (!result.empty() && fs::exists(result, ec)) return result;
    for (const auto& p : extra_paths) { if (fs::exists(p, ec)) return p; }
    return "";
}

string find_imagemagick() {
    // ImageMagick 7 ships "magick"; v6 only "convert"
    auto m = find_executable("magick", {"/usr/local/bin/magick", "/opt/homebrew/bin/magick"});
    if (!m.empty()) return m;
    return find_executable("convert", {"/usr/bin/convert", "/usr/local/bin/convert"});
}

string find_curl() {
    return find_executable("curl", {"/usr/bin/curl", "/usr/local/bin/curl"});
}

string imagemagick_cmd() {
    if (g_imagemagick_path.empty()) return "convert";
    return escape_arg(g_imagemagick_path);
}

string curl_cmd() {
    if (g_curl_path.empty()) return "curl";
    return escape_arg(g_curl_path);
}

// ─── File helpers ───────────────────────────────────────────────────────────

string read_file_binary(const string& path) {
    ifstream f(path, std::ios::binary);
    return string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

bool write_file_binary(const string& path, const string& data) {
    ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(data.data(), (std::streamsize)data.size());
    return (bool)out;
}

string mime_from_ext(const string& ext) {
    string e = to_lower(ext);
    if (!e.empty() && e[0] != '.') e = "." + e;

    if (e == ".jpg" || e == ".jpeg") return "image/jpeg";
    if (e == ".png") return "image/png";
    if (e == ".webp") return "image/webp";
    if (e == ".gif") return "image/gif";
    return "application/octet-stream";
}

// ─── Remote calls (curl) ────────────────────────────────────────────────────

bool curl_download(const string& url, const string& dest, int timeout_seconds) {
    string tmp = dest + ".part";
    string cmd = curl_cmd() + " -s -f -L --proto =http,https --proto-redir =http,https --max-time " + to_string(timeout_seconds) +
                 " -o " + escape_arg(tmp) + " " + escape_arg(url);
    int code;
    string out = exec_command(cmd, code);

    std::error_code ec;
    if (code != 0 || !fs::exists(tmp, ec) || fs::file_size(tmp, ec) == 0) {
        cerr << "[Memeforge] Download failed (" << code << "): " << url << endl;
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, dest, ec);
    if (ec) {
        cerr << "[Memeforge] Unable to store download: " << ec.message() << endl;
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

HttpReply curl_post_json(const string& url, const json& payload,
                         const vector<string>& headers, int timeout_seconds) {
    HttpReply reply;
    std::ostringstream stamp;
    stamp << std::chrono::system_clock::now().time_since_epoch().count() << "_" << std::this_thread::get_id();
    fs::path body_file = fs::temp_directory_path() / ("memeforge_post_" + stamp.str() + ".json");

    if (!write_file_binary(body_file.string(), payload.dump())) return reply;

    // The status code is appended on its own line after the body
    string cmd = curl_cmd() + " -s -X POST --max-time " + to_string(timeout_seconds) +
                 " -H " + escape_arg("Content-Type: application/json");
    for (const auto& h : headers) cmd += " -H " + escape_arg(h);
    cmd += " -d @" + escape_arg(body_file.string()) + " -w " + escape_arg("\n%{http_code}") +
           " " + escape_arg(url);

    int code;
    string out = exec_command(cmd, code);
    std::error_code ec;
    fs::remove(body_file, ec);

    if (code != 0) return reply;

    auto nl = out.rfind('\n');
    if (nl == string::npos) return reply;

    int status = 0;
    string tail = out.substr(nl + 1);
    tail.erase(std::remove(tail.begin(), tail.end(), '\r'), tail.end());
    if (!parse_int(tail, status)) return reply;

    reply.status = status;
    reply.body = out.substr(0, nl);
    return reply;
}
