/**
 * Memeforge - Settings loading
 */

#include "settings.h"

static set<string> json_string_set(const json& v) {
    set<string> out;
    if (!v.is_array()) return out;
    for (const auto& item : v) {
        if (item.is_string()) out.insert(item.get<string>());
    }
    return out;
}

static set<string> split_csv(const string& raw) {
    set<string> out;
    std::stringstream ss(raw);
    string item;

    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        auto end = item.find_last_not_of(" \t");
        if (end != string::npos) item.erase(end + 1);
        if (!item.empty()) out.insert(item);
    }

    return out;
}

void apply_settings_json(Settings& s, const json& j) {
    if (!j.is_object()) return;

    if (j.contains("allowed_extensions")) s.allowed_extensions = json_string_set(j["allowed_extensions"]);
    s.default_extension = json_str(j, "default_extension", s.default_extension);
    s.default_style     = json_str(j, "default_style", s.default_style);
    s.placeholder       = json_str(j, "placeholder", s.placeholder);
    s.error_template    = json_str(j, "error_template", s.error_template);
    s.custom_template   = json_str(j, "custom_template", s.custom_template);

    s.max_segment_bytes = json_num<size_t>(j, "max_segment_bytes", s.max_segment_bytes);
    s.truncate_chars    = json_num<size_t>(j, "truncate_chars", s.truncate_chars);
    s.min_dimension     = json_num<int>(j, "min_dimension", s.min_dimension);

    s.default_watermark = json_str(j, "default_watermark", s.default_watermark);
    if (j.contains("allowed_watermarks")) s.allowed_watermarks = json_string_set(j["allowed_watermarks"]);
    if (j.contains("api_keys")) s.api_keys = json_string_set(j["api_keys"]);
    s.remote_tracking_url    = json_str(j, "remote_tracking_url", s.remote_tracking_url);
    s.remote_timeout_seconds = json_num<int>(j, "remote_timeout_seconds", s.remote_timeout_seconds);

    s.templates_dir = json_str(j, "templates_dir", s.templates_dir);
    s.images_dir    = json_str(j, "images_dir", s.images_dir);
    s.stats_db      = json_str(j, "stats_db", s.stats_db);

    s.port           = json_num<int>(j, "port", s.port);
    s.render_workers = json_num<int>(j, "render_workers", s.render_workers);
    s.download_timeout_seconds = json_num<int>(j, "download_timeout_seconds", s.download_timeout_seconds);
}

void apply_settings_env(Settings& s) {
    auto env = [](const char* name) -> string {
        const char* v = std::getenv(name);
        return v ? string(v) : "";
    };

    string v;
    if (!(v = env("PORT")).empty() && !parse_int(v, s.port)) {
        cerr << "[Memeforge] Ignoring invalid PORT: " << v << endl;
    }
    if (!(v = env("MEMEFORGE_TEMPLATES_DIR")).empty()) s.templates_dir = v;
    if (!(v = env("MEMEFORGE_IMAGES_DIR")).empty()) s.images_dir = v;
    if (!(v = env("MEMEFORGE_STATS_DB")).empty()) s.stats_db = v;
    if (!(v = env("MEMEFORGE_REMOTE_TRACKING_URL")).empty()) s.remote_tracking_url = v;
    if (!(v = env("MEMEFORGE_API_KEYS")).empty()) s.api_keys = split_csv(v);
    if (!(v = env("MEMEFORGE_RENDER_WORKERS")).empty() && !parse_int(v, s.render_workers)) {
        cerr << "[Memeforge] Ignoring invalid MEMEFORGE_RENDER_WORKERS: " << v << endl;
    }

    if (s.render_workers < 1) s.render_workers = 1;
}

Settings load_settings() {
    Settings s;

    const char* path = std::getenv("MEMEFORGE_CONFIG");
    if (path && *path) {
        try {
            ifstream f(path);
            if (!f) {
                cerr << "[Memeforge] Config file not found: " << path << endl;
            } else {
                apply_settings_json(s, json::parse(f));
                cout << "[Memeforge] Loaded config: " << path << endl;
            }
        } catch (const std::exception& e) {
            cerr << "[Memeforge] Invalid config " << path << ": " << e.what() << endl;
        }
    }

    apply_settings_env(s);

    // Remote endpoints are joined as <base>tokenize
    if (!s.remote_tracking_url.empty() && s.remote_tracking_url.back() != '/') {
        s.remote_tracking_url += '/';
    }
    return s;
}

bool is_placeholder(const Settings& s, const string& value) {
    return !s.placeholder.empty() && value == s.placeholder;
}
