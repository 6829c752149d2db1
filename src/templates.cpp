/**
 * Memeforge - Template registry implementation
 */

#include "templates.h"
#include "urls.h"

static const vector<string> IMAGE_EXTENSIONS = {".png", ".jpg", ".jpeg", ".webp", ".gif"};

// First "<stem>.<ext>" in `dir` with an image extension, in IMAGE_EXTENSIONS order.
static fs::path find_image(const fs::path& dir, const string& stem) {
    std::error_code ec;
    for (const auto& ext : IMAGE_EXTENSIONS) {
        fs::path candidate = dir / (stem + ext);
        if (fs::is_regular_file(candidate, ec) && fs::file_size(candidate, ec) > 0) return candidate;
    }
    return {};
}

static bool is_image_file(const fs::path& p) {
    string ext = to_lower(p.extension().string());
    return std::find(IMAGE_EXTENSIONS.begin(), IMAGE_EXTENSIONS.end(), ext) != IMAGE_EXTENSIONS.end();
}

static bool is_safe_id(const string& id) {
    if (id.empty() || id == "." || id == "..") return false;
    return id.find('/') == string::npos && id.find('\\') == string::npos;
}

static string overlay_stem(const string& url) {
    return "_overlay-" + fingerprint(url);
}

// ─── Template ───────────────────────────────────────────────────────────────

fs::path Template::image_path(const string& style, bool prefer_animated) const {
    if (url_schema(style)) {
        return find_image(directory, overlay_stem(style));
    }

    if (!style.empty() && std::find(styles.begin(), styles.end(), style) != styles.end()) {
        auto p = find_image(directory, style);
        if (!p.empty()) return p;
    }

    std::error_code ec;
    if (prefer_animated && animated) return directory / "default.gif";

    for (const auto& ext : {".png", ".jpg", ".jpeg", ".webp"}) {
        fs::path candidate = directory / (string("default") + ext);
        if (fs::is_regular_file(candidate, ec) && fs::file_size(candidate, ec) > 0) return candidate;
    }
    return animated ? directory / "default.gif" : fs::path{};
}

bool Template::image_exists() const {
    return !find_image(directory, "default").empty();
}

// ─── Download locks ─────────────────────────────────────────────────────────

TemplateStore::DownloadLock::DownloadLock(TemplateStore& store, const string& key)
    : store_(store), key_(key) {
    {
        lock_guard<mutex> lk(store_.locks_mutex_);
        auto& slot = store_.download_locks_[key_];
        if (!slot) slot = std::make_shared<mutex>();
        lock_ = slot;
    }
    lock_->lock();
}

TemplateStore::DownloadLock::~DownloadLock() {
    lock_->unlock();

    // Copies of a slot are only made or dropped under locks_mutex_
    lock_guard<mutex> lk(store_.locks_mutex_);
    lock_.reset();
    auto it = store_.download_locks_.find(key_);
    if (it != store_.download_locks_.end() && it->second.use_count() == 1) {
        store_.download_locks_.erase(it);
    }
}

// ─── TemplateStore ──────────────────────────────────────────────────────────

TemplateStore::TemplateStore(const Settings& settings, Fetcher fetcher)
    : settings_(settings), fetcher_(std::move(fetcher)) {}

Template TemplateStore::load(const string& id, const fs::path& dir) const {
    Template t;
    t.id = id;
    t.name = id;
    t.directory = dir;

    std::error_code ec;
    fs::path config = dir / "config.json";
    if (fs::exists(config, ec)) {
        try {
            ifstream f(config);
            json j = json::parse(f);
            t.name = json_str(j, "name", id);
            t.source = json_str(j, "source");
            if (j.contains("example") && j["example"].is_array()) {
                for (const auto& line : j["example"]) {
                    if (line.is_string()) t.example.push_back(line.get<string>());
                }
            }
        } catch (const std::exception& e) {
            cerr << "[Memeforge] Invalid config for template " << id << ": " << e.what() << endl;
        }
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& p = it->path();
        if (!it->is_regular_file(ec) || !is_image_file(p)) continue;
        string stem = p.stem().string();
        if (stem.empty() || stem[0] == '.' || stem[0] == '_' || stem == "default") continue;
        if (std::find(t.styles.begin(), t.styles.end(), stem) == t.styles.end()) t.styles.push_back(stem);
    }
    std::sort(t.styles.begin(), t.styles.end());

    t.animated = fs::is_regular_file(dir / "default.gif", ec);
    return t;
}

optional<Template> TemplateStore::get_or_none(const string& id) const {
    if (!is_safe_id(id)) return std::nullopt;

    fs::path dir = fs::path(settings_.templates_dir) / id;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return std::nullopt;
    return load(id, dir);
}

Template TemplateStore::get(const string& id) const {
    if (auto t = get_or_none(id)) return *t;

    Template missing;
    missing.id = id;
    missing.name = id;
    if (is_safe_id(id)) missing.directory = fs::path(settings_.templates_dir) / id;
    return missing;
}

string TemplateStore::extension_from_url(const string& url) {
    string path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    if (dot == string::npos || (slash != string::npos && dot < slash)) return ".png";

    string ext = to_lower(path.substr(dot));
    if (std::find(IMAGE_EXTENSIONS.begin(), IMAGE_EXTENSIONS.end(), ext) == IMAGE_EXTENSIONS.end()) return ".png";
    return ext;
}

Template TemplateStore::create(const string& url) {
    string id = "_custom-" + fingerprint(url);
    fs::path dir = fs::path(settings_.templates_dir) / id;

    if (!url_schema(url)) {
        cerr << "[Memeforge] Not a downloadable URL: " << url << endl;
        return get(id);
    }
    if (!url_http(url)) {
        cerr << "[Memeforge] Refusing to download non-http background: " << url << endl;
        return get(id);
    }

    DownloadLock lock(*this, id);

    std::error_code ec;
    if (find_image(dir, "default").empty()) {
        fs::create_directories(dir, ec);
        if (ec) {
            cerr << "[Memeforge] Unable to create " << dir << ": " << ec.message() << endl;
            return get(id);
        }

        fs::path dest = dir / ("default" + extension_from_url(url));
        cout << "[Memeforge] Downloading background: " << url << endl;
        if (!fetcher_ || !fetcher_(url, dest)) {
            fs::remove(dest, ec);
            fs::remove(dir, ec);  // only succeeds when empty
        }
    }

    return get(id);
}

bool TemplateStore::check(const Template& tmpl, const string& style) {
    if (style.empty() || style == settings_.default_style) return true;
    if (style == "animated") return true;
    if (std::find(tmpl.styles.begin(), tmpl.styles.end(), style) != tmpl.styles.end()) return true;

    if (!url_schema(style)) {
        cerr << "[Memeforge] Invalid style for " << tmpl.id << " template: " << style << endl;
        return false;
    }

    if (!url_http(style)) {
        cerr << "[Memeforge] Refusing to download non-http overlay: " << style << endl;
        return false;
    }
    if (tmpl.directory.empty()) return false;

    DownloadLock lock(*this, tmpl.id + "/" + overlay_stem(style));

    if (!find_image(tmpl.directory, overlay_stem(style)).empty()) return true;

    std::error_code ec;
    fs::create_directories(tmpl.directory, ec);
    fs::path dest = tmpl.directory / (overlay_stem(style) + extension_from_url(style));
    cout << "[Memeforge] Downloading overlay for " << tmpl.id << ": " << style << endl;
    if (fetcher_ && fetcher_(style, dest)) return true;

    fs::remove(dest, ec);
    cerr << "[Memeforge] Unable to download overlay: " << style << endl;
    return false;
}

vector<Template> TemplateStore::list() const {
    vector<Template> out;
    std::error_code ec;

    for (fs::directory_iterator it(settings_.templates_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_directory(ec)) continue;
        string id = it->path().filename().string();
        if (id.empty() || id[0] == '_' || id[0] == '.') continue;
        out.push_back(load(id, it->path()));
    }

    std::sort(out.begin(), out.end(), [](const Template& a, const Template& b) { return a.id < b.id; });
    return out;
}

Fetcher make_curl_fetcher(int timeout_seconds) {
    return [timeout_seconds](const string& url, const fs::path& dest) {
        return curl_download(url, dest.string(), timeout_seconds);
    };
}
