#pragma once
/**
 * Memeforge - Template registry
 *
 * Templates live on disk, one directory per id:
 *
 *   <templates_dir>/<id>/default.<ext>    background (default.gif = animated)
 *   <templates_dir>/<id>/<style>.<ext>    alternate background per style
 *   <templates_dir>/<id>/config.json      { "name", "source", "example": [...] }
 *
 * Custom backgrounds are downloaded into "_custom-<fingerprint>" directories
 * and raw-URL styles into "_overlay-<fingerprint>.<ext>" beside the template image.
 */

#include "common.h"
#include "settings.h"

struct Template {
    string         id;
    string         name;
    string         source;
    fs::path       directory;
    vector<string> styles;     // named alternate backgrounds (sorted)
    vector<string> example;    // example overlay lines
    bool           animated = false;

    // Background for `style`: named style file, URL overlay, or default image.
    // Empty path when nothing suitable exists.
    fs::path image_path(const string& style = "", bool prefer_animated = false) const;
    bool     image_exists() const;
};

// Downloads `url` to `dest`; returns false on any failure.
using Fetcher = function<bool(const string& url, const fs::path& dest)>;

class TemplateStore {
public:
    TemplateStore(const Settings& settings, Fetcher fetcher);

    TemplateStore(const TemplateStore&) = delete;
    TemplateStore& operator=(const TemplateStore&) = delete;

    // Template by id; a Template whose image does not exist when the id is unknown.
    Template get(const string& id) const;
    optional<Template> get_or_none(const string& id) const;
    Template error_template() const { return get(settings_.error_template); }

    // Download (once) and wrap a custom background. Only http(s) URLs are
    // fetched. Never throws; a failed download yields a template whose
    // image_exists() is false.
    Template create(const string& url);

    // Whether `tmpl` can be rendered with `style`. Raw http(s) styles are
    // downloaded as overlays on first use.
    bool check(const Template& tmpl, const string& style);

    // Public templates (no leading "_"), sorted by id.
    vector<Template> list() const;

private:
    // Serializes downloads that write the same file; other downloads proceed.
    class DownloadLock {
    public:
        DownloadLock(TemplateStore& store, const string& key);
        ~DownloadLock();

        DownloadLock(const DownloadLock&) = delete;
        DownloadLock& operator=(const DownloadLock&) = delete;

    private:
        TemplateStore&    store_;
        string            key_;
        shared_ptr<mutex> lock_;
    };

    Template load(const string& id, const fs::path& dir) const;
    static string extension_from_url(const string& url);

    const Settings& settings_;
    Fetcher fetcher_;
    mutex locks_mutex_;
    map<string, shared_ptr<mutex>> download_locks_;
};

// curl-backed fetcher used by the server.
Fetcher make_curl_fetcher(int timeout_seconds);
