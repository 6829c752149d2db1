/**
 * Memeforge - Attribution service implementation
 */

#include "meta.h"
#include "urls.h"

MetaService::MetaService(const Settings& settings, JsonPoster poster)
    : settings_(settings), poster_(std::move(poster)) {}

string MetaService::api_key(const RequestInfo& req) const {
    auto it = req.headers.find("x-api-key");
    if (it != req.headers.end() && !it->second.empty()) return it->second;
    return url_arg(req.params, "", {"api_key"});
}

pair<string, bool> MetaService::tokenize(const RequestInfo& req, const string& url) const {
    string key = api_key(req);

    // Never echo a key back in a shareable URL
    string default_url = key.empty() ? url : url_remove_param(url, "api_key");

    bool has_token = req.params.count("token") > 0;
    if (!key.empty() && !has_token && !settings_.remote_tracking_url.empty() && poster_) {
        string api = settings_.remote_tracking_url + "tokenize";
        HttpReply reply = poster_(api, json{{"url", default_url}}, {"X-API-KEY: " + key});

        if (reply.status == 201) {
            try {
                string tokenized = json_str(json::parse(reply.body), "url");
                if (!tokenized.empty()) return {tokenized, tokenized != url};
            } catch (const std::exception& e) {
                cerr << "[Memeforge] Invalid tokenize response: " << e.what() << endl;
            }
        } else {
            cerr << "[Memeforge] Tokenize failed with status " << reply.status << endl;
        }
    }

    return {default_url, default_url != url};
}

json MetaService::authenticate(const RequestInfo& req) const {
    string key = api_key(req);
    if (key.empty() || settings_.remote_tracking_url.empty() || !poster_) return json::object();

    string api = settings_.remote_tracking_url + "authenticate";
    HttpReply reply = poster_(api, json::object(), {"X-API-KEY: " + key});
    if (reply.status != 200 && reply.status != 201) return json::object();

    try {
        json data = json::parse(reply.body);
        if (data.is_object()) return data;
    } catch (const std::exception& e) {
        cerr << "[Memeforge] Invalid authenticate response: " << e.what() << endl;
    }
    return json::object();
}

vector<SearchResult> MetaService::search(const RequestInfo& req, const string& query, bool safe,
                                        const string& mode) const {
    vector<SearchResult> results;
    if (settings_.remote_tracking_url.empty() || !poster_) return results;

    json payload = {{"query", query}, {"safe", safe}};
    if (!mode.empty()) payload["mode"] = mode;

    vector<string> headers;
    string key = api_key(req);
    if (!key.empty()) headers.push_back("X-API-KEY: " + key);

    HttpReply reply = poster_(settings_.remote_tracking_url + "search", payload, headers);
    if (reply.status != 200) {
        cerr << "[Memeforge] Search failed with status " << reply.status << endl;
        return results;
    }

    try {
        json data = json::parse(reply.body);
        if (!data.is_array()) return results;
        for (const auto& item : data) {
            string url = json_str(item, "image_url");
            if (url.empty()) continue;
            results.push_back({url, json_num(item, "confidence", 0.0)});
        }
    } catch (const std::exception& e) {
        cerr << "[Memeforge] Invalid search response: " << e.what() << endl;
    }
    return results;
}

pair<string, bool> MetaService::get_watermark(const RequestInfo& req) const {
    optional<string> requested = url_arg(req.params, {"watermark"});
    string key = api_key(req);

    if (!key.empty()) {
        string masked = key.size() > 4 ? key.substr(0, 2) + "***" + key.substr(key.size() - 2) : "***";
        bool authorized = settings_.api_keys.count(key) > 0;

        if (!authorized) {
            json account = authenticate(req);
            authorized = !json_str(account, "email").empty();
        }

        if (authorized) {
            cout << "[Memeforge] Authenticated with " << masked << endl;
            return {requested.value_or(""), false};
        }
        cerr << "[Memeforge] Unrecognized API key " << masked << endl;
    }

    if (requested) {
        if (*requested == settings_.default_watermark) {
            cout << "[Memeforge] Redundant watermark: " << *requested << endl;
            return {settings_.default_watermark, true};
        }
        if (settings_.allowed_watermarks.count(*requested) == 0) {
            cerr << "[Memeforge] Unknown watermark: " << *requested << endl;
            return {settings_.default_watermark, true};
        }
        return {*requested, false};
    }

    return {settings_.default_watermark, false};
}

JsonPoster make_curl_poster(int timeout_seconds) {
    return [timeout_seconds](const string& url, const json& payload, const vector<string>& headers) {
        return curl_post_json(url, payload, headers, timeout_seconds);
    };
}
