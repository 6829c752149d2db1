#pragma once
/**
 * Memeforge - Attribution service
 *
 * Tokenizes shareable URLs through the remote tracking service and decides
 * which watermark a request renders with, and searches published memes.
 * Without a remote_tracking_url the service only strips leaked API keys and
 * applies the local key list.
 */

#include "common.h"
#include "settings.h"

// What the attribution rules need from an inbound request.
struct RequestInfo {
    string      url;       // absolute URL including query
    QueryParams params;
    QueryParams headers;   // lower-cased names
};

struct SearchResult {
    string image_url;
    double confidence = 0;
};

// POSTs JSON to a URL; returns the status and body of the reply.
using JsonPoster = function<HttpReply(const string& url, const json& payload, const vector<string>& headers)>;

class MetaService {
public:
    MetaService(const Settings& settings, JsonPoster poster);

    // Key from the X-API-KEY header, else the api_key query parameter.
    string api_key(const RequestInfo& req) const;

    // URL with the tracking token embedded; `second` is true when it changed.
    pair<string, bool> tokenize(const RequestInfo& req, const string& url) const;

    // Watermark to render; `second` is true when the request's watermark
    // parameter was consumed and the URL should be rewritten without it.
    pair<string, bool> get_watermark(const RequestInfo& req) const;

    // Remote account lookup; empty object when unavailable.
    json authenticate(const RequestInfo& req) const;

    // Memes matching `query` from the remote service, best match first.
    // Empty without a remote_tracking_url or on any failure.
    vector<SearchResult> search(const RequestInfo& req, const string& query, bool safe,
                                const string& mode = "") const;

private:
    const Settings& settings_;
    JsonPoster poster_;
};

// curl-backed poster used by the server.
JsonPoster make_curl_poster(int timeout_seconds);
