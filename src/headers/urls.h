#pragma once
/**
 * Memeforge - URL helpers
 * Query lookup with alias keys, scheme detection, query building and cleanup.
 */

#include "common.h"

// First value present under any of `names` (checked in order), else `def`.
string url_arg(const QueryParams& params, const string& def, const vector<string>& names);
optional<string> url_arg(const QueryParams& params, const vector<string>& names);

// True when the value looks like an absolute URL ("scheme://...").
bool url_schema(const string& value);

// True for http:// and https:// URLs, the only schemes the server downloads.
bool url_http(const string& value);

// Boolean query flag ("true", "1", "yes"); `def` when absent.
bool url_flag(const QueryParams& params, const string& name, bool def);

string url_encode(const string& s);
string url_decode(const string& s);

string build_query(const QueryParams& params);
QueryParams parse_query(const string& query);

// Copy of `params` without any entry named `name`.
QueryParams params_without(const QueryParams& params, const string& name);

// Remove every `name` parameter from a full URL, keeping the others verbatim.
string url_remove_param(const string& url, const string& name);

// `path` + "?" + query, or bare path when no params remain.
string url_with_query(const string& path, const QueryParams& params);

// Add or replace query parameters on a full URL.
string url_add(const string& url, const QueryParams& extra);

// Drop empty query strings and stray separators ("?&", "&&", trailing "?").
string url_clean(const string& url);
