/**
 * Memeforge - URL helpers implementation
 */

#include "urls.h"

optional<string> url_arg(const QueryParams& params, const vector<string>& names) {
    for (const auto& name : names) {
        auto it = params.find(name);
        if (it != params.end() && !it->second.empty()) return it->second;
    }
    return std::nullopt;
}

string url_arg(const QueryParams& params, const string& def, const vector<string>& names) {
    auto value = url_arg(params, names);
    return value ? *value : def;
}

bool url_schema(const string& value) {
    auto pos = value.find("://");
    if (pos == string::npos || pos == 0) return false;

    // RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
    if (!std::isalpha((unsigned char)value[0])) return false;
    for (size_t i = 1; i < pos; i++) {
        unsigned char c = value[i];
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

bool url_http(const string& value) {
    string head = to_lower(value.substr(0, 8));
    return head.rfind("http://", 0) == 0 || head.rfind("https://", 0) == 0;
}

bool url_flag(const QueryParams& params, const string& name, bool def) {
    auto it = params.find(name);
    if (it == params.end()) return def;
    string v = to_lower(it->second);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    return def;
}

string url_encode(const string& s) {
    static const char* HEX = "0123456789ABCDEF";
    string out;

    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += (char)c;
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

string url_decode(const string& s) {
    string out;
    for (size_t i = 0; i < s.size(); ) {
        if (s[i] == '+') { out += ' '; i++; }
        else if (s[i] == '%' && i + 2 < s.size()) {
            auto hex = [](char c) -> int {
                if (c >= '0' && c <= '9') return c - '0';
                if (c >= 'a' && c <= 'f') return c - 'a' + 10;
                if (c >= 'A' && c <= 'F') return c - 'A' + 10;
                return -1;
            };
            int hi = hex(s[i+1]), lo = hex(s[i+2]);
            if (hi >= 0 && lo >= 0) { out += (char)((hi << 4) | lo); i += 3; }
            else { out += s[i++]; }
        } else { out += s[i++]; }
    }
    return out;
}

string build_query(const QueryParams& params) {
    string q;
    for (const auto& [k, v] : params) {
        if (!q.empty()) q += '&';
        q += url_encode(k) + "=" + url_encode(v);
    }
    return q;
}

QueryParams parse_query(const string& query) {
    QueryParams params;
    std::stringstream ss(query);
    string item;

    while (std::getline(ss, item, '&')) {
        if (item.empty()) continue;
        auto eq = item.find('=');
        if (eq == string::npos) params.emplace(url_decode(item), "");
        else params.emplace(url_decode(item.substr(0, eq)), url_decode(item.substr(eq + 1)));
    }
    return params;
}

QueryParams params_without(const QueryParams& params, const string& name) {
    QueryParams out;
    for (const auto& [k, v] : params) {
        if (k != name) out.emplace(k, v);
    }
    return out;
}

string url_remove_param(const string& url, const string& name) {
    auto qpos = url.find('?');
    if (qpos == string::npos) return url;

    string kept;
    std::stringstream ss(url.substr(qpos + 1));
    string item;

    while (std::getline(ss, item, '&')) {
        if (item.empty()) continue;
        if (url_decode(item.substr(0, item.find('='))) == name) continue;
        if (!kept.empty()) kept += '&';
        kept += item;
    }
    return url_clean(url.substr(0, qpos) + "?" + kept);
}

string url_with_query(const string& path, const QueryParams& params) {
    string q = build_query(params);
    return q.empty() ? path : path + "?" + q;
}

string url_add(const string& url, const QueryParams& extra) {
    auto qpos = url.find('?');
    string base = url.substr(0, qpos);
    QueryParams params = qpos == string::npos ? QueryParams{} : parse_query(url.substr(qpos + 1));

    for (const auto& [k, v] : extra) {
        params.erase(k);
    }
    for (const auto& [k, v] : extra) {
        params.emplace(k, v);
    }
    return url_clean(url_with_query(base, params));
}

string url_clean(const string& url) {
    string out = url;

    while (!out.empty() && std::isspace((unsigned char)out.back())) out.pop_back();

    size_t pos;
    while ((pos = out.find("?&")) != string::npos) out.erase(pos + 1, 1);
    while ((pos = out.find("&&")) != string::npos) out.erase(pos, 1);
    while (!out.empty() && (out.back() == '?' || out.back() == '&')) out.pop_back();
    return out;
}
