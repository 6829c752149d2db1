/**
 * Memeforge - Text slug codec implementation
 */

#include "text.h"

static const vector<pair<char, char>> TILDE_ESCAPES = {
    {'n', '\n'}, {'q', '?'}, {'a', '&'}, {'p', '%'}, {'h', '#'},
    {'s', '/'},  {'b', '\\'}, {'l', '<'}, {'g', '>'},
};

static string decode_line(const string& part) {
    string out;
    size_t i = 0;

    while (i < part.size()) {
        char c = part[i];
        char next = i + 1 < part.size() ? part[i + 1] : '\0';

        if ((c == '_' || c == '-') && next == c) { out += c; i += 2; continue; }
        if (c == '_' || c == '-') { out += ' '; i++; continue; }
        if (c == '\'' && next == '\'') { out += '"'; i += 2; continue; }

        if (c == '~' && next != '\0') {
            auto it = std::find_if(TILDE_ESCAPES.begin(), TILDE_ESCAPES.end(),
                [next](const pair<char, char>& e) { return e.first == next; });
            if (it != TILDE_ESCAPES.end()) { out += it->second; i += 2; continue; }
        }

        out += c;
        i++;
    }

    bool blank = std::all_of(out.begin(), out.end(), [](unsigned char ch) { return std::isspace(ch); });
    return blank ? "" : out;
}

static string encode_line(const string& line) {
    if (line.empty()) return "_";

    string out;
    for (char c : line) {
        switch (c) {
            case ' ':  out += '_'; break;
            case '_':  out += "__"; break;
            case '-':  out += "--"; break;
            case '"':  out += "''"; break;
            default: {
                auto it = std::find_if(TILDE_ESCAPES.begin(), TILDE_ESCAPES.end(),
                    [c](const pair<char, char>& e) { return e.second == c; });
                if (it != TILDE_ESCAPES.end()) { out += '~'; out += it->first; }
                else out += c;
            }
        }
    }
    return out;
}

vector<string> text_decode(const string& slug) {
    vector<string> lines;
    if (slug.empty()) return lines;

    size_t start = 0;
    while (true) {
        auto pos = slug.find('/', start);
        lines.push_back(decode_line(slug.substr(start, pos == string::npos ? string::npos : pos - start)));
        if (pos == string::npos) break;
        start = pos + 1;
    }
    return lines;
}

string text_encode(const vector<string>& lines) {
    if (lines.empty()) return "_";

    string slug;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i) slug += '/';
        slug += encode_line(lines[i]);
    }
    return slug;
}

pair<string, bool> text_normalize(const string& slug) {
    string normalized = text_encode(text_decode(slug));
    return {normalized, normalized != slug};
}

string utf8_truncate(const string& s, size_t max_chars) {
    size_t chars = 0;
    size_t i = 0;

    while (i < s.size() && chars < max_chars) {
        unsigned char c = s[i];
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        i = std::min(s.size(), i + len);
        chars++;
    }
    return s.substr(0, i);
}
