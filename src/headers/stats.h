#pragma once
/**
 * Memeforge - Tracking storage
 *
 * Records the overlay text of every rendered meme to a SQLite database so
 * popular phrases, templates and meme URLs can be summarized later.
 *
 * Row shape: { ts:<unix>, template_id:"...", text:"...", vh:"<referer_hash>", url:"..." }
 */

#include "common.h"

// --- Database lifecycle (call init once before recording) -------------------

bool stat_init_db(const string& db_path);
void stat_close_db();

// --- Record -----------------------------------------------------------------

// No-op for empty text or when the database is not open.
void stat_record_text(const string& template_id, const string& text,
                      const string& referer = "", const string& url = "");

// --- Query ------------------------------------------------------------------

// Empty fields match everything; `text` is a case-insensitive substring.
struct StatFilter {
    string template_id;
    string text;
};

struct StatSummary {
    int total = 0;
    vector<pair<string, int>> by_template;   // most used first
    vector<pair<string, int>> by_text;       // most used first
    vector<pair<string, int>> by_url;        // most used first, rows with a url only
};

StatSummary stat_query(int64_t from_unix, int64_t to_unix, size_t limit = 10,
                       const StatFilter& filter = {});

int64_t stat_now();
