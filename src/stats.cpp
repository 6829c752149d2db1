/**
 * Memeforge - Tracking storage implementation (SQLite backend)
 */

#include "stats.h"
#include <sqlite3.h>

// === Globals =================================================================

static mutex    g_stats_mutex;
static sqlite3* g_db = nullptr;

// === Internal helpers ========================================================

int64_t stat_now() {
    return (int64_t)std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Referers are hashed so raw URLs of embedding pages are never stored
static string hash_referer(const string& referer) {
    if (referer.empty()) return "";
    return fingerprint(referer).substr(0, 10);
}

// LIKE pattern matching `text` anywhere, with the wildcards escaped
static string like_pattern(const string& text) {
    string out = "%";
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out + "%";
}

static string filter_clause(const StatFilter& filter) {
    string where = " WHERE ts >= ? AND ts <= ?";
    if (!filter.template_id.empty()) where += " AND template_id = ?";
    if (!filter.text.empty()) where += " AND text LIKE ? ESCAPE '\\'";
    return where;
}

// Binds the filter_clause() parameters; returns the next free index.
static int bind_filter(sqlite3_stmt* stmt, int64_t from_unix, int64_t to_unix, const StatFilter& filter) {
    int idx = 1;
    sqlite3_bind_int64(stmt, idx++, from_unix);
    sqlite3_bind_int64(stmt, idx++, to_unix);
    if (!filter.template_id.empty())
        sqlite3_bind_text(stmt, idx++, filter.template_id.c_str(), -1, SQLITE_TRANSIENT);
    if (!filter.text.empty())
        sqlite3_bind_text(stmt, idx++, like_pattern(filter.text).c_str(), -1, SQLITE_TRANSIENT);
    return idx;
}

static vector<pair<string, int>> grouped_counts(const string& column, const string& extra,
                                                int64_t from_unix, int64_t to_unix, size_t limit,
                                                const StatFilter& filter) {
    vector<pair<string, int>> out;
    sqlite3_stmt* stmt = nullptr;
    string sql = "SELECT " + column + ", COUNT(*) AS n FROM tracking" + filter_clause(filter) + extra +
                 " GROUP BY " + column + " ORDER BY n DESC, " + column + " LIMIT ?";

    if (sqlite3_prepare_v2(g_db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fprintf(stderr, "[stats] Query error: %s\n", sqlite3_errmsg(g_db));
        return out;
    }

    int idx = bind_filter(stmt, from_unix, to_unix, filter);
    sqlite3_bind_int64(stmt, idx, (sqlite3_int64)limit);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        auto name_ptr = sqlite3_column_text(stmt, 0);
        string name   = name_ptr ? reinterpret_cast<const char*>(name_ptr) : "";
        out.emplace_back(name, sqlite3_column_int(stmt, 1));
    }
    sqlite3_finalize(stmt);
    return out;
}

// === DB init =================================================================

bool stat_init_db(const string& db_path) {
    lock_guard<mutex> lk(g_stats_mutex);

    if (g_db) {
        sqlite3_close(g_db);
        g_db = nullptr;
    }

    std::error_code ec;
    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    if (sqlite3_open(db_path.c_str(), &g_db) != SQLITE_OK) {
        fprintf(stderr, "[stats] Failed to open %s: %s\n", db_path.c_str(), sqlite3_errmsg(g_db));
        sqlite3_close(g_db);
        g_db = nullptr;
        return false;
    }

    // Enable WAL mode for better concurrent read performance
    sqlite3_exec(g_db, "PRAGMA journal_mode=WAL", nullptr, nullptr, nullptr);
    sqlite3_exec(g_db, "PRAGMA synchronous=NORMAL", nullptr, nullptr, nullptr);

    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS tracking (
            id          INTEGER PRIMARY KEY AUTOINCREMENT,
            ts          INTEGER NOT NULL,
            template_id TEXT    NOT NULL,
            text        TEXT    NOT NULL,
            vh          TEXT,
            url         TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_tracking_ts       ON tracking(ts);
        CREATE INDEX IF NOT EXISTS idx_tracking_template ON tracking(template_id);
    )";
    char* errmsg = nullptr;
    if (sqlite3_exec(g_db, schema, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        fprintf(stderr, "[stats] Schema error: %s\n", errmsg);
        sqlite3_free(errmsg);
        sqlite3_close(g_db);
        g_db = nullptr;
        return false;
    }

    // Databases created before the url column existed
    sqlite3_stmt* url_check = nullptr;
    if (sqlite3_prepare_v2(g_db, "SELECT url FROM tracking LIMIT 0", -1, &url_check, nullptr) != SQLITE_OK) {
        if (sqlite3_exec(g_db, "ALTER TABLE tracking ADD COLUMN url TEXT", nullptr, nullptr, &errmsg) != SQLITE_OK) {
            fprintf(stderr, "[stats] Migration error: %s\n", errmsg);
            sqlite3_free(errmsg);
        }
    }
    sqlite3_finalize(url_check);
    return true;
}

void stat_close_db() {
    lock_guard<mutex> lk(g_stats_mutex);
    if (g_db) {
        sqlite3_close(g_db);
        g_db = nullptr;
    }
}

// === Record ==================================================================

void stat_record_text(const string& template_id, const string& text, const string& referer, const string& url) {
    if (text.empty()) return;

    string vh = hash_referer(referer);
    lock_guard<mutex> lk(g_stats_mutex);
    if (!g_db) return;

    sqlite3_stmt* stmt = nullptr;
    const char* sql = "INSERT INTO tracking (ts, template_id, text, vh, url) VALUES (?,?,?,?,?)";
    if (sqlite3_prepare_v2(g_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fprintf(stderr, "[stats] Insert error: %s\n", sqlite3_errmsg(g_db));
        return;
    }

    sqlite3_bind_int64(stmt, 1, stat_now());
    sqlite3_bind_text(stmt,  2, template_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt,  3, text.c_str(),        -1, SQLITE_TRANSIENT);
    if (!vh.empty())
        sqlite3_bind_text(stmt, 4, vh.c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, 4);
    if (!url.empty())
        sqlite3_bind_text(stmt, 5, url.c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, 5);

    if (sqlite3_step(stmt) != SQLITE_DONE) {
        fprintf(stderr, "[stats] Insert failed: %s\n", sqlite3_errmsg(g_db));
    }
    sqlite3_finalize(stmt);
}

// === Query ===================================================================

StatSummary stat_query(int64_t from_unix, int64_t to_unix, size_t limit, const StatFilter& filter) {
    StatSummary s;
    lock_guard<mutex> lk(g_stats_mutex);
    if (!g_db) return s;

    sqlite3_stmt* stmt = nullptr;
    string count_sql = "SELECT COUNT(*) FROM tracking" + filter_clause(filter);
    if (sqlite3_prepare_v2(g_db, count_sql.c_str(), -1, &stmt, nullptr) == SQLITE_OK) {
        bind_filter(stmt, from_unix, to_unix, filter);
        if (sqlite3_step(stmt) == SQLITE_ROW) s.total = sqlite3_column_int(stmt, 0);
        sqlite3_finalize(stmt);
    }

    s.by_template = grouped_counts("template_id", "", from_unix, to_unix, limit, filter);
    s.by_text     = grouped_counts("text", "", from_unix, to_unix, limit, filter);
    s.by_url      = grouped_counts("url", " AND url IS NOT NULL AND url <> ''", from_unix, to_unix, limit, filter);
    return s;
}
