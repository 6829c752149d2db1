/**
 * Memeforge - Image route handlers
 * GET /images/, POST /images/, POST /images/automatic, GET|POST /images/custom,
 * GET /images/{id}.{ext}, GET /images/{id}/{text}.{ext}, GET /health
 */

#include "common.h"
#include "discord.h"
#include "pipeline.h"
#include "routes.h"
#include "stats.h"
#include "text.h"
#include "urls.h"

static string base_url(const httplib::Request& req) {
    string scheme = req.get_header_value("X-Forwarded-Proto");
    if (scheme.empty()) scheme = "http";
    string host = req.get_header_value("Host");
    if (host.empty()) host = "localhost";
    return scheme + "://" + host;
}

RequestInfo request_info(const httplib::Request& req) {
    RequestInfo info;
    info.url = base_url(req) + (req.target.empty() ? req.path : req.target);
    info.params = QueryParams(req.params.begin(), req.params.end());
    for (const auto& [name, value] : req.headers) {
        info.headers.emplace(to_lower(name), value);
    }
    return info;
}

static void json_error(httplib::Response& res, int status, const string& message) {
    res.status = status;
    res.set_content(json({{"error", message}}).dump(), "application/json");
}

// ─── Rendering ──────────────────────────────────────────────────────────────

static void serve_image(AppContext& app, const RenderRequest& request, httplib::Response& res) {
    PipelineContext ctx{app.settings, app.templates, &app.tracker};
    ResolvedJob job = resolve_render_job(ctx, request);

    Renderer renderer = app.renderer;
    auto pending = app.render_pool.submit([renderer, job]() { return renderer(job); });

    RenderResult result;
    try {
        result = pending.get();
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
    }

    if (!result.ok) {
        cerr << "[Memeforge] Render failed for " << job.tmpl.id << ": " << result.error << endl;
        discord_log_error("Render " + job.tmpl.id, result.error);
        json_error(res, 500, "Unable to render image");
        return;
    }

    string data = read_file_binary(result.path);
    if (data.empty()) {
        json_error(res, 500, "Failed to read rendered image");
        return;
    }

    res.status = job.status;
    res.set_content(data, mime_from_ext(job.extension));
}

// ─── URL generation (POST /images/, POST /images/custom) ───────────────────

static json request_payload(const httplib::Request& req) {
    string content_type = req.get_header_value("Content-Type");
    if (content_type.find("application/x-www-form-urlencoded") == string::npos &&
        content_type.find("multipart/form-data") == string::npos) {
        return req.body.empty() ? json::object() : json::parse(req.body);
    }

    json payload = json::object();
    for (const auto& [key, value] : req.params) {
        bool list = key.size() > 2 && key.compare(key.size() - 2, 2, "[]") == 0;
        string name = list ? key.substr(0, key.size() - 2) : key;
        if (list) {
            if (!payload.contains(name)) payload[name] = json::array();
            payload[name].push_back(value);
        } else {
            payload[name] = value;
        }
    }
    return payload;
}

static void generate_url(AppContext& app, const httplib::Request& req, httplib::Response& res,
                         bool template_id_required) {
    const Settings& s = app.settings;
    json payload;

    try {
        payload = request_payload(req);
    } catch (const std::exception& e) {
        json_error(res, 400, string("Invalid request body: ") + e.what());
        return;
    }
    if (!payload.is_object()) {
        json_error(res, 400, "Request body must be an object");
        return;
    }

    string template_id = json_str(payload, "template_id");
    if (template_id.empty()) {
        if (template_id_required) {
            json_error(res, 400, "\"template_id\" is required");
            return;
        }
        template_id = s.custom_template;
    }

    vector<string> lines;
    if (payload.contains("text_lines") && payload["text_lines"].is_array()) {
        for (const auto& line : payload["text_lines"]) {
            lines.push_back(line.is_string() ? line.get<string>() : line.dump());
        }
    }

    string style;
    if (payload.contains("style") && payload["style"].is_array()) {
        vector<string> styles;
        for (const auto& item : payload["style"]) {
            if (item.is_string() && !item.get<string>().empty()) styles.push_back(item.get<string>());
        }
        if (styles.size() > 1) {
            json_error(res, 400, "Only one \"style\" is supported");
            return;
        }
        if (!styles.empty()) style = styles.front();
    } else {
        style = json_str(payload, "style", json_str(payload, "alt"));
    }

    string extension  = json_str(payload, "extension", s.default_extension);
    string background = json_str(payload, "background");
    bool   redirect   = json_bool(payload, "redirect", false);

    if (template_id != s.custom_template && !app.templates.get_or_none(template_id)) {
        json_error(res, 404, "Template not found: " + template_id);
        return;
    }

    QueryParams params;
    if (!style.empty() && style != s.default_style) params.emplace("style", style);
    if (template_id == s.custom_template && !background.empty()) params.emplace("background", background);

    RequestInfo info = request_info(req);
    string url = base_url(req) + url_with_query(text_path(template_id, text_encode(lines), extension), params);
    url = app.meta.tokenize(info, url).first;

    if (redirect) {
        res.set_redirect(url_add(url, {{"status", "201"}}), 302);
        return;
    }

    res.status = 201;
    res.set_content(json({{"url", url}}).dump(), "application/json");
}

// ─── Search (POST /images/automatic, GET /images/custom) ───────────────────

static const size_t CUSTOM_LIST_LIMIT = 20;

static void automatic_url(AppContext& app, const httplib::Request& req, httplib::Response& res) {
    json payload;
    try {
        payload = request_payload(req);
    } catch (const std::exception& e) {
        json_error(res, 400, string("Invalid request body: ") + e.what());
        return;
    }

    string query = payload.is_object() ? json_str(payload, "text") : "";
    if (query.empty()) {
        json_error(res, 400, "\"text\" is required");
        return;
    }

    RequestInfo info = request_info(req);
    auto results = app.meta.search(info, query, json_bool(payload, "safe", true));
    cout << "[Memeforge] Found " << results.size() << " result(s) for: " << query << endl;
    if (results.empty()) {
        res.status = 404;
        res.set_content(json({{"message", "No results matched: " + query}}).dump(), "application/json");
        return;
    }

    string url = app.meta.tokenize(info, url_clean(results[0].image_url)).first;
    if (json_bool(payload, "redirect", false)) {
        res.set_redirect(url_add(url, {{"status", "201"}}), 302);
        return;
    }

    res.status = 201;
    res.set_content(json({{"url", url}, {"confidence", results[0].confidence}}).dump(), "application/json");
}

// Popular custom memes: the remote search index when configured, else the
// URLs tracked locally for the custom template.
static void list_custom(AppContext& app, const httplib::Request& req, httplib::Response& res) {
    RequestInfo info = request_info(req);
    string query = to_lower(req.get_param_value("filter"));
    bool safe = url_flag(info.params, "safe", true);

    vector<string> urls;
    if (!app.settings.remote_tracking_url.empty()) {
        for (const auto& result : app.meta.search(info, query, safe, "results")) {
            urls.push_back(url_clean(result.image_url));
        }
    } else {
        StatFilter filter{app.settings.custom_template, query};
        for (const auto& entry : stat_query(0, stat_now(), CUSTOM_LIST_LIMIT, filter).by_url) {
            urls.push_back(entry.first);
        }
    }

    cout << "[Memeforge] Found " << urls.size() << " custom meme(s) for: " << query << endl;
    if (urls.empty()) {
        res.status = 404;
        res.set_content(json({{"message", "No results matched: " + query}}).dump(), "application/json");
        return;
    }

    json items = json::array();
    for (const auto& url : urls) {
        items.push_back({{"url", app.meta.tokenize(info, url).first}});
    }
    res.set_content(items.dump(), "application/json");
}

// ─── Registration ───────────────────────────────────────────────────────────

void register_image_routes(httplib::Server& svr, AppContext& app) {

    // ── GET /images/ - list example memes ───────────────────────────────────
    svr.Get(R"(/images/?)", [&app](const httplib::Request& req, httplib::Response& res) {
        string filter = to_lower(req.get_param_value("filter"));
        string base = base_url(req);
        json items = json::array();

        for (const auto& t : app.templates.list()) {
            if (t.example.empty() || !t.image_exists()) continue;

            string haystack = t.id + " " + t.name;
            for (const auto& line : t.example) haystack += " " + line;
            if (!filter.empty() && to_lower(haystack).find(filter) == string::npos) continue;

            items.push_back({
                {"url", base + text_path(t.id, text_encode(t.example), app.settings.default_extension)},
                {"template", t.id}
            });
        }

        res.set_content(items.dump(), "application/json");
    });

    // ── POST /images/ - create a meme URL from a template ───────────────────
    svr.Post(R"(/images/?)", [&app](const httplib::Request& req, httplib::Response& res) {
        generate_url(app, req, res, true);
    });

    // ── POST /images/automatic - find a meme for a phrase ───────────────────
    svr.Post("/images/automatic", [&app](const httplib::Request& req, httplib::Response& res) {
        automatic_url(app, req, res);
    });

    // ── GET /images/custom - popular custom memes ───────────────────────────
    svr.Get("/images/custom", [&app](const httplib::Request& req, httplib::Response& res) {
        list_custom(app, req, res);
    });

    // ── POST /images/custom - create a meme URL from any image ──────────────
    svr.Post("/images/custom", [&app](const httplib::Request& req, httplib::Response& res) {
        generate_url(app, req, res, false);
    });

    // ── GET /images/{id}.{ext} - template background ────────────────────────
    svr.Get(R"(/images/([^/]+)\.(\w+))", [&app](const httplib::Request& req, httplib::Response& res) {
        string template_id = req.matches[1];
        string extension   = req.matches[2];
        QueryParams params(req.params.begin(), req.params.end());

        if (auto redirect = canonical_blank(template_id, extension, params)) {
            res.set_redirect(redirect->location, redirect->status);
            return;
        }

        RenderRequest request;
        request.template_id = template_id;
        request.extension   = extension;
        request.params      = params;
        request.referer     = req.get_header_value("Referer");
        request.url         = base_url(req) + req.target;
        serve_image(app, request, res);
    });

    // ── GET /images/{id}/{text}.{ext} - meme with overlay text ──────────────
    svr.Get(R"(/images/([^/]+)/([^/].*)\.(\w+))", [&app](const httplib::Request& req, httplib::Response& res) {
        string template_id = req.matches[1];
        string slug        = req.matches[2];
        string extension   = req.matches[3];
        RequestInfo info   = request_info(req);

        TextGate gate = canonical_text(app.meta, info, template_id, slug, extension);
        if (gate.redirect) {
            res.set_redirect(gate.redirect->location, gate.redirect->status);
            return;
        }

        RenderRequest request;
        request.template_id = template_id;
        request.slug        = gate.slug;
        request.watermark   = gate.watermark;
        request.extension   = extension;
        request.params      = info.params;
        request.referer     = req.get_header_value("Referer");
        request.url         = info.url;
        serve_image(app, request, res);
    });
}

void register_health_routes(httplib::Server& svr, AppContext& app) {
    svr.Get("/health", [&app](const httplib::Request&, httplib::Response& res) {
        json body = {
            {"status", "ok"},
            {"templates", app.templates.list().size()},
            {"render_workers", app.render_pool.worker_count()}
        };
        res.set_content(body.dump(), "application/json");
    });
}
