/**
 * Memeforge - Meme image server
 * C++ Backend Server using cpp-httplib + ImageMagick
 */

#include "common.h"
#include "discord.h"
#include "images.h"
#include "meta.h"
#include "routes.h"
#include "settings.h"
#include "stats.h"
#include "templates.h"
#include "tracking.h"

#ifndef _WIN32
#include <unistd.h>
#endif

static string detect_hostname() {
    const char* env = std::getenv("HOSTNAME");
    if (env && *env) return env;
#ifdef _WIN32
    env = std::getenv("COMPUTERNAME");
    if (env && *env) return env;
#else
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) == 0) return buf;
#endif
    return "";
}

int main() {
    httplib::Server svr;

    Settings settings;
    try {
        settings = load_settings();
    } catch (const std::exception& e) {
        cerr << "[Memeforge] Invalid configuration: " << e.what() << endl;
        return 1;
    }

    // Try various paths for the templates folder
    if (!fs::exists(settings.templates_dir)) {
        if (fs::exists("../" + settings.templates_dir)) settings.templates_dir = "../" + settings.templates_dir;
        else if (fs::exists("../../" + settings.templates_dir)) settings.templates_dir = "../../" + settings.templates_dir;
    }
    std::error_code ec;
    fs::create_directories(settings.images_dir, ec);
    cout << "[Memeforge] Templates directory: " << fs::absolute(settings.templates_dir) << endl;
    cout << "[Memeforge] Images directory: " << fs::absolute(settings.images_dir) << endl;

    g_hostname = detect_hostname();

    // ── Find ImageMagick ────────────────────────────────────────────────────
    g_imagemagick_path = find_imagemagick();
    if (g_imagemagick_path.empty()) {
        cerr << "[Memeforge] WARNING: ImageMagick not found! Rendering will fail." << endl;
    } else {
        cout << "[Memeforge] ImageMagick found: " << g_imagemagick_path << endl;
    }

    // ── Find curl (custom backgrounds, remote tracking, webhooks) ──────────
    g_curl_path = find_curl();
    if (g_curl_path.empty()) {
        cerr << "[Memeforge] WARNING: curl not found. Custom backgrounds will fail." << endl;
    } else {
        cout << "[Memeforge] curl found: " << g_curl_path << endl;
    }

    // ── Tracking database ───────────────────────────────────────────────────
    if (!stat_init_db(settings.stats_db)) {
        cerr << "[Memeforge] WARNING: tracking disabled, cannot open " << settings.stats_db << endl;
        discord_log("Tracking disabled", "Cannot open `" + settings.stats_db + "`", 0xFEE75C);
    }

    TemplateStore templates(settings, make_curl_fetcher(settings.download_timeout_seconds));
    MetaService meta(settings, make_curl_poster(settings.remote_timeout_seconds));
    TrackingQueue tracker(make_stats_track_handler());
    RenderPool render_pool(settings.render_workers);

    AppContext app{
        settings, templates, meta, tracker, render_pool,
        [&settings](const ResolvedJob& job) { return render_meme(settings, job); }
    };

    svr.set_read_timeout(30, 0);
    svr.set_write_timeout(30, 0);

    // CORS headers
    svr.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, X-API-KEY");
        return httplib::Server::HandlerResponse::Unhandled;
    });

    svr.Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        string message = "Unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Non-standard exception";
        }
        cerr << "[Memeforge] Unhandled error on " << req.path << ": " << message << endl;
        discord_log_error(req.method + " " + req.path, message);
        res.status = 500;
        res.set_content(json({{"error", message}}).dump(), "application/json");
    });

    register_image_routes(svr, app);
    register_health_routes(svr, app);

    // ── Start the server ────────────────────────────────────────────────────
    size_t template_count = templates.list().size();

    cout << R"(
  ╔╦╗╔═╗╔╦╗╔═╗╔═╗╔═╗╦═╗╔═╗╔═╗
  ║║║║╣ ║║║║╣ ╠╣ ║ ║╠╦╝║ ╦║╣
  ╩ ╩╚═╝╩ ╩╚═╝╚  ╚═╝╩╚═╚═╝╚═╝
        Meme Image Server
)" << endl;

    cout << "[Memeforge] Server starting on http://localhost:" << settings.port << endl;
    cout << "[Memeforge] " << template_count << " templates, "
         << render_pool.worker_count() << " render workers" << endl;
    if (!settings.remote_tracking_url.empty()) {
        cout << "[Memeforge] Remote tracking: " << settings.remote_tracking_url << endl;
    }
    cout << "[Memeforge] Press Ctrl+C to stop" << endl;

    discord_log_server_start(settings.port, template_count);

    bool ok = svr.listen("0.0.0.0", settings.port);
    if (!ok) {
        cerr << "[Memeforge] Failed to start server on port " << settings.port << endl;
    }

    render_pool.stop();
    tracker.stop();
    stat_close_db();
    return ok ? 0 : 1;
}
