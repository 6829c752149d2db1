/**
 * Memeforge - Discord webhook logging implementation
 * Operational events are posted as embeds; delivery never blocks a request.
 */

#include "discord.h"

static const string& webhook_url() {
    static const string url = [] {
        const char* env = std::getenv("DISCORD_WEBHOOK_URL");
        return string(env ? env : "");
    }();
    return url;
}

static string utc_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm gmt{};
#ifdef _WIN32
    gmtime_s(&gmt, &t);
#else
    gmtime_r(&t, &gmt);
#endif
    char out[32];
    std::strftime(out, sizeof(out), "%Y-%m-%dT%H:%M:%SZ", &gmt);
    return out;
}

// Detached so a slow webhook never holds an HTTP worker
static void post_embed(json embed) {
    const string& url = webhook_url();
    if (url.empty()) return;

    embed["timestamp"] = utc_timestamp();
    embed["footer"] = {{"text", g_hostname.empty() ? string("Memeforge") : "Memeforge on " + g_hostname}};
    json payload = {{"username", "Memeforge"}, {"embeds", json::array({embed})}};

    thread([url, payload]() {
        try {
            HttpReply reply = curl_post_json(url, payload, {}, 10);
            if (reply.status < 200 || reply.status >= 300) {
                cerr << "[Memeforge] Discord webhook answered " << reply.status << endl;
            }
        } catch (const std::exception& e) {
            cerr << "[Memeforge] Discord webhook failed: " << e.what() << endl;
        }
    }).detach();
}

static json field(const string& name, const string& value, bool inline_field = true) {
    return {{"name", name}, {"value", value}, {"inline", inline_field}};
}

void discord_log(const string& title, const string& description, int color) {
    post_embed({{"title", title}, {"description", description}, {"color", color}});
}

void discord_log_error(const string& context, const string& error) {
    post_embed({
        {"title", "Request failed"},
        {"color", 0xED4245},
        {"fields", json::array({
            field("Request", "`" + context + "`", false),
            field("Error", error.substr(0, 1000), false)
        })}
    });
}

void discord_log_server_start(int port, size_t template_count) {
    post_embed({
        {"title", "Memeforge online"},
        {"color", 0x57F287},
        {"fields", json::array({
            field("Port", to_string(port)),
            field("Templates", to_string(template_count)),
            field("ImageMagick", g_imagemagick_path.empty() ? "missing" : g_imagemagick_path),
            field("curl", g_curl_path.empty() ? "missing" : g_curl_path)
        })}
    });
}
