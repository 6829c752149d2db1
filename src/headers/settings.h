#pragma once
/**
 * Memeforge - Settings
 *
 * Every policy constant the pipeline consults. Loaded once at startup and
 * passed around by const reference; nothing reads ambient globals for these.
 *
 * Precedence: built-in defaults < JSON file named by MEMEFORGE_CONFIG < env vars.
 */

#include "common.h"

struct Settings {
    // Rendering policy
    set<string> allowed_extensions = {"gif", "jpg", "jpeg", "png", "webp"};
    string default_extension = "png";
    string default_style     = "default";
    string placeholder       = "string";   // always renders blank, never errors
    string error_template    = "_error";
    string custom_template   = "custom";   // sentinel id for ?background= memes

    size_t max_segment_bytes = 200;        // per "/" segment of a text slug
    size_t truncate_chars    = 50;         // oversize slugs are cut to this
    int    min_dimension     = 10;         // width/height below this are rejected

    // Attribution
    string default_watermark = "Memeforge";
    set<string> allowed_watermarks = {"Memeforge"};
    set<string> api_keys;                  // keys that disable the watermark locally
    string remote_tracking_url;            // empty = no remote tokenize/authenticate
    int    remote_timeout_seconds = 5;

    // Storage
    string templates_dir = "templates";
    string images_dir    = "images";
    string stats_db      = "tracking.db";

    // Server
    int    port           = 5000;
    int    render_workers = 2;
    int    download_timeout_seconds = 10;
};

// Built-in defaults overlaid with MEMEFORGE_CONFIG and environment variables.
Settings load_settings();

// Overlay keys of a JSON object onto `s`. Unknown keys are ignored.
void apply_settings_json(Settings& s, const json& j);

// Overlay the MEMEFORGE_* / PORT environment variables onto `s`.
void apply_settings_env(Settings& s);

bool is_placeholder(const Settings& s, const string& value);
