/**
 * Memeforge - Render pipeline implementation
 */

#include "pipeline.h"
#include "text.h"
#include "urls.h"

// Percent-encode what cannot appear raw in a Location header path.
static string encode_path(const string& path) {
    static const char* HEX = "0123456789ABCDEF";
    string out;

    for (unsigned char c : path) {
        if (c <= 0x20 || c >= 0x7F || c == '%' || c == '?' || c == '#') {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        } else {
            out += (char)c;
        }
    }
    return out;
}

string blank_path(const string& template_id, const string& extension) {
    return encode_path("/images/" + template_id + "." + extension);
}

string text_path(const string& template_id, const string& slug, const string& extension) {
    return encode_path("/images/" + template_id + "/" + slug + "." + extension);
}

// ─── Canonicalization gate ──────────────────────────────────────────────────

static optional<Redirect> animated_redirect(const string& gif_path, const string& extension,
                                            const QueryParams& params) {
    auto style = params.find("style");
    if (style == params.end() || style->second != "animated" || extension == "gif") return std::nullopt;

    return Redirect{url_clean(url_with_query(gif_path, params_without(params, "style"))), 301};
}

optional<Redirect> canonical_blank(const string& template_id, const string& extension,
                                   const QueryParams& params) {
    return animated_redirect(blank_path(template_id, "gif"), extension, params);
}

TextGate canonical_text(const MetaService& meta, const RequestInfo& info,
                        const string& template_id, const string& slug, const string& extension) {
    TextGate gate;

    gate.redirect = animated_redirect(text_path(template_id, slug, "gif"), extension, info.params);
    if (gate.redirect) return gate;

    auto [normalized, changed] = text_normalize(slug);
    if (changed) {
        gate.redirect = Redirect{url_clean(url_with_query(text_path(template_id, normalized, extension), info.params)), 301};
        return gate;
    }

    auto [tokenized, updated] = meta.tokenize(info, info.url);
    if (updated) {
        gate.redirect = Redirect{tokenized, 302};
        return gate;
    }

    auto [watermark, consumed] = meta.get_watermark(info);
    if (consumed) {
        QueryParams params = params_without(info.params, "watermark");
        gate.redirect = Redirect{url_clean(url_with_query(text_path(template_id, normalized, extension), params)), 302};
        return gate;
    }

    gate.slug = normalized;
    gate.watermark = watermark;
    return gate;
}

// ─── Resolution cascade ─────────────────────────────────────────────────────

bool slug_too_long(const Settings& s, const string& slug) {
    size_t start = 0;
    while (true) {
        auto pos = slug.find('/', start);
        size_t len = (pos == string::npos ? slug.size() : pos) - start;
        if (len > s.max_segment_bytes) return true;
        if (pos == string::npos) return false;
        start = pos + 1;
    }
}

static int parse_status(const string& raw) {
    int status = 200;
    if (!parse_int(raw, status) || status < 100 || status > 599) {
        cerr << "[Memeforge] Ignoring invalid status override: " << raw << endl;
        return 200;
    }
    return status;
}

static void use_error_template(const PipelineContext& ctx, ResolvedJob& job) {
    job.tmpl = ctx.templates.error_template();
    job.style = ctx.settings.default_style;
}

// Invalid styles fall back to the error template. A URL given as style is a
// client sending an image where a style name belongs (415); anything else is
// an unknown style (422) unless it is the placeholder.
static void validate_style(const PipelineContext& ctx, ResolvedJob& job) {
    if (ctx.templates.check(job.tmpl, job.style)) return;

    string style = job.style;
    use_error_template(ctx, job);

    if (url_schema(style)) job.status = 415;
    else if (!is_placeholder(ctx.settings, style)) job.status = 422;
}

static void resolve_custom(const PipelineContext& ctx, const RenderRequest& req, ResolvedJob& job) {
    const Settings& s = ctx.settings;
    optional<string> url = url_arg(req.params, {"background", "alt"});

    if (!url) {
        cerr << "[Memeforge] No image URL specified for custom template" << endl;
        use_error_template(ctx, job);
        job.status = 422;
        return;
    }

    job.tmpl = ctx.templates.create(*url);
    if (!job.tmpl.image_exists()) {
        cerr << "[Memeforge] Unable to download image URL: " << *url << endl;
        job.tmpl = ctx.templates.error_template();
        if (!is_placeholder(s, *url)) job.status = 415;
    }

    job.style = url_arg(req.params, s.default_style, {"style"});
    if (!url_schema(job.style)) job.style = to_lower(job.style);
    validate_style(ctx, job);
}

static void resolve_named(const PipelineContext& ctx, const RenderRequest& req, ResolvedJob& job) {
    const Settings& s = ctx.settings;
    optional<Template> found = ctx.templates.get_or_none(req.template_id);

    if (!found || !found->image_exists()) {
        cerr << "[Memeforge] No such template: " << req.template_id << endl;
        job.tmpl = ctx.templates.error_template();
        if (!is_placeholder(s, req.template_id)) job.status = 404;
    } else {
        job.tmpl = *found;
    }

    job.style = url_arg(req.params, s.default_style, {"style", "alt"});
    validate_style(ctx, job);
}

static void validate_size(const Settings& s, const QueryParams& params, ResolvedJob& job) {
    string raw_width  = url_arg(params, "0", {"width"});
    string raw_height = url_arg(params, "0", {"height"});
    int width = 0, height = 0;

    auto too_small = [&s](int v) { return v < 0 || (v > 0 && v < s.min_dimension); };

    if (!parse_int(raw_width, width) || !parse_int(raw_height, height) ||
        too_small(width) || too_small(height)) {
        cerr << "[Memeforge] Invalid size: " << raw_width << "x" << raw_height << endl;
        job.size = ImageSize{};
        job.status = 422;
        return;
    }

    job.size = ImageSize{width, height};
}

static void validate_extension(const Settings& s, ResolvedJob& job) {
    if (s.allowed_extensions.count(job.extension)) return;

    cerr << "[Memeforge] Invalid extension: " << job.extension << endl;
    job.extension = s.default_extension;
    job.status = 422;
}

ResolvedJob resolve_render_job(const PipelineContext& ctx, const RenderRequest& req) {
    const Settings& s = ctx.settings;
    ResolvedJob job;
    job.watermark = req.watermark;
    job.extension = req.extension;
    job.lines = text_decode(req.slug);

    if (ctx.tracker) {
        ctx.tracker->send(TrackEvent{req.template_id, job.lines, req.referer, req.url});
    }

    job.status = parse_status(url_arg(req.params, "200", {"status"}));

    if (slug_too_long(s, req.slug)) {
        cerr << "[Memeforge] Slug too long: " << req.slug.substr(0, 100) << "..." << endl;
        job.lines = text_decode(utf8_truncate(req.slug, s.truncate_chars) + "...");
        use_error_template(ctx, job);
        job.status = 414;
    } else if (req.template_id == s.custom_template) {
        resolve_custom(ctx, req, job);
    } else {
        resolve_named(ctx, req, job);
    }

    validate_size(s, req.params, job);
    validate_extension(s, job);
    return job;
}
