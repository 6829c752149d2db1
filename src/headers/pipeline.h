#pragma once
/**
 * Memeforge - Render pipeline
 *
 * Turns an image request into either a canonicalizing redirect or a
 * ResolvedJob: the template, style, lines, size and extension to render,
 * plus the status code the image is served with.
 *
 * Resolution never fails. Every problem is folded into the status code and,
 * for template or style problems, a substitution of the error template:
 *
 *   414  a "/" segment of the text slug is longer than max_segment_bytes
 *   404  unknown template, or its image is missing
 *   415  background download failed, or a URL style could not be used
 *   422  no background for "custom", invalid style, bad size or extension
 *
 * The placeholder value renders blank content without raising the status.
 */

#include "common.h"
#include "settings.h"
#include "templates.h"
#include "meta.h"
#include "tracking.h"

struct ImageSize {
    int width  = 0;   // 0 = natural size
    int height = 0;
};

struct RenderRequest {
    string      template_id;
    string      slug;
    string      watermark;
    string      extension;
    QueryParams params;
    string      referer;
    string      url;
};

struct ResolvedJob {
    Template       tmpl;
    string         style;
    vector<string> lines;
    string         watermark;
    string         extension;
    ImageSize      size;
    int            status = 200;
};

struct Redirect {
    string location;
    int    status = 302;
};

struct PipelineContext {
    const Settings& settings;
    TemplateStore&  templates;
    TrackingQueue*  tracker = nullptr;   // null = tracking disabled
};

// ─── Paths ──────────────────────────────────────────────────────────────────

string blank_path(const string& template_id, const string& extension);
string text_path(const string& template_id, const string& slug, const string& extension);

// ─── Canonicalization gate ──────────────────────────────────────────────────

// GET /images/{id}.{ext}: only the animated-style rewrite applies.
optional<Redirect> canonical_blank(const string& template_id, const string& extension,
                                   const QueryParams& params);

struct TextGate {
    optional<Redirect> redirect;   // set = answer with this and stop
    string slug;                   // canonical slug otherwise
    string watermark;              // watermark to render otherwise
};

// GET /images/{id}/{slug}.{ext}: animated rewrite, slug normalization,
// tokenization, then the watermark override, first redirect wins.
TextGate canonical_text(const MetaService& meta, const RequestInfo& info,
                        const string& template_id, const string& slug, const string& extension);

// ─── Resolution cascade ─────────────────────────────────────────────────────

bool slug_too_long(const Settings& s, const string& slug);

ResolvedJob resolve_render_job(const PipelineContext& ctx, const RenderRequest& req);
