#pragma once
/**
 * Memeforge - Route registration
 */

#include <httplib.h>

#include "common.h"
#include "settings.h"
#include "templates.h"
#include "meta.h"
#include "tracking.h"
#include "images.h"

// Long-lived services shared by every handler. Owned by main().
struct AppContext {
    const Settings& settings;
    TemplateStore&  templates;
    MetaService&    meta;
    TrackingQueue&  tracker;
    RenderPool&     render_pool;
    Renderer        renderer;
};

// Absolute URL, query and lower-cased headers of an inbound request.
RequestInfo request_info(const httplib::Request& req);

void register_image_routes(httplib::Server& svr, AppContext& app);
void register_health_routes(httplib::Server& svr, AppContext& app);
