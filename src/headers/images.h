#pragma once
/**
 * Memeforge - Renderer
 *
 * Composes a ResolvedJob into an image file with ImageMagick and caches it
 * under images_dir. Rendering is CPU-bound, so the server runs it on a
 * RenderPool instead of the HTTP worker threads.
 */

#include "common.h"
#include "settings.h"
#include "pipeline.h"
#include <condition_variable>
#include <future>
#include <queue>

struct RenderResult {
    bool   ok = false;
    string path;
    string error;
};

using Renderer = function<RenderResult(const ResolvedJob&)>;

// Cache file for a job: images_dir/<fingerprint>.<extension>
fs::path render_cache_path(const Settings& s, const ResolvedJob& job);

// ImageMagick command line that writes `job` to `output`.
string build_render_command(const ResolvedJob& job, const fs::path& background, const string& output);

// Render with ImageMagick, reusing a cached file when present.
RenderResult render_meme(const Settings& s, const ResolvedJob& job);

class RenderPool {
public:
    explicit RenderPool(int workers);
    ~RenderPool();

    RenderPool(const RenderPool&) = delete;
    RenderPool& operator=(const RenderPool&) = delete;

    std::future<RenderResult> submit(function<RenderResult()> task);
    void stop();

    int worker_count() const { return (int)threads_.size(); }

private:
    void worker_loop();

    mutex queue_mutex_;
    std::condition_variable available_;
    std::queue<std::packaged_task<RenderResult()>> queue_;
    bool stopping_ = false;
    vector<thread> threads_;
};
