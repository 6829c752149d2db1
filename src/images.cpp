/**
 * Memeforge - Renderer implementation
 */

#include "images.h"

// ImageMagick expands "%" escapes and reads "@file" in annotate text
static string annotate_text(const string& text) {
    string out;
    for (char c : text) {
        if (c == '%') out += "%%";
        else if (c == '\\') out += "\\\\";
        else out += c;
    }
    if (!out.empty() && out[0] == '@') out.insert(out.begin(), '\\');
    return out;
}

fs::path render_cache_path(const Settings& s, const ResolvedJob& job) {
    string key = job.tmpl.id + "\x1f" + job.style + "\x1f" + job.watermark + "\x1f" +
                 to_string(job.size.width) + "x" + to_string(job.size.height);
    for (const auto& line : job.lines) key += "\x1e" + line;
    return fs::path(s.images_dir) / (fingerprint(key) + "." + job.extension);
}

string build_render_command(const ResolvedJob& job, const fs::path& background, const string& output) {
    bool animated = job.extension == "gif" && to_lower(background.extension().string()) == ".gif";

    string cmd = imagemagick_cmd() + " " + escape_arg(background.string() + (animated ? "" : "[0]"));
    if (animated) cmd += " -coalesce";

    if (job.size.width > 0 || job.size.height > 0) {
        string geometry = (job.size.width > 0 ? to_string(job.size.width) : "") +
                          (job.size.height > 0 ? "x" + to_string(job.size.height) : "");
        cmd += " -resize " + escape_arg(geometry + (job.size.width > 0 && job.size.height > 0 ? "!" : ""));
    }

    int pointsize = job.size.height > 0 ? std::max(12, job.size.height / 10) : 48;
    cmd += " -fill white -stroke black -strokewidth 2 -pointsize " + to_string(pointsize);

    // First line on top, last on the bottom, any others stacked in the middle
    size_t n = job.lines.size();
    for (size_t i = 0; i < n; i++) {
        if (job.lines[i].empty()) continue;
        string gravity = "Center";
        int offset = 0;
        if (i == 0) { gravity = "North"; offset = 10; }
        else if (i + 1 == n) { gravity = "South"; offset = 10; }
        else offset = (int)(((double)i - (double)(n - 1) / 2.0) * pointsize);

        string pos = (offset >= 0 ? "+0+" : "+0") + to_string(offset);
        cmd += " -gravity " + gravity + " -annotate " + pos + " " + escape_arg(annotate_text(job.lines[i]));
    }

    if (!job.watermark.empty()) {
        cmd += " -stroke none -fill " + escape_arg("rgba(255,255,255,0.6)") +
               " -pointsize 14 -gravity SouthEast -annotate +6+4 " + escape_arg(annotate_text(job.watermark));
    }

    if (animated) cmd += " -layers Optimize";
    cmd += " " + escape_arg(job.extension + ":" + output);
    return cmd;
}

RenderResult render_meme(const Settings& s, const ResolvedJob& job) {
    RenderResult result;
    fs::path out = render_cache_path(s, job);

    std::error_code ec;
    if (fs::exists(out, ec) && fs::file_size(out, ec) > 0) {
        result.ok = true;
        result.path = out.string();
        return result;
    }

    fs::path background = job.tmpl.image_path(job.style, job.extension == "gif");
    if (background.empty()) {
        result.error = "No background image for template: " + job.tmpl.id;
        return result;
    }

    fs::create_directories(out.parent_path(), ec);
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    fs::path tmp = out;
    tmp.replace_filename(out.stem().string() + ".tmp-" + tid.str() + out.extension().string());

    string cmd = build_render_command(job, background, tmp.string());
    cout << "[Memeforge] Render: " << cmd << endl;
    int code;
    string output = exec_command(cmd, code);

    if (code != 0 || !fs::exists(tmp, ec) || fs::file_size(tmp, ec) == 0) {
        fs::remove(tmp, ec);
        result.error = "ImageMagick failed (" + to_string(code) + "): " + output.substr(0, 300);
        return result;
    }

    fs::rename(tmp, out, ec);
    if (ec) {
        fs::remove(tmp, ec);
        result.error = "Unable to store render: " + ec.message();
        return result;
    }

    result.ok = true;
    result.path = out.string();
    return result;
}

// ─── RenderPool ─────────────────────────────────────────────────────────────

RenderPool::RenderPool(int workers) {
    if (workers < 1) workers = 1;
    for (int i = 0; i < workers; i++) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
}

RenderPool::~RenderPool() {
    stop();
}

std::future<RenderResult> RenderPool::submit(function<RenderResult()> task) {
    std::packaged_task<RenderResult()> job(std::move(task));
    auto future = job.get_future();
    {
        lock_guard<mutex> lock(queue_mutex_);
        if (stopping_) {
            std::promise<RenderResult> rejected;
            rejected.set_value(RenderResult{false, "", "Render pool is shutting down"});
            return rejected.get_future();
        }
        queue_.push(std::move(job));
    }
    available_.notify_one();
    return future;
}

void RenderPool::stop() {
    {
        lock_guard<mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    available_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void RenderPool::worker_loop() {
    while (true) {
        std::packaged_task<RenderResult()> job;
        {
            std::unique_lock<mutex> lock(queue_mutex_);
            available_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop();
        }
        job();   // exceptions land in the future
    }
}
