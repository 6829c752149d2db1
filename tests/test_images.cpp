#include <gtest/gtest.h>

#include "images.h"
#include "test_helpers.h"

namespace {

ResolvedJob sample_job() {
    ResolvedJob job;
    job.tmpl.id = "drake";
    job.style = "default";
    job.lines = {"top", "bottom"};
    job.watermark = "Memeforge";
    job.extension = "png";
    return job;
}

bool contains(const string& haystack, const string& needle) {
    return haystack.find(needle) != string::npos;
}

}  // namespace

TEST(RenderCachePath, DependsOnEveryRenderInput) {
    Settings s;
    s.images_dir = "/srv/images";
    ResolvedJob job = sample_job();
    string base = render_cache_path(s, job).string();

    EXPECT_EQ(fs::path(base).parent_path().string(), "/srv/images");
    EXPECT_EQ(fs::path(base).extension().string(), ".png");
    EXPECT_EQ(render_cache_path(s, job).string(), base);

    ResolvedJob other = job;
    other.lines = {"top", "changed"};
    EXPECT_NE(render_cache_path(s, other).string(), base);

    other = job;
    other.watermark = "";
    EXPECT_NE(render_cache_path(s, other).string(), base);

    other = job;
    other.size = ImageSize{300, 0};
    EXPECT_NE(render_cache_path(s, other).string(), base);

    // Line boundaries are part of the key
    other = job;
    other.lines = {"topbottom"};
    EXPECT_NE(render_cache_path(s, other).string(), base);
}

TEST(BuildRenderCommand, StaticImage) {
    g_imagemagick_path.clear();
    string cmd = build_render_command(sample_job(), "/t/drake/default.png", "/out/x.png");

    EXPECT_EQ(cmd.rfind("convert '/t/drake/default.png[0]'", 0), 0u);
    EXPECT_TRUE(contains(cmd, "-pointsize 48"));
    EXPECT_TRUE(contains(cmd, "-gravity North -annotate +0+10 'top'"));
    EXPECT_TRUE(contains(cmd, "-gravity South -annotate +0+10 'bottom'"));
    EXPECT_TRUE(contains(cmd, "-gravity SouthEast -annotate +6+4 'Memeforge'"));
    EXPECT_FALSE(contains(cmd, "-resize"));
    EXPECT_FALSE(contains(cmd, "-coalesce"));
    EXPECT_EQ(cmd.substr(cmd.size() - 16), "'png:/out/x.png'");
}

TEST(BuildRenderCommand, ResizeAndPointsize) {
    ResolvedJob job = sample_job();
    job.size = ImageSize{300, 200};
    string cmd = build_render_command(job, "/t/drake/default.png", "/out/x.png");
    EXPECT_TRUE(contains(cmd, "-resize '300x200!'"));
    EXPECT_TRUE(contains(cmd, "-pointsize 20"));

    job.size = ImageSize{300, 0};
    cmd = build_render_command(job, "/t/drake/default.png", "/out/x.png");
    EXPECT_TRUE(contains(cmd, "-resize '300'"));

    job.size = ImageSize{0, 50};
    cmd = build_render_command(job, "/t/drake/default.png", "/out/x.png");
    EXPECT_TRUE(contains(cmd, "-resize 'x50'"));
    EXPECT_TRUE(contains(cmd, "-pointsize 12"));
}

TEST(BuildRenderCommand, AnimatedGifKeepsFrames) {
    ResolvedJob job = sample_job();
    job.extension = "gif";
    string cmd = build_render_command(job, "/t/party/default.gif", "/out/x.gif");
    EXPECT_TRUE(contains(cmd, "'/t/party/default.gif' -coalesce"));
    EXPECT_TRUE(contains(cmd, "-layers Optimize"));
    EXPECT_FALSE(contains(cmd, "[0]"));
}

TEST(BuildRenderCommand, TextIsEscaped) {
    ResolvedJob job = sample_job();
    job.lines = {"100%", "", "it's", "@file"};
    job.watermark = "";
    string cmd = build_render_command(job, "/t/drake/default.png", "/out/x.png");

    EXPECT_TRUE(contains(cmd, "-annotate +0+10 '100%%'"));
    EXPECT_TRUE(contains(cmd, "'it'\\''s'"));
    EXPECT_TRUE(contains(cmd, "'\\@file'"));
    EXPECT_FALSE(contains(cmd, "SouthEast"));
}

TEST(RenderMeme, ReusesCachedFile) {
    TempDir tmp;
    Settings s = test_settings(tmp);
    ResolvedJob job = sample_job();

    fs::path cached = render_cache_path(s, job);
    touch_image(cached);

    RenderResult result = render_meme(s, job);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.path, cached.string());
}

TEST(RenderMeme, MissingBackgroundFails) {
    TempDir tmp;
    Settings s = test_settings(tmp);
    ResolvedJob job = sample_job();
    job.tmpl.directory = tmp.path() / "templates" / "drake";

    RenderResult result = render_meme(s, job);
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(contains(result.error, "drake"));
}

TEST(RenderPool, RunsSubmittedTasks) {
    RenderPool pool(3);
    EXPECT_EQ(pool.worker_count(), 3);

    vector<std::future<RenderResult>> results;
    for (int i = 0; i < 10; i++) {
        results.push_back(pool.submit([i]() { return RenderResult{true, "/img/" + to_string(i), ""}; }));
    }
    for (int i = 0; i < 10; i++) {
        RenderResult r = results[i].get();
        EXPECT_TRUE(r.ok);
        EXPECT_EQ(r.path, "/img/" + to_string(i));
    }
}

TEST(RenderPool, ExceptionsReachTheCaller) {
    RenderPool pool(1);
    auto pending = pool.submit([]() -> RenderResult { throw std::runtime_error("magick crashed"); });
    EXPECT_THROW(pending.get(), std::runtime_error);
}

TEST(RenderPool, RejectsWorkAfterStop) {
    RenderPool pool(0);
    EXPECT_EQ(pool.worker_count(), 1);
    pool.stop();

    RenderResult r = pool.submit([]() { return RenderResult{true, "x", ""}; }).get();
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.error.empty());
}
