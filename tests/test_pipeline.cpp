#include <gtest/gtest.h>

#include "pipeline.h"
#include "test_helpers.h"

namespace {

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings = test_settings(tmp);
        fs::path root = settings.templates_dir;
        make_template(root, "drake", {"default.png", "wide.png"});
        make_template(root, "_error");
        fs::create_directories(root / "broken");

        store = std::make_unique<TemplateStore>(settings, [this](const string& url, const fs::path& dest) {
            fetched.push_back(url);
            if (url.find("bad.example") != string::npos) return false;
            touch_image(dest);
            return true;
        });
    }

    ResolvedJob resolve(const string& id, const string& slug, const string& ext, QueryParams params = {}) {
        RenderRequest req;
        req.template_id = id;
        req.slug = slug;
        req.extension = ext;
        req.params = std::move(params);
        PipelineContext ctx{settings, *store, nullptr};
        return resolve_render_job(ctx, req);
    }

    TempDir tmp;
    Settings settings;
    std::unique_ptr<TemplateStore> store;
    vector<string> fetched;
};

}  // namespace

// ─── Named templates ────────────────────────────────────────────────────────

TEST_F(PipelineTest, NamedTemplateRendersWithDefaults) {
    ResolvedJob job = resolve("drake", "abc_def/ghi", "png");
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.tmpl.id, "drake");
    EXPECT_EQ(job.style, "default");
    EXPECT_EQ(job.lines, (vector<string>{"abc def", "ghi"}));
    EXPECT_EQ(job.extension, "png");
    EXPECT_EQ(job.size.width, 0);
    EXPECT_EQ(job.size.height, 0);
}

TEST_F(PipelineTest, UnknownTemplateIs404WithErrorTemplate) {
    ResolvedJob job = resolve("nope", "hello", "png");
    EXPECT_EQ(job.status, 404);
    EXPECT_EQ(job.tmpl.id, "_error");
    EXPECT_EQ(job.lines, (vector<string>{"hello"}));
}

TEST_F(PipelineTest, TemplateWithoutImageIs404) {
    ResolvedJob job = resolve("broken", "", "png");
    EXPECT_EQ(job.status, 404);
    EXPECT_EQ(job.tmpl.id, "_error");
}

TEST_F(PipelineTest, PlaceholderTemplateRendersErrorTemplateQuietly) {
    ResolvedJob job = resolve("string", "", "png");
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.tmpl.id, "_error");
}

TEST_F(PipelineTest, NamedStyleAndAlias) {
    EXPECT_EQ(resolve("drake", "", "png", {{"style", "wide"}}).style, "wide");

    ResolvedJob alias = resolve("drake", "", "png", {{"alt", "wide"}});
    EXPECT_EQ(alias.status, 200);
    EXPECT_EQ(alias.style, "wide");
    EXPECT_EQ(alias.tmpl.id, "drake");
}

TEST_F(PipelineTest, UnknownStyleIs422WithErrorTemplate) {
    ResolvedJob job = resolve("drake", "", "png", {{"style", "bogus"}});
    EXPECT_EQ(job.status, 422);
    EXPECT_EQ(job.tmpl.id, "_error");
    EXPECT_EQ(job.style, "default");
    EXPECT_EQ(job.extension, "png");
}

TEST_F(PipelineTest, PlaceholderStyleDoesNotEscalate) {
    ResolvedJob job = resolve("drake", "", "png", {{"style", "string"}});
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.tmpl.id, "_error");
}

TEST_F(PipelineTest, UnusableUrlStyleIs415) {
    ResolvedJob job = resolve("drake", "top", "png", {{"style", "http://bad.example/hat.png"}});
    EXPECT_EQ(job.status, 415);
    EXPECT_EQ(job.tmpl.id, "_error");
}

TEST_F(PipelineTest, UrlStyleDownloadsOverlay) {
    ResolvedJob job = resolve("drake", "top", "png", {{"style", "https://img.example/hat.png"}});
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.tmpl.id, "drake");
    EXPECT_EQ(job.style, "https://img.example/hat.png");
    EXPECT_FALSE(job.tmpl.image_path(job.style).empty());
}

// ─── Custom backgrounds ─────────────────────────────────────────────────────

TEST_F(PipelineTest, CustomWithoutBackgroundIs422) {
    ResolvedJob job = resolve("custom", "hello", "png");
    EXPECT_EQ(job.status, 422);
    EXPECT_EQ(job.tmpl.id, "_error");
    EXPECT_EQ(job.style, "default");
    EXPECT_TRUE(fetched.empty());
}

TEST_F(PipelineTest, CustomWithFailedDownloadIs415) {
    ResolvedJob job = resolve("custom", "hello", "png", {{"background", "http://bad.example/x.png"}});
    EXPECT_EQ(job.status, 415);
    EXPECT_EQ(job.tmpl.id, "_error");
    EXPECT_EQ(fetched, (vector<string>{"http://bad.example/x.png"}));
}

TEST_F(PipelineTest, CustomPlaceholderBackgroundDoesNotEscalate) {
    ResolvedJob job = resolve("custom", "", "png", {{"background", "string"}});
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.tmpl.id, "_error");
}

TEST_F(PipelineTest, CustomBackgroundFromAlias) {
    ResolvedJob job = resolve("custom", "hi", "jpg", {{"alt", "https://img.example/cat.jpg"}});
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.tmpl.id, "_custom-" + fingerprint("https://img.example/cat.jpg"));
    EXPECT_TRUE(job.tmpl.image_exists());
    EXPECT_EQ(job.style, "default");
}

TEST_F(PipelineTest, CustomStyleIsLowercased) {
    ResolvedJob job = resolve("custom", "", "png",
                              {{"background", "https://img.example/cat.png"}, {"style", "DEFAULT"}});
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.style, "default");
    EXPECT_EQ(job.tmpl.id.rfind("_custom-", 0), 0u);
}

// ─── Oversize slugs ─────────────────────────────────────────────────────────

TEST_F(PipelineTest, OversizeSegmentIs414) {
    string slug = "top/" + string(201, 'a');
    ResolvedJob job = resolve("drake", slug, "png", {{"style", "wide"}});
    EXPECT_EQ(job.status, 414);
    EXPECT_EQ(job.tmpl.id, "_error");
    EXPECT_EQ(job.style, "default");
    EXPECT_EQ(job.lines, (vector<string>{"top", string(46, 'a') + "..."}));
}

TEST_F(PipelineTest, SegmentAtLimitIsAccepted) {
    ResolvedJob job = resolve("drake", string(200, 'a'), "png");
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.tmpl.id, "drake");
    EXPECT_FALSE(slug_too_long(settings, string(200, 'a') + "/" + string(200, 'b')));
    EXPECT_TRUE(slug_too_long(settings, "x/" + string(201, 'b')));
}

// ─── Size and extension ─────────────────────────────────────────────────────

TEST_F(PipelineTest, SmallWidthIs422WithoutErrorTemplate) {
    ResolvedJob job = resolve("drake", "abc_def", "gif", {{"width", "5"}});
    EXPECT_EQ(job.status, 422);
    EXPECT_EQ(job.tmpl.id, "drake");
    EXPECT_EQ(job.size.width, 0);
    EXPECT_EQ(job.size.height, 0);
    EXPECT_EQ(job.extension, "gif");
}

TEST_F(PipelineTest, InvalidSizesResetBothDimensions) {
    for (const QueryParams& params : vector<QueryParams>{
             {{"width", "300"}, {"height", "9"}},
             {{"width", "abc"}},
             {{"height", "-20"}},
             {{"width", "1"}}}) {
        ResolvedJob job = resolve("drake", "", "png", params);
        EXPECT_EQ(job.status, 422);
        EXPECT_EQ(job.size.width, 0);
        EXPECT_EQ(job.size.height, 0);
    }
}

TEST_F(PipelineTest, ValidSizeIsKept) {
    ResolvedJob job = resolve("drake", "", "png", {{"width", "10"}, {"height", "600"}});
    EXPECT_EQ(job.status, 200);
    EXPECT_EQ(job.size.width, 10);
    EXPECT_EQ(job.size.height, 600);
}

TEST_F(PipelineTest, DisallowedExtensionFallsBackTo422) {
    ResolvedJob job = resolve("drake", "", "bmp");
    EXPECT_EQ(job.status, 422);
    EXPECT_EQ(job.extension, "png");
    EXPECT_EQ(job.tmpl.id, "drake");
}

TEST_F(PipelineTest, SizeFailureKeepsTemplateFailureSubstitution) {
    ResolvedJob job = resolve("nope", "", "png", {{"width", "3"}});
    EXPECT_EQ(job.status, 422);
    EXPECT_EQ(job.tmpl.id, "_error");
}

// ─── Status override ────────────────────────────────────────────────────────

TEST_F(PipelineTest, StatusOverride) {
    EXPECT_EQ(resolve("drake", "", "png", {{"status", "201"}}).status, 201);
    EXPECT_EQ(resolve("drake", "", "png", {{"status", "abc"}}).status, 200);
    EXPECT_EQ(resolve("drake", "", "png", {{"status", "1000"}}).status, 200);
    EXPECT_EQ(resolve("nope", "", "png", {{"status", "201"}}).status, 404);
}

// ─── Tracking ───────────────────────────────────────────────────────────────

TEST_F(PipelineTest, ResolutionSendsTrackingEvent) {
    auto events = std::make_shared<vector<TrackEvent>>();
    auto events_mutex = std::make_shared<mutex>();
    TrackingQueue tracker([events, events_mutex](const TrackEvent& e) {
        lock_guard<mutex> lock(*events_mutex);
        events->push_back(e);
    });

    RenderRequest req;
    req.template_id = "drake";
    req.slug = "top/bottom";
    req.extension = "png";
    req.referer = "http://blog.example/post";
    req.url = "http://h/images/drake/top/bottom.png";
    PipelineContext ctx{settings, *store, &tracker};
    resolve_render_job(ctx, req);
    tracker.stop();

    ASSERT_EQ(events->size(), 1u);
    EXPECT_EQ(events->at(0).template_id, "drake");
    EXPECT_EQ(events->at(0).lines, (vector<string>{"top", "bottom"}));
    EXPECT_EQ(events->at(0).referer, "http://blog.example/post");
    EXPECT_EQ(events->at(0).url, "http://h/images/drake/top/bottom.png");
}
