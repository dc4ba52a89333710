#include <gtest/gtest.h>
#include <streamview/player/file_surface.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace streamview::player::test {

class FileSurfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() / "streamview_surface_test.ts";
        std::filesystem::remove(path);
    }

    void TearDown() override {
        std::filesystem::remove(path);
    }

    void record(FileSurface& surface) {
        surface.subscribe([this](SurfaceEvent event, const std::string&) {
            events.push_back(event);
        });
    }

    std::filesystem::path path;
    std::vector<SurfaceEvent> events;
};

TEST_F(FileSurfaceTest, AttachStreamReportsPlayback) {
    FileSurface surface;
    record(surface);

    auto stream = std::make_shared<peer::MediaStream>();
    stream->id = "remote";
    stream->track_kinds = {"video"};
    surface.attachStream(stream);

    EXPECT_EQ(surface.stream(), stream);
    std::vector<SurfaceEvent> expected = {SurfaceEvent::LoadStart, SurfaceEvent::DataLoaded, SurfaceEvent::Playing};
    EXPECT_EQ(events, expected);
}

TEST_F(FileSurfaceTest, AppendWritesOutputFile) {
    FileSurface surface(path);
    record(surface);

    surface.appendMediaData({'a', 'b'});
    surface.appendMediaData({'c'});
    surface.clearMedia();

    EXPECT_EQ(surface.bytesWritten(), 3u);
    std::ifstream file(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "abc");

    std::vector<SurfaceEvent> expected = {SurfaceEvent::LoadStart, SurfaceEvent::DataLoaded, SurfaceEvent::Playing};
    EXPECT_EQ(events, expected);
}

TEST_F(FileSurfaceTest, UnwritableOutputReportsError) {
    FileSurface surface(std::filesystem::path("/nonexistent-dir/streamview/out.ts"));
    std::string detail;
    surface.subscribe([&](SurfaceEvent event, const std::string& text) {
        if (event == SurfaceEvent::Error) detail = text;
    });

    surface.appendMediaData({'x'});
    EXPECT_NE(detail.find("Cannot open"), std::string::npos);
    EXPECT_NE(detail.find("FileAccessDenied"), std::string::npos);
    EXPECT_EQ(surface.bytesWritten(), 0u);
}

TEST_F(FileSurfaceTest, ReopenAfterClearKeepsRecording) {
    {
        std::ofstream stale(path, std::ios::binary);
        stale << "stale";
    }

    FileSurface surface(path);
    surface.appendMediaData({'a', 'b'});
    surface.clearMedia();
    surface.appendMediaData({'c', 'd'});
    surface.clearMedia();

    std::ifstream file(path, std::ios::binary);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "abcd");
    EXPECT_EQ(surface.bytesWritten(), 4u);
}

TEST_F(FileSurfaceTest, OverlayAndSource) {
    FileSurface surface;
    EXPECT_FALSE(surface.canPlayNatively("application/vnd.apple.mpegurl"));

    surface.showOverlay("Loading...");
    EXPECT_TRUE(surface.overlayVisible());
    EXPECT_EQ(surface.overlay(), "Loading...");
    surface.hideOverlay();
    EXPECT_FALSE(surface.overlayVisible());

    surface.setSource("http://localhost:8080/hls/k/playlist.m3u8");
    EXPECT_EQ(surface.source(), "http://localhost:8080/hls/k/playlist.m3u8");
    surface.clearMedia();
    EXPECT_TRUE(surface.source().empty());
}

TEST_F(FileSurfaceTest, Unsubscribe) {
    FileSurface surface;
    auto id = surface.subscribe([this](SurfaceEvent event, const std::string&) { events.push_back(event); });
    EXPECT_EQ(surface.subscriberCount(), 1u);

    surface.unsubscribe(id);
    surface.setSource("http://x/");
    EXPECT_TRUE(events.empty());
    EXPECT_EQ(surface.subscriberCount(), 0u);
}

} // namespace streamview::player::test
