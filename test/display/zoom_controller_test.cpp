#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "display/zoom_controller.h"
#include "geo/projection.h"
#include "../mock_tile_sink.h"
#include <cmath>
#include <stdexcept>

namespace skyview {
namespace test {

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::NiceMock;

class ZoomControllerTest : public testing::Test {
protected:
    void SetUp() override {
        london_ = GeoPoint{51.5074, -0.1278};
        sink_ = std::make_shared<NiceMock<MockTileSink>>();
        controller_ = std::make_unique<ZoomController>(
            ViewState{london_, 10, 1.0, london_}, Viewport{1280.0, 720.0}, sink_);
    }

    // Scroll delta whose line-unit factor is exactly `factor`
    static double lineDeltaFor(double factor) {
        return (1.0 - factor) / constants::ZOOM_SENSITIVITY_LINE;
    }

    GeoPoint london_;
    std::shared_ptr<NiceMock<MockTileSink>> sink_;
    std::unique_ptr<ZoomController> controller_;
};

TEST_F(ZoomControllerTest, ThreeScrollsPromoteToNextLevel) {
    GeoPoint track{51.5374, -0.1678};
    PixelPoint cursor = controller_->geoToScreen(track);
    double delta = lineDeltaFor(std::cbrt(1.6));

    EXPECT_CALL(*sink_, requestTiles(Field(&TileRequest::zoom_level, 11))).Times(1);

    EXPECT_FALSE(controller_->applyScroll(delta, ScrollUnit::LINE, cursor));
    EXPECT_FALSE(controller_->applyScroll(delta, ScrollUnit::LINE, cursor));
    EXPECT_TRUE(controller_->applyScroll(delta, ScrollUnit::LINE, cursor));

    const ViewState& state = controller_->getViewState();
    EXPECT_EQ(state.zoom_level, 11);
    EXPECT_NEAR(state.continuous_zoom, 0.8, 1e-9);

    // The track under the cursor did not move on screen
    PixelPoint after = controller_->geoToScreen(track);
    EXPECT_NEAR(after.x, cursor.x, 1e-6);
    EXPECT_NEAR(after.y, cursor.y, 1e-6);

    // And its projection at the new level still round-trips
    GeoPoint back = geo::Projection::toGeo(
        geo::Projection::toPixel(track, 11, state.reference_point), 11, state.reference_point);
    EXPECT_NEAR(back.latitude, track.latitude, 1e-9);
    EXPECT_NEAR(back.longitude, track.longitude, 1e-9);
}

TEST_F(ZoomControllerTest, CursorPointStaysFixed) {
    PixelPoint cursor{300.0, 200.0};
    GeoPoint before = controller_->screenToGeo(cursor);

    const double deltas[] = {-3.0, -4.0, -5.0, 2.0, -8.0, 6.0, 7.0, 5.0, -1.0, 9.0, -2.5};
    for (double delta : deltas) {
        controller_->applyScroll(delta, ScrollUnit::LINE, cursor);
        GeoPoint now = controller_->screenToGeo(cursor);
        EXPECT_NEAR(now.latitude, before.latitude, 1e-9);
        EXPECT_NEAR(now.longitude, before.longitude, 1e-9);
    }

    controller_->applyScroll(-120.0, ScrollUnit::PIXEL, cursor);
    controller_->applyScroll(0.4, ScrollUnit::PINCH, cursor);
    GeoPoint after = controller_->screenToGeo(cursor);
    EXPECT_NEAR(after.latitude, before.latitude, 1e-9);
    EXPECT_NEAR(after.longitude, before.longitude, 1e-9);
}

TEST_F(ZoomControllerTest, CursorAnchoringAcrossLevelChanges) {
    PixelPoint cursor{1000.0, 650.0};
    GeoPoint before = controller_->screenToGeo(cursor);
    int start_level = controller_->getViewState().zoom_level;

    for (int i = 0; i < 6; ++i) {
        controller_->applyScroll(-5.0, ScrollUnit::LINE, cursor);
    }
    EXPECT_GT(controller_->getViewState().zoom_level, start_level);

    for (int i = 0; i < 12; ++i) {
        controller_->applyScroll(4.0, ScrollUnit::LINE, cursor);
    }
    EXPECT_LT(controller_->getViewState().zoom_level, start_level);

    GeoPoint after = controller_->screenToGeo(cursor);
    EXPECT_NEAR(after.latitude, before.latitude, 1e-9);
    EXPECT_NEAR(after.longitude, before.longitude, 1e-9);
}

TEST_F(ZoomControllerTest, HoveringAtOneNeverChangesLevel) {
    EXPECT_CALL(*sink_, requestTiles(_)).Times(0);

    for (int i = 0; i < 100; ++i) {
        EXPECT_FALSE(controller_->setContinuousZoom(1.0));
        EXPECT_EQ(controller_->getViewState().zoom_level, 10);
    }

    // Wobble around 1.0 without reaching either threshold
    for (int i = 0; i < 50; ++i) {
        EXPECT_FALSE(controller_->applyScroll(lineDeltaFor(1.4), ScrollUnit::LINE));
        EXPECT_FALSE(controller_->applyScroll(lineDeltaFor(0.8 / 1.4), ScrollUnit::LINE));
        EXPECT_FALSE(controller_->applyScroll(lineDeltaFor(1.0 / 0.8), ScrollUnit::LINE));
        EXPECT_EQ(controller_->getViewState().zoom_level, 10);
    }
}

TEST_F(ZoomControllerTest, PromotionHalvesZoom) {
    EXPECT_TRUE(controller_->setContinuousZoom(1.5));
    EXPECT_EQ(controller_->getViewState().zoom_level, 11);
    EXPECT_DOUBLE_EQ(controller_->getViewState().continuous_zoom, 0.75);
}

TEST_F(ZoomControllerTest, DemotionDoublesZoom) {
    EXPECT_TRUE(controller_->setContinuousZoom(0.75));
    EXPECT_EQ(controller_->getViewState().zoom_level, 9);
    EXPECT_DOUBLE_EQ(controller_->getViewState().continuous_zoom, 1.5);
}

TEST_F(ZoomControllerTest, JustInsideThresholdsKeepsLevel) {
    EXPECT_FALSE(controller_->setContinuousZoom(1.49));
    EXPECT_FALSE(controller_->setContinuousZoom(0.76));
    EXPECT_EQ(controller_->getViewState().zoom_level, 10);
}

TEST_F(ZoomControllerTest, OneTransitionPerInput) {
    // Clamped to 10, promoted once to 5; a second level waits for the next input
    EXPECT_TRUE(controller_->setContinuousZoom(100.0));
    EXPECT_EQ(controller_->getViewState().zoom_level, 11);
    EXPECT_DOUBLE_EQ(controller_->getViewState().continuous_zoom, 5.0);
}

TEST_F(ZoomControllerTest, ZoomClampedToBounds) {
    auto sink = std::make_shared<NiceMock<MockTileSink>>();
    ZoomController top(ViewState{london_, 19, 1.0, london_}, Viewport{800.0, 600.0}, sink);
    EXPECT_FALSE(top.setContinuousZoom(50.0));
    EXPECT_EQ(top.getViewState().zoom_level, 19);
    EXPECT_DOUBLE_EQ(top.getViewState().continuous_zoom, constants::MAX_CAMERA_ZOOM);

    ZoomController bottom(ViewState{london_, 0, 1.0, london_}, Viewport{800.0, 600.0}, sink);
    EXPECT_FALSE(bottom.setContinuousZoom(0.001));
    EXPECT_EQ(bottom.getViewState().zoom_level, 0);
    EXPECT_DOUBLE_EQ(bottom.getViewState().continuous_zoom, constants::MIN_CAMERA_ZOOM);

    // A zoom-out step larger than the whole range lands on the minimum
    EXPECT_FALSE(bottom.applyScroll(1000.0, ScrollUnit::LINE));
    EXPECT_DOUBLE_EQ(bottom.getViewState().continuous_zoom, constants::MIN_CAMERA_ZOOM);
}

TEST_F(ZoomControllerTest, SensitivityPerUnit) {
    controller_->applyScroll(-10.0, ScrollUnit::PIXEL);
    EXPECT_NEAR(controller_->getViewState().continuous_zoom, 1.02, 1e-12);

    controller_->setContinuousZoom(1.0);
    controller_->applyScroll(-1.0, ScrollUnit::LINE);
    EXPECT_NEAR(controller_->getViewState().continuous_zoom, 1.1, 1e-12);

    controller_->setContinuousZoom(1.0);
    controller_->applyScroll(0.2, ScrollUnit::PINCH);
    EXPECT_NEAR(controller_->getViewState().continuous_zoom, 0.8, 1e-12);
}

TEST_F(ZoomControllerTest, LevelChangeRequestsTiles) {
    EXPECT_CALL(*sink_, requestTiles(AllOf(
        Field(&TileRequest::zoom_level, 9),
        Field(&TileRequest::radius_in_tiles, 3)))).Times(1);

    EXPECT_TRUE(controller_->setContinuousZoom(0.7));
}

TEST_F(ZoomControllerTest, RejectsInvalidInitialLevel) {
    EXPECT_THROW(ZoomController(ViewState{london_, 20, 1.0, london_}, Viewport{800.0, 600.0}, sink_),
                 std::invalid_argument);
    EXPECT_THROW(ZoomController(ViewState{london_, -1, 1.0, london_}, Viewport{800.0, 600.0}, sink_),
                 std::invalid_argument);
    EXPECT_THROW(ZoomController(ViewState{london_, 10, 1.0, london_}, Viewport{0.0, 600.0}, sink_),
                 std::invalid_argument);
}

TEST_F(ZoomControllerTest, ScreenCenterShowsViewCenter) {
    PixelPoint center = controller_->geoToScreen(controller_->getViewState().center);
    EXPECT_NEAR(center.x, 640.0, 1e-9);
    EXPECT_NEAR(center.y, 360.0, 1e-9);

    // North is up on screen
    PixelPoint north = controller_->geoToScreen(GeoPoint{51.6, -0.1278});
    EXPECT_LT(north.y, 360.0);
}

TEST_F(ZoomControllerTest, ScreenGeoRoundTrip) {
    controller_->setContinuousZoom(1.3);
    GeoPoint point{51.45, -0.05};
    GeoPoint back = controller_->screenToGeo(controller_->geoToScreen(point));
    EXPECT_NEAR(back.latitude, point.latitude, 1e-9);
    EXPECT_NEAR(back.longitude, point.longitude, 1e-9);
}

TEST_F(ZoomControllerTest, PanMovesCenterOppositeToDrag) {
    GeoPoint before = controller_->getViewState().center;
    controller_->pan(100.0, 50.0);
    GeoPoint after = controller_->getViewState().center;

    // Dragging right and down reveals what lies west and north
    EXPECT_LT(after.longitude, before.longitude);
    EXPECT_GT(after.latitude, before.latitude);
}

TEST_F(ZoomControllerTest, PanRequestsTilesPastThreshold) {
    EXPECT_CALL(*sink_, requestTiles(_)).Times(2);

    controller_->pan(100.0, 0.0);    // first drag always requests
    controller_->pan(0.01, 0.0);     // far below 0.001 degrees
    controller_->pan(100.0, 0.0);
}

TEST_F(ZoomControllerTest, EndPanRequestsDefaultRadius) {
    EXPECT_CALL(*sink_, requestTiles(Field(&TileRequest::radius_in_tiles,
                                           constants::TILE_DOWNLOAD_RADIUS))).Times(1);
    controller_->endPan();
}

TEST_F(ZoomControllerTest, TileRadiusCoversViewport) {
    EXPECT_EQ(controller_->computeTileRadius(), 3);

    controller_->setViewport(Viewport{3000.0, 720.0});
    EXPECT_EQ(controller_->computeTileRadius(), 6);

    controller_->setViewport(Viewport{10000.0, 720.0});
    EXPECT_EQ(controller_->computeTileRadius(), constants::MAX_TILE_RADIUS);

    controller_->setViewport(Viewport{200.0, 200.0});
    EXPECT_EQ(controller_->computeTileRadius(), constants::MIN_TILE_RADIUS);
}

TEST_F(ZoomControllerTest, TileRadiusGrowsWhenZoomedOut) {
    controller_->setViewport(Viewport{3000.0, 720.0});
    controller_->setContinuousZoom(0.8);   // 3000 / (2 * 256 * 0.8) rounds up to 8
    EXPECT_EQ(controller_->getViewState().zoom_level, 10);
    EXPECT_EQ(controller_->computeTileRadius(), 8);
}

TEST_F(ZoomControllerTest, JumpToBookmark) {
    EXPECT_CALL(*sink_, requestTiles(Field(&TileRequest::zoom_level, 8))).Times(1);

    Bookmark wichita{"Wichita", 37.6872, -97.3301, 8};
    EXPECT_TRUE(controller_->jumpTo(wichita));

    const ViewState& state = controller_->getViewState();
    EXPECT_EQ(state.zoom_level, 8);
    EXPECT_DOUBLE_EQ(state.continuous_zoom, 1.0);
    EXPECT_DOUBLE_EQ(state.center.latitude, 37.6872);
    EXPECT_DOUBLE_EQ(state.reference_point.longitude, -97.3301);
}

TEST_F(ZoomControllerTest, RejectsBookmarkWithInvalidLevel) {
    EXPECT_CALL(*sink_, requestTiles(_)).Times(0);

    Bookmark bad{"Bad", 10.0, 10.0, 25};
    EXPECT_FALSE(controller_->jumpTo(bad));
    EXPECT_EQ(controller_->getViewState().zoom_level, 10);
    EXPECT_DOUBLE_EQ(controller_->getViewState().center.latitude, london_.latitude);
}

TEST_F(ZoomControllerTest, BookmarkRoundTrip) {
    controller_->setContinuousZoom(1.6);
    Bookmark saved = controller_->makeBookmark("Here");
    EXPECT_EQ(saved.name, "Here");
    EXPECT_EQ(saved.zoom_level, 11);

    controller_->pan(400.0, 300.0);
    EXPECT_TRUE(controller_->jumpTo(saved));
    EXPECT_DOUBLE_EQ(controller_->getViewState().center.latitude, saved.latitude);
    EXPECT_DOUBLE_EQ(controller_->getViewState().center.longitude, saved.longitude);
}

TEST_F(ZoomControllerTest, CenterLatitudeIsClamped) {
    controller_->recenter(GeoPoint{89.0, 200.0});
    EXPECT_DOUBLE_EQ(controller_->getViewState().center.latitude, constants::MERCATOR_LAT_LIMIT);
    EXPECT_DOUBLE_EQ(controller_->getViewState().center.longitude, 180.0);
}

} // namespace test
} // namespace skyview
