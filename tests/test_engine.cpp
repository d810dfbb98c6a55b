#include <lightbox/Engine.hpp>

#include <gtest/gtest.h>

#include <sstream>

using namespace lightbox;

namespace {

constexpr Float Eps = Float(1e-4);

Settings quietSettings() {
    Settings settings;
    settings.rayCount = 8;
    settings.circleRadius = 5;
    settings.direction = 0;
    settings.rotationStep = radians(90);
    settings.renderDistance = 1000;
    return settings;
}

}

TEST(Engine, CreateActionsMapToKinds) {
    Engine engine(quietSettings());

    const struct {
        Action action;
        ObjectKind kind;
    } cases[] = {
        {Action::CreateCircle, ObjectKind::Circle},
        {Action::CreateIsotropic, ObjectKind::Isotropic},
        {Action::CreateCollimated, ObjectKind::Collimated},
        {Action::CreateSpotlight, ObjectKind::Spotlight},
        {Action::CreateAbsorber, ObjectKind::PerfectAbsorber},
    };

    Float x = 0;
    for (const auto &c: cases) {
        x += 100;
        const auto id = engine.handleAction(c.action, {x, 0});
        ASSERT_TRUE(id) << actionName(c.action);
        const SceneObject *object = engine.scene().find(*id);
        ASSERT_NE(object, nullptr);
        EXPECT_EQ(object->kind(), c.kind) << actionName(c.action);
        EXPECT_EQ(object->position, Vec2f({x, 0}));
    }

    EXPECT_EQ(engine.debugDump().size(), 5u);
}

TEST(Engine, DeleteAtCursorRemovesThePickedObject) {
    Engine engine(quietSettings());
    const auto disc = engine.handleAction(Action::CreateCircle, {50, 50});
    ASSERT_TRUE(disc);

    EXPECT_FALSE(engine.handleAction(Action::DeleteAtCursor, {200, 200}));
    EXPECT_EQ(engine.debugDump().size(), 1u);

    EXPECT_EQ(engine.handleAction(Action::DeleteAtCursor, {52, 49}), disc);
    EXPECT_TRUE(engine.debugDump().empty());

    EXPECT_FALSE(engine.handleAction(Action::DeleteAtCursor, {50, 50}));
}

TEST(Engine, RotateActionsTurnTheEmitterUnderTheCursor) {
    Engine engine(quietSettings());
    const auto beam = engine.handleAction(Action::CreateCollimated, {0, 0});
    ASSERT_TRUE(beam);

    EXPECT_EQ(engine.handleAction(Action::RotateCW, {1, 1}), beam);
    EXPECT_NEAR(*engine.scene().find(*beam)->angle(), Pi / 2, Eps);

    EXPECT_EQ(engine.handleAction(Action::RotateCCW, {1, 1}), beam);
    EXPECT_NEAR(*engine.scene().find(*beam)->angle(), 0, Eps);

    EXPECT_EQ(engine.handleAction(Action::RotateCCW, {1, 1}), beam);
    EXPECT_NEAR(*engine.scene().find(*beam)->angle(), 3 * Pi / 2, Eps);
}

TEST(Engine, RotatingNonDirectionalTargetsIsANoOp) {
    Engine engine(quietSettings());
    engine.handleAction(Action::CreateIsotropic, {0, 0});
    engine.handleAction(Action::CreateCircle, {100, 0});

    EXPECT_FALSE(engine.handleAction(Action::RotateCW, {0, 0}));
    EXPECT_FALSE(engine.handleAction(Action::RotateCCW, {100, 0}));
    EXPECT_FALSE(engine.handleAction(Action::RotateCW, {500, 500}));
}

TEST(Engine, ResizeActionsScaleAbsorbers) {
    Settings settings = quietSettings();
    settings.circleRadius = 20;
    settings.resizeFactor = 2;
    Engine engine(settings);

    const auto disc = engine.handleAction(Action::CreateAbsorber, {0, 0});
    ASSERT_TRUE(disc);

    EXPECT_EQ(engine.handleAction(Action::GrowAtCursor, {0, 0}), disc);
    EXPECT_FLOAT_EQ(engine.scene().find(*disc)->circle()->radius, 40);

    EXPECT_EQ(engine.handleAction(Action::ShrinkAtCursor, {0, 0}), disc);
    EXPECT_EQ(engine.handleAction(Action::ShrinkAtCursor, {0, 0}), disc);
    EXPECT_FLOAT_EQ(engine.scene().find(*disc)->circle()->radius, 10);

    const auto light = engine.handleAction(Action::CreateSpotlight, {300, 0});
    EXPECT_FALSE(engine.handleAction(Action::GrowAtCursor, {300, 0}));
    EXPECT_FALSE(engine.scene().find(*light)->circle());
}

TEST(Engine, TraceFrameShadowsBehindAnAbsorber) {
    Engine engine(quietSettings());
    const auto light = engine.handleAction(Action::CreateIsotropic, {0, 0});
    const auto disc = engine.handleAction(Action::CreateCircle, {20, 0});
    ASSERT_TRUE(light);
    ASSERT_TRUE(disc);

    const auto segments = engine.traceFrame();
    ASSERT_EQ(segments.size(), 8u);

    for (const auto &traced: segments) {
        EXPECT_EQ(traced.emitter, *light);
        if (traced.rayIndex == 0) {
            ASSERT_TRUE(traced.absorber);
            EXPECT_EQ(*traced.absorber, *disc);
            EXPECT_NEAR(traced.segment.length(), 15, 1e-3f);
        } else {
            EXPECT_FALSE(traced.absorber);
            EXPECT_NEAR(traced.segment.length(), 1000, 1e-1f);
        }
    }
}

TEST(Engine, TraceFrameFollowsMovesAndDeletes) {
    Engine engine(quietSettings());
    engine.handleAction(Action::CreateIsotropic, {0, 0});
    const auto disc = engine.handleAction(Action::CreateCircle, {20, 0});
    ASSERT_TRUE(disc);

    // out of the way of every ray
    engine.scene().move(*disc, {20, 9});
    for (const auto &traced: engine.traceFrame()) {
        EXPECT_FALSE(traced.absorber);
    }

    engine.scene().move(*disc, {0, -30});
    int blocked = 0;
    for (const auto &traced: engine.traceFrame()) {
        if (traced.absorber) {
            blocked++;
            EXPECT_EQ(traced.rayIndex, 6);
            EXPECT_NEAR(traced.segment.length(), 25, 1e-3f);
        }
    }
    EXPECT_EQ(blocked, 1);

    engine.handleAction(Action::DeleteAtCursor, {0, -30});
    for (const auto &traced: engine.traceFrame()) {
        EXPECT_FALSE(traced.absorber);
    }
}

TEST(Engine, RenderDistanceClipsUnboundedRays) {
    Engine engine(quietSettings());
    engine.handleAction(Action::CreateSpotlight, {0, 0});
    engine.setRenderDistance(123);

    for (const auto &traced: engine.traceFrame()) {
        EXPECT_NEAR(traced.segment.length(), 123, 1e-2f);
    }
}

TEST(Engine, DescribeAtNamesTheObjectUnderTheCursor) {
    Engine engine(quietSettings());
    engine.handleAction(Action::CreateSpotlight, {0, 0});
    engine.handleAction(Action::CreateAbsorber, {100, 0});

    EXPECT_STREQ(engine.describeAt({1, 0}), "Spotlight");
    EXPECT_STREQ(engine.describeAt({103, 0}), "PerfectAbsorber");
    EXPECT_STREQ(engine.describeAt({50, 50}), "None");
}

TEST(Engine, DescribePrintsTheScene) {
    Engine engine(quietSettings());
    engine.handleAction(Action::CreateCollimated, {4, 5});

    std::ostringstream stream;
    engine.describe(stream);
    EXPECT_NE(stream.str().find("Collimated#1"), std::string::npos);
    EXPECT_NE(stream.str().find("width="), std::string::npos);
}
