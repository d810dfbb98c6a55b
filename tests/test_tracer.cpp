#include <lightbox/rt/Tracer.hpp>
#include <lightbox/rt/Scene.hpp>

#include <gtest/gtest.h>

#include <map>

using namespace lightbox;

namespace {

constexpr Float Eps = Float(1e-3);

SceneObject isotropic(int rays, Vec2f position) {
    SceneObject object;
    object.position = position;
    object.params = IsotropicEmitter{rays};
    return object;
}

SceneObject circle(Float radius, Vec2f position, bool perfect = false) {
    SceneObject object;
    object.position = position;
    object.params = CircleAbsorber{radius, perfect};
    return object;
}

}

TEST(Tracer, IsotropicEmitterShadowedByOneCircle) {
    Scene scene;
    const ObjectId light = scene.add(isotropic(8, {0, 0}));
    const ObjectId blocker = scene.add(circle(5, {20, 0}));

    const Float boundary = 1000;
    const auto segments = trace(scene, boundary);
    ASSERT_EQ(segments.size(), 8u);

    int blocked = 0;
    for (const auto &traced: segments) {
        EXPECT_EQ(traced.emitter, light);
        EXPECT_EQ(traced.segment.start, Vec2f({0, 0}));

        if (traced.absorber) {
            blocked++;
            EXPECT_EQ(*traced.absorber, blocker);
            EXPECT_EQ(traced.rayIndex, 0);
            EXPECT_NEAR(traced.segment.length(), 15, Eps);
            EXPECT_NEAR(traced.segment.end.x(), 15, Eps);
            EXPECT_NEAR(traced.segment.end.y(), 0, Eps);
        } else {
            EXPECT_NEAR(traced.segment.length(), boundary, Eps * boundary);
        }
    }
    EXPECT_EQ(blocked, 1);
}

TEST(Tracer, WideCircleShadowsTheRaysStraddlingTheAxis) {
    Scene scene;
    scene.add(isotropic(8, {0, 0}));
    // close and large enough to catch the 0 and +-45 degree rays
    scene.add(circle(10, {12, 0}));

    const auto segments = trace(scene, 500);
    ASSERT_EQ(segments.size(), 8u);

    std::map<int, bool> hit;
    for (const auto &traced: segments) {
        hit[traced.rayIndex] = traced.absorber.has_value();
    }
    EXPECT_TRUE(hit[0]);
    EXPECT_TRUE(hit[1]);
    EXPECT_TRUE(hit[7]);
    EXPECT_FALSE(hit[2]);
    EXPECT_FALSE(hit[4]);
    EXPECT_FALSE(hit[6]);
}

TEST(Tracer, NearestAbsorberWins) {
    Scene scene;
    scene.add(SceneObject(isotropic(1, {0, 0})));
    const ObjectId far = scene.add(circle(5, {100, 0}));
    const ObjectId near = scene.add(circle(2, {30, 0}));

    const auto segments = trace(scene, 1000);
    ASSERT_EQ(segments.size(), 1u);
    ASSERT_TRUE(segments[0].absorber);
    EXPECT_EQ(*segments[0].absorber, near);
    EXPECT_NE(*segments[0].absorber, far);
    EXPECT_NEAR(segments[0].segment.length(), 28, Eps);
}

TEST(Tracer, EqualDistanceHitsGoToTheEarlierAbsorber) {
    std::vector<SceneObject> objects = {circle(5, {20, 0}), circle(5, {20, 0}, true)};
    objects[0].id = 11;
    objects[1].id = 12;

    const std::vector<const SceneObject *> absorbers = {&objects[0], &objects[1]};
    const auto isect = intersect(Ray({0, 0}, {1, 0}), absorbers);
    ASSERT_TRUE(isect.valid());
    EXPECT_EQ(isect.absorber, 0);
}

TEST(Tracer, EmitterInsideAbsorberIsTerminatedAtTheExit) {
    Scene scene;
    scene.add(isotropic(4, {0, 0}));
    scene.add(circle(10, {0, 0}));

    for (const auto &traced: trace(scene, 1000)) {
        ASSERT_TRUE(traced.absorber);
        EXPECT_NEAR(traced.segment.length(), 10, Eps);
    }
}

TEST(Tracer, ClipUsesTheShorterOfBoundaryAndRayLength) {
    const Intersection miss;
    EXPECT_NEAR(clip(Ray({0, 0}, {0, 1}), miss, 300).length(), 300, Eps);
    EXPECT_NEAR(clip(Ray({0, 0}, {0, 1}, 40), miss, 300).length(), 40, Eps);

    Intersection hit;
    hit.t = 12;
    hit.absorber = 0;
    const Segment segment = clip(Ray({1, 1}, {1, 0}), hit, 300);
    EXPECT_NEAR(segment.end.x(), 13, Eps);
    EXPECT_NEAR(segment.end.y(), 1, Eps);
}

TEST(Tracer, EmittersDoNotBlockLight) {
    Scene scene;
    scene.add(isotropic(1, {0, 0}));
    scene.add(isotropic(1, {50, 0}));

    for (const auto &traced: trace(scene, 200)) {
        EXPECT_FALSE(traced.absorber);
        EXPECT_NEAR(traced.segment.length(), 200, Eps);
    }
}

TEST(Tracer, SegmentsAreReportedPerEmitterInCreationOrder) {
    Scene scene;
    const ObjectId first = scene.add(isotropic(3, {0, 0}));
    scene.add(circle(4, {100, 100}));
    const ObjectId second = scene.add(isotropic(2, {10, 0}));

    const auto segments = trace(scene, 100);
    ASSERT_EQ(segments.size(), 5u);
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(segments[i].emitter, first);
        EXPECT_EQ(segments[i].rayIndex, i);
    }
    EXPECT_EQ(segments[3].emitter, second);
    EXPECT_EQ(segments[3].rayIndex, 0);
    EXPECT_EQ(segments[4].rayIndex, 1);
}

TEST(Tracer, EmptySceneTracesNothing) {
    Scene scene;
    EXPECT_TRUE(trace(scene, 100).empty());
    scene.add(circle(3, {0, 0}));
    EXPECT_TRUE(trace(scene, 100).empty());
}
