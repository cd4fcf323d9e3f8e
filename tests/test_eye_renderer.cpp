/**
 * Eye Renderer Unit Tests
 */

#include <cstdio>
#include <cstdint>
#include "../eye_service/eye_animator.hpp"
#include "../eye_service/eye_renderer.hpp"
#include "../eye_service/logger.h"

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

// 128x64, two 40x40 eyes 10 px apart: left box x 19..58, right 69..108, y 12..51
static ResolvedConfig makeConfig(ColorMode mode = ColorMode::MONO) {
    ResolvedConfig cfg;
    cfg.screen.width = 128;
    cfg.screen.height = 64;
    cfg.screen.mode = mode;
    cfg.left = EyeParams{40.0f, 40.0f, 8.0f};
    cfg.right = EyeParams{40.0f, 40.0f, 8.0f};
    cfg.spacing = 10.0f;
    return cfg;
}

static int litInColumn(const Bitmap &frame, int x, uint32_t lit) {
    int n = 0;
    for (int y = 0; y < frame.height(); y++) {
        if (frame.getPixel(x, y) == lit) n++;
    }
    return n;
}

static int firstLitRow(const Bitmap &frame, int x, uint32_t lit) {
    for (int y = 0; y < frame.height(); y++) {
        if (frame.getPixel(x, y) == lit) return y;
    }
    return -1;
}

void test_open_eyes() {
    TEST("Open eyes fill their boxes");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    Bitmap frame = renderer.render(animator);

    bool ok = frame.width() == 128 && frame.height() == 64;
    ok = ok && litInColumn(frame, 39, 1) == 40 && firstLitRow(frame, 39, 1) == 12;
    ok = ok && litInColumn(frame, 89, 1) == 40;
    ok = ok && frame.getPixel(19, 32) == 1 && frame.getPixel(18, 32) == 0;
    ok = ok && frame.getPixel(64, 32) == 0;
    ok = ok && frame.getPixel(19, 12) == 0;   // rounded corner

    if (ok) {
        PASS();
    } else {
        FAIL("Eye boxes not drawn as expected");
    }
}

void test_coverage_fraction() {
    TEST("Top coverage c hides exactly c of the eye height");

    const float coverages[] = {0.0f, 0.25f, 0.5f, 1.0f};
    const int expected[] = {40, 30, 20, 0};

    bool ok = true;
    for (int i = 0; i < 4; i++) {
        EyeAnimator animator(makeConfig());
        EyeRenderer renderer(animator.config());
        animator.setEyelidCoverage(coverages[i], 0.0f);
        Bitmap frame = renderer.render(animator);

        ok = ok && litInColumn(frame, 39, 1) == expected[i];
        ok = ok && litInColumn(frame, 89, 1) == expected[i];
        if (expected[i] > 0) {
            ok = ok && firstLitRow(frame, 39, 1) == 12 + (40 - expected[i]);
        }
    }

    if (ok) {
        PASS();
    } else {
        FAIL("Occluded rows do not match coverage");
    }
}

void test_bottom_coverage_fraction() {
    TEST("Bottom coverage hides rows from the bottom edge");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    animator.setEyelidCoverage(0.0f, 0.25f);
    Bitmap frame = renderer.render(animator);

    bool ok = litInColumn(frame, 39, 1) == 30;
    ok = ok && firstLitRow(frame, 39, 1) == 12;
    ok = ok && frame.getPixel(39, 41) == 1 && frame.getPixel(39, 42) == 0;

    if (ok) {
        PASS();
    } else {
        FAIL("Bottom lid rows wrong");
    }
}

void test_render_deterministic() {
    TEST("Two renders without changes are identical");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    animator.setMood(Mood::ANGRY);
    animator.look(Direction::TOP_LEFT, Speed::MEDIUM);
    animator.blink(Speed::SLOW);
    animator.tick(0.2f);

    EyeAnimator::Status before = animator.status();
    float cx = animator.eye(EyeSide::LEFT).centerX();
    Bitmap a = renderer.render(animator);
    Bitmap b = renderer.render(animator);
    EyeAnimator::Status after = animator.status();

    bool ok = a == b;
    ok = ok && before.blink_phase == after.blink_phase && before.look_target == after.look_target;
    ok = ok && animator.eye(EyeSide::LEFT).centerX() == cx;

    if (ok) {
        PASS();
    } else {
        FAIL("Frames differ or state changed");
    }
}

void test_default_face_mirrored() {
    TEST("Default face is mirror-symmetric");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    Bitmap frame = renderer.render(animator);

    bool ok = true;
    for (int y = 0; y < 64 && ok; y++) {
        for (int x = 0; x < 64 && ok; x++) {
            ok = frame.getPixel(x, y) == frame.getPixel(127 - x, y);
        }
    }

    if (ok) {
        PASS();
    } else {
        FAIL("Left and right eye differ");
    }
}

void test_angry_lid_tilt() {
    TEST("Angry lid slopes down towards the nose");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    animator.setMood(Mood::ANGRY);
    Bitmap frame = renderer.render(animator);

    // Left eye: nose side is the right edge; right eye: the left edge
    int left_outer = litInColumn(frame, 29, 1);
    int left_inner = litInColumn(frame, 49, 1);
    int right_inner = litInColumn(frame, 78, 1);
    int right_outer = litInColumn(frame, 98, 1);

    bool ok = left_outer > left_inner && right_outer > right_inner;
    ok = ok && left_outer == right_outer && left_inner == right_inner;
    ok = ok && left_outer < 40;

    if (ok) {
        PASS();
    } else {
        char buf[96];
        snprintf(buf, sizeof(buf), "L %d/%d R %d/%d", left_outer, left_inner, right_inner, right_outer);
        FAIL(buf);
    }
}

void test_tired_lid_tilt() {
    TEST("Tired lid slopes down towards the outer edge");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    animator.setMood(Mood::TIRED);
    Bitmap frame = renderer.render(animator);

    bool ok = litInColumn(frame, 29, 1) < litInColumn(frame, 49, 1);
    ok = ok && litInColumn(frame, 98, 1) < litInColumn(frame, 78, 1);

    if (ok) {
        PASS();
    } else {
        FAIL("Tired tilt wrong way round");
    }
}

void test_happy_cheek() {
    TEST("Happy cheek hides half the height at the centre column");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    animator.setMood(Mood::HAPPY);
    Bitmap frame = renderer.render(animator);

    bool ok = litInColumn(frame, 39, 1) == 20 && firstLitRow(frame, 39, 1) == 12;
    ok = ok && litInColumn(frame, 89, 1) == 20;
    // The cheek is round: columns away from the centre keep more of the eye
    ok = ok && litInColumn(frame, 25, 1) > 20;

    if (ok) {
        PASS();
    } else {
        FAIL("Cheek shape wrong");
    }
}

void test_closed_eyes_blank() {
    TEST("Held-closed eyes render as background");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    animator.close(Speed::FAST);
    animator.tick(0.1f);
    Bitmap frame = renderer.render(animator);

    if (frame.count(1) == 0) {
        PASS();
    } else {
        FAIL("Lit pixels with closed eyes");
    }
}

void test_color_modes() {
    TEST("Eye and background colours per mode");

    ResolvedConfig cfg = makeConfig(ColorMode::RGB565);
    cfg.color = Rgb{255, 128, 0};
    cfg.background = Rgb{0, 0, 255};
    EyeAnimator animator(cfg);
    EyeRenderer renderer(cfg);
    Bitmap frame = renderer.render(animator);

    bool ok = frame.mode() == ColorMode::RGB565;
    ok = ok && renderer.eyeColor() == 0xFC00 && renderer.backgroundColor() == 0x001F;
    ok = ok && frame.getPixel(39, 32) == 0xFC00;
    ok = ok && frame.getPixel(0, 0) == 0x001F;

    if (ok) {
        PASS();
    } else {
        FAIL("Colour mismatch");
    }
}

void test_render_into_reuses_frame() {
    TEST("renderInto resizes a mismatched frame");

    EyeAnimator animator(makeConfig());
    EyeRenderer renderer(animator.config());
    Bitmap frame(3, 3, ColorMode::RGB888);
    renderer.renderInto(frame, animator.eye(EyeSide::LEFT), animator.eye(EyeSide::RIGHT));

    bool ok = frame.width() == 128 && frame.height() == 64 && frame.mode() == ColorMode::MONO;
    ok = ok && frame == renderer.render(animator);

    if (ok) {
        PASS();
    } else {
        FAIL("Frame not rebuilt");
    }
}

int main() {
    Logger::instance().setLevel(LogLevel::ERROR);
    printf("=== Eye Renderer Tests ===\n");

    test_open_eyes();
    test_coverage_fraction();
    test_bottom_coverage_fraction();
    test_render_deterministic();
    test_default_face_mirrored();
    test_angry_lid_tilt();
    test_tired_lid_tilt();
    test_happy_cheek();
    test_closed_eyes_blank();
    test_color_modes();
    test_render_into_reuses_frame();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
