/**
 * Eye Animator Unit Tests
 */

#include <cstdio>
#include <cstdint>
#include <cmath>
#include "../eye_service/eye_animator.hpp"
#include "../eye_service/logger.h"

extern "C" {
#include "eye_limits.h"
}

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) printf("  %s: ", name)
#define PASS() do { printf("PASS\n"); tests_passed++; } while(0)
#define FAIL(msg) do { printf("FAIL - %s\n", msg); tests_failed++; } while(0)

static ResolvedConfig makeConfig(float w, float h, float spacing) {
    ResolvedConfig cfg;
    cfg.screen.width = 128;
    cfg.screen.height = 64;
    cfg.left = EyeParams{w, h, 8.0f};
    cfg.right = EyeParams{w, h, 8.0f};
    cfg.spacing = spacing;
    cfg.seed = 1;
    return cfg;
}

// Returns false if the controller never settled
static bool tickUntilIdle(EyeAnimator &animator, float dt, int max_steps = 1000) {
    for (int i = 0; i < max_steps; i++) {
        if (animator.isIdle()) return true;
        animator.tick(dt);
    }
    return animator.isIdle();
}

static bool boxInScreen(const EyeModel &eye) {
    RectF box = eye.box();
    return box.left() >= 0.0f && box.top() >= 0.0f &&
           box.right() <= eye.screenWidth() && box.bottom() <= eye.screenHeight();
}

static bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) < eps;
}

void test_initial_layout() {
    TEST("Eyes anchored either side of the centre line");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    const EyeModel &left = animator.eye(EyeSide::LEFT);
    const EyeModel &right = animator.eye(EyeSide::RIGHT);

    bool ok = left.centerX() == 39.0f && right.centerX() == 89.0f;
    ok = ok && left.centerY() == 32.0f && right.centerY() == 32.0f;
    ok = ok && animator.isIdle() && animator.mood() == Mood::DEFAULT;

    if (ok) {
        PASS();
    } else {
        FAIL("Unexpected initial centres");
    }
}

void test_blink_fast_scenario() {
    TEST("Fast blink closes then returns to coverage 0");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    CommandResult r = animator.blink(Speed::FAST, EyeSelector::BOTH);

    bool ok = r.ok && animator.blinkPhase() == BlinkPhase::CLOSING;
    bool closed_seen = false;
    for (int i = 0; i < 100 && !animator.isIdle(); i++) {
        animator.tick(1.0f / 60.0f);
        if (animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 1.0f) closed_seen = true;
    }

    ok = ok && closed_seen && animator.isIdle();
    for (EyeSide side : {EyeSide::LEFT, EyeSide::RIGHT}) {
        const EyeModel &eye = animator.eye(side);
        ok = ok && eye.eyelidTopCoverage() == 0.0f && eye.eyelidBottomCoverage() == 0.0f;
        ok = ok && eye.width() == 40.0f && eye.height() == 40.0f;
    }

    if (ok) {
        PASS();
    } else {
        FAIL("Blink did not complete cleanly");
    }
}

void test_blink_idempotent_all_moods() {
    TEST("Blink returns exactly to the mood's resting lids");

    const Mood moods[] = {Mood::DEFAULT, Mood::ANGRY, Mood::TIRED, Mood::HAPPY, Mood::CURIOUS};
    const Speed speeds[] = {Speed::SLOW, Speed::MEDIUM, Speed::FAST};

    bool ok = true;
    for (Mood mood : moods) {
        for (Speed speed : speeds) {
            EyeAnimator animator(makeConfig(36.0f, 36.0f, 10.0f));
            animator.setMood(mood);
            EyelidCoverage before_l = animator.eye(EyeSide::LEFT).lids();
            EyelidCoverage before_r = animator.eye(EyeSide::RIGHT).lids();

            animator.blink(speed);
            ok = ok && tickUntilIdle(animator, 0.013f);

            ok = ok && animator.eye(EyeSide::LEFT).lids() == before_l;
            ok = ok && animator.eye(EyeSide::RIGHT).lids() == before_r;
            ok = ok && before_l == EyeModel::moodShape(mood);
        }
    }

    if (ok) {
        PASS();
    } else {
        FAIL("Lids differ after blink");
    }
}

void test_blink_phase_progress() {
    TEST("Blink phases follow the timing table");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.blink(Speed::MEDIUM);

    animator.tick(0.05f);
    bool ok = animator.blinkPhase() == BlinkPhase::CLOSING;
    ok = ok && near(animator.eye(EyeSide::LEFT).eyelidTopCoverage(), 0.5f, 1e-3f);

    animator.tick(0.06f);   // 0.11 s: closed
    ok = ok && animator.blinkPhase() == BlinkPhase::CLOSED;
    ok = ok && animator.eye(EyeSide::RIGHT).eyelidTopCoverage() == 1.0f;

    animator.tick(0.10f);   // 0.21 s: opening
    ok = ok && animator.blinkPhase() == BlinkPhase::OPENING;

    animator.tick(0.10f);   // 0.31 s: done
    ok = ok && animator.blinkPhase() == BlinkPhase::IDLE;
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 0.0f;

    if (ok) {
        PASS();
    } else {
        FAIL("Unexpected phase sequence");
    }
}

void test_tick_carries_leftover_time() {
    TEST("One long tick runs a whole blink");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.blink(Speed::FAST);
    animator.blink(Speed::FAST);
    animator.tick(0.5f);

    bool ok = animator.isIdle() && animator.queuedLidRequests() == 0;
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 0.0f;

    if (ok) {
        PASS();
    } else {
        FAIL("Leftover time not carried");
    }
}

void test_blink_single_eye() {
    TEST("Wink closes only the selected eye");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.blink(Speed::SLOW, EyeSelector::RIGHT);
    animator.tick(0.3f);

    bool ok = animator.eye(EyeSide::RIGHT).eyelidTopCoverage() == 1.0f;
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 0.0f;
    ok = ok && tickUntilIdle(animator, 0.02f);
    ok = ok && animator.eye(EyeSide::RIGHT).eyelidTopCoverage() == 0.0f;

    if (ok) {
        PASS();
    } else {
        FAIL("Wrong eye animated");
    }
}

void test_lid_queue() {
    TEST("Lid requests queue in order, bounded");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    bool ok = animator.blink(Speed::SLOW).ok;
    for (int i = 0; i < ROBOEYES_LID_QUEUE_MAX; i++) {
        ok = ok && animator.blink(Speed::FAST).ok;
    }
    ok = ok && animator.queuedLidRequests() == ROBOEYES_LID_QUEUE_MAX;

    CommandResult overflow = animator.blink(Speed::FAST);
    ok = ok && !overflow.ok && overflow.error == EyeError::INVALID_COMMAND;
    ok = ok && animator.queuedLidRequests() == ROBOEYES_LID_QUEUE_MAX;

    // The slow blink is never cut short by the queued ones
    animator.tick(0.3f);
    ok = ok && animator.blinkPhase() == BlinkPhase::CLOSED;
    ok = ok && animator.queuedLidRequests() == ROBOEYES_LID_QUEUE_MAX;

    ok = ok && tickUntilIdle(animator, 0.01f);
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 0.0f;

    if (ok) {
        PASS();
    } else {
        FAIL("Queue misbehaved");
    }
}

void test_close_and_open() {
    TEST("Close holds eyes shut until open");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.close(Speed::FAST);
    bool ok = tickUntilIdle(animator, 0.02f);
    ok = ok && animator.heldClosed(EyeSide::LEFT) && animator.heldClosed(EyeSide::RIGHT);
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 1.0f;

    // Blinks skip held eyes, mood keeps them shut
    animator.blink(Speed::FAST);
    animator.setMood(Mood::HAPPY);
    ok = ok && tickUntilIdle(animator, 0.02f);
    ok = ok && animator.eye(EyeSide::RIGHT).eyelidTopCoverage() == 1.0f;
    ok = ok && animator.eye(EyeSide::RIGHT).eyelidBottomCoverage() == 0.5f;

    animator.open(Speed::MEDIUM, EyeSelector::LEFT);
    ok = ok && tickUntilIdle(animator, 0.02f);
    ok = ok && !animator.heldClosed(EyeSide::LEFT) && animator.heldClosed(EyeSide::RIGHT);
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 0.0f;
    ok = ok && animator.eye(EyeSide::RIGHT).eyelidTopCoverage() == 1.0f;

    animator.open(Speed::FAST);
    ok = ok && tickUntilIdle(animator, 0.02f);
    ok = ok && !animator.heldClosed(EyeSide::RIGHT);
    ok = ok && animator.eye(EyeSide::RIGHT).lids() == EyeModel::moodShape(Mood::HAPPY);

    if (ok) {
        PASS();
    } else {
        FAIL("Held-closed state wrong");
    }
}

void test_open_when_open_is_noop() {
    TEST("Open on open eyes changes nothing");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.setMood(Mood::ANGRY);
    EyelidCoverage before = animator.eye(EyeSide::LEFT).lids();

    CommandResult r = animator.open(Speed::FAST);
    bool ok = r.ok && animator.isIdle();
    animator.tick(0.1f);
    ok = ok && animator.eye(EyeSide::LEFT).lids() == before;

    if (ok) {
        PASS();
    } else {
        FAIL("Open changed state");
    }
}

void test_angry_scenario() {
    TEST("Angry: top lid over bottom, same on both eyes");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.setMood(Mood::ANGRY);
    const EyeModel &left = animator.eye(EyeSide::LEFT);
    const EyeModel &right = animator.eye(EyeSide::RIGHT);

    bool ok = left.eyelidTopCoverage() > left.eyelidBottomCoverage();
    ok = ok && right.eyelidTopCoverage() > right.eyelidBottomCoverage();
    ok = ok && left.lids() == right.lids();
    ok = ok && left.shape() == EyeShape::ANGRY && right.shape() == EyeShape::ANGRY;

    if (ok) {
        PASS();
    } else {
        FAIL("Angry lids wrong");
    }
}

void test_mood_during_blink() {
    TEST("Mood change mid-blink keeps the blink");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.blink(Speed::SLOW);
    animator.tick(0.3f);   // closed
    animator.setMood(Mood::TIRED);

    bool ok = animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 1.0f;
    ok = ok && tickUntilIdle(animator, 0.01f);
    ok = ok && animator.eye(EyeSide::LEFT).lids() == EyeModel::moodShape(Mood::TIRED);

    if (ok) {
        PASS();
    } else {
        FAIL("Blink lost precedence");
    }
}

void test_look_top_right_scenario() {
    TEST("Look TR slow moves both eyes up and right");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    float lx = animator.eye(EyeSide::LEFT).centerX();
    float ly = animator.eye(EyeSide::LEFT).centerY();
    float rx = animator.eye(EyeSide::RIGHT).centerX();
    float ry = animator.eye(EyeSide::RIGHT).centerY();

    bool ok = animator.look(Direction::TOP_RIGHT, Speed::SLOW).ok;
    ok = ok && animator.lookTarget() == Direction::TOP_RIGHT;
    ok = ok && tickUntilIdle(animator, 0.1f);
    ok = ok && !animator.lookTarget();

    // Right room 128 - (64 + 5 + 40) = 19, vertical room (64 - 40) / 2 = 12
    const EyeModel &left = animator.eye(EyeSide::LEFT);
    const EyeModel &right = animator.eye(EyeSide::RIGHT);
    ok = ok && left.centerX() - lx == 19.0f && left.centerY() - ly == -12.0f;
    ok = ok && right.centerX() - rx == 19.0f && right.centerY() - ry == -12.0f;
    ok = ok && boxInScreen(left) && boxInScreen(right);

    if (ok) {
        PASS();
    } else {
        char buf[96];
        snprintf(buf, sizeof(buf), "Moved by (%.2f, %.2f)", left.centerX() - lx, left.centerY() - ly);
        FAIL(buf);
    }
}

void test_look_bounds_all_directions() {
    TEST("Every direction keeps both eyes on screen");

    const float sizes[][3] = {
        {40.0f, 40.0f, 10.0f}, {20.0f, 10.0f, 4.0f}, {58.0f, 60.0f, 12.0f}, {36.0f, 36.0f, 0.0f},
    };
    const Direction directions[] = {
        Direction::CENTER, Direction::LEFT, Direction::RIGHT, Direction::TOP, Direction::BOTTOM,
        Direction::TOP_LEFT, Direction::TOP_RIGHT, Direction::BOTTOM_LEFT, Direction::BOTTOM_RIGHT,
    };

    bool ok = true;
    for (const auto &size : sizes) {
        for (Direction direction : directions) {
            for (bool curious : {false, true}) {
                EyeAnimator animator(makeConfig(size[0], size[1], size[2]));
                animator.setCurious(curious);
                animator.look(direction, Speed::FAST);
                ok = ok && tickUntilIdle(animator, 0.05f);
                ok = ok && boxInScreen(animator.eye(EyeSide::LEFT));
                ok = ok && boxInScreen(animator.eye(EyeSide::RIGHT));
            }
        }
    }

    if (ok) {
        PASS();
    } else {
        FAIL("Eye box left the screen");
    }
}

void test_look_replaces_in_flight() {
    TEST("New look starts from the current offset");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.look(Direction::LEFT, Speed::SLOW);
    animator.tick(0.4f);
    float mid = animator.lookOffsetX();

    animator.look(Direction::RIGHT, Speed::FAST);
    bool ok = mid < 0.0f && animator.lookOffsetX() == mid;
    ok = ok && animator.lookTarget() == Direction::RIGHT;
    ok = ok && tickUntilIdle(animator, 0.05f);
    ok = ok && animator.lookOffsetX() == 19.0f;

    if (ok) {
        PASS();
    } else {
        FAIL("Look jumped or did not finish");
    }
}

void test_curious_round_trip() {
    TEST("Curious toggle restores bit-exact sizes");

    EyeAnimator animator(makeConfig(33.3f, 27.1f, 10.0f));
    float lw = animator.eye(EyeSide::LEFT).width();
    float lh = animator.eye(EyeSide::LEFT).height();
    float rw = animator.eye(EyeSide::RIGHT).width();

    animator.setCurious(true);
    animator.setCurious(false);
    bool ok = animator.eye(EyeSide::LEFT).width() == lw && animator.eye(EyeSide::LEFT).height() == lh;

    // Looking left: left eye grows, right eye shrinks
    animator.look(Direction::LEFT, Speed::FAST);
    tickUntilIdle(animator, 0.05f);
    animator.setCurious(true);
    ok = ok && animator.curious();
    ok = ok && animator.eye(EyeSide::LEFT).width() > lw;
    ok = ok && animator.eye(EyeSide::RIGHT).width() < rw;

    animator.setCurious(false);
    ok = ok && animator.eye(EyeSide::LEFT).width() == lw;
    ok = ok && animator.eye(EyeSide::LEFT).height() == lh;
    ok = ok && animator.eye(EyeSide::RIGHT).width() == rw;

    if (ok) {
        PASS();
    } else {
        FAIL("Size drifted");
    }
}

void test_curious_mood() {
    TEST("Curious mood enables scaling");

    EyeAnimator animator(makeConfig(30.0f, 30.0f, 10.0f));
    animator.look(Direction::RIGHT, Speed::FAST);
    animator.setMood(Mood::CURIOUS);

    bool ok = animator.curious();
    ok = ok && near(animator.eye(EyeSide::RIGHT).width(), 42.0f);
    ok = ok && near(animator.eye(EyeSide::LEFT).width(), 18.0f);

    animator.setMood(Mood::DEFAULT);
    ok = ok && !animator.curious() && animator.eye(EyeSide::RIGHT).width() == 30.0f;

    if (ok) {
        PASS();
    } else {
        FAIL("Curious mood not applied");
    }
}

void test_invalid_commands_rejected() {
    TEST("Out-of-range arguments are rejected without change");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.setMood(Mood::HAPPY);

    CommandResult a = animator.setMood(static_cast<Mood>(42));
    CommandResult b = animator.look(static_cast<Direction>(17), Speed::FAST);
    CommandResult c = animator.blink(static_cast<Speed>(9));
    CommandResult d = animator.close(Speed::FAST, static_cast<EyeSelector>(5));
    CommandResult e = animator.setEyelidCoverage(NAN, 0.0f);

    bool ok = !a.ok && !b.ok && !c.ok && !d.ok && !e.ok;
    ok = ok && a.error == EyeError::INVALID_COMMAND && b.error == EyeError::INVALID_COMMAND;
    ok = ok && animator.mood() == Mood::HAPPY && animator.isIdle();
    ok = ok && animator.eye(EyeSide::LEFT).lids() == EyeModel::moodShape(Mood::HAPPY);

    if (ok) {
        PASS();
    } else {
        FAIL("Invalid command accepted or state changed");
    }
}

void test_invalid_tick_ignored() {
    TEST("Negative or NaN tick advances nothing");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.look(Direction::LEFT, Speed::FAST);
    animator.tick(NAN);
    animator.tick(-1.0f);

    bool ok = animator.lookOffsetX() == 0.0f && animator.lookTarget() == Direction::LEFT;

    if (ok) {
        PASS();
    } else {
        FAIL("State advanced");
    }
}

void test_direct_coverage() {
    TEST("Direct coverage on one eye");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    CommandResult r = animator.setEyelidCoverage(0.25f, 1.5f, EyeSelector::LEFT);

    bool ok = r.ok;
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 0.25f;
    ok = ok && animator.eye(EyeSide::LEFT).eyelidBottomCoverage() == 1.0f;
    ok = ok && animator.eye(EyeSide::RIGHT).eyelidTopCoverage() == 0.0f;

    animator.tick(0.1f);
    ok = ok && animator.eye(EyeSide::LEFT).eyelidTopCoverage() == 0.25f;

    if (ok) {
        PASS();
    } else {
        FAIL("Coverage not applied");
    }
}

void test_idle_deterministic() {
    TEST("Idle wander is reproducible for a seed");

    EyeAnimator a(makeConfig(36.0f, 36.0f, 10.0f));
    EyeAnimator b(makeConfig(36.0f, 36.0f, 10.0f));
    a.setIdleEnabled(true);
    b.setIdleEnabled(true);

    bool ok = true;
    bool moved = false;
    bool blinked = false;
    for (int i = 0; i < 400; i++) {
        a.tick(0.05f);
        b.tick(0.05f);
        ok = ok && a.eye(EyeSide::LEFT).centerX() == b.eye(EyeSide::LEFT).centerX();
        ok = ok && a.eye(EyeSide::LEFT).centerY() == b.eye(EyeSide::LEFT).centerY();
        ok = ok && a.eye(EyeSide::RIGHT).lids() == b.eye(EyeSide::RIGHT).lids();
        if (a.lookOffsetX() != 0.0f || a.lookOffsetY() != 0.0f) moved = true;
        if (a.blinkPhase() != BlinkPhase::IDLE) blinked = true;
    }

    if (ok && moved && blinked) {
        PASS();
    } else {
        FAIL(ok ? "Idle never moved or blinked" : "Animators diverged");
    }
}

void test_status_snapshot() {
    TEST("Status reflects controller state");

    EyeAnimator animator(makeConfig(40.0f, 40.0f, 10.0f));
    animator.setMood(Mood::TIRED);
    animator.look(Direction::BOTTOM, Speed::MEDIUM);
    animator.blink(Speed::FAST);
    animator.blink(Speed::FAST);

    EyeAnimator::Status s = animator.status();
    bool ok = s.mood == Mood::TIRED && s.blink_phase == BlinkPhase::CLOSING;
    ok = ok && s.look_target == Direction::BOTTOM && s.queued_lid_requests == 1;
    ok = ok && !s.idle && !s.curious && !s.idle_enabled;
    ok = ok && !s.held_closed_left && !s.held_closed_right;

    if (ok) {
        PASS();
    } else {
        FAIL("Status mismatch");
    }
}

void test_easing_curves() {
    TEST("Easing curves hit their end points");

    bool ok = true;
    for (Easing e : {Easing::LINEAR, Easing::SMOOTHSTEP, Easing::SINE}) {
        ok = ok && EyeAnimator::ease(e, 0.0f) == 0.0f;
        ok = ok && near(EyeAnimator::ease(e, 1.0f), 1.0f);
        ok = ok && near(EyeAnimator::ease(e, 0.5f), 0.5f);
        ok = ok && EyeAnimator::ease(e, 0.25f) < EyeAnimator::ease(e, 0.75f);
    }
    ok = ok && EyeAnimator::ease(Easing::LINEAR, 2.0f) == 1.0f;

    if (ok) {
        PASS();
    } else {
        FAIL("Easing out of shape");
    }
}

int main() {
    Logger::instance().setLevel(LogLevel::ERROR);
    printf("=== Eye Animator Tests ===\n");

    test_initial_layout();
    test_blink_fast_scenario();
    test_blink_idempotent_all_moods();
    test_blink_phase_progress();
    test_tick_carries_leftover_time();
    test_blink_single_eye();
    test_lid_queue();
    test_close_and_open();
    test_open_when_open_is_noop();
    test_angry_scenario();
    test_mood_during_blink();
    test_look_top_right_scenario();
    test_look_bounds_all_directions();
    test_look_replaces_in_flight();
    test_curious_round_trip();
    test_curious_mood();
    test_invalid_commands_rejected();
    test_invalid_tick_ignored();
    test_direct_coverage();
    test_idle_deterministic();
    test_status_snapshot();
    test_easing_curves();

    printf("\nResults: %d passed, %d failed\n", tests_passed, tests_failed);
    return tests_failed > 0 ? 1 : 0;
}
