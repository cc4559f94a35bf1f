#include "rollback_trigger.h"
#include "test_support.h"

#include <cassert>
#include <string>

using namespace fwupd;
using namespace testing_support;

static bool run_detect(FakeClock& clock, ScriptedInput& input, const TriggerTiming& t = TriggerTiming{})
{
    RollbackTrigger trigger(input, clock, t);
    return trigger.detect();
}

static void test_idle_button_costs_nothing()
{
    FakeClock clock;
    ScriptedInput input(clock);
    assert(!run_detect(clock, input));
    assert(input.reads == 1);
    assert(clock.slept == 0);
}

static void test_double_press_detected()
{
    FakeClock clock;
    ScriptedInput input(clock);
    input.press(1000, 1400);
    input.press(1700, 1900);
    assert(run_detect(clock, input));
    assert(clock.now - 1000 <= 3000);
}

static void test_single_press_times_out()
{
    FakeClock clock;
    ScriptedInput input(clock);
    input.press(1000, 1400);
    assert(!run_detect(clock, input));
    // second window is 1000 ms after release
    assert(clock.now >= 2400);
    assert(clock.now - 1000 <= 3000 + 10);
}

static void test_long_hold_is_not_a_trigger()
{
    FakeClock clock;
    ScriptedInput input(clock);
    input.press(1000, 60000);
    assert(!run_detect(clock, input));
    assert(clock.now - 1000 <= 2000 + 10);
}

static void test_bounce_ignored()
{
    FakeClock clock;
    ScriptedInput input(clock);
    input.press(1000, 1050);
    input.press(1200, 1300);
    assert(!run_detect(clock, input));
    assert(clock.now - 1000 <= 100);
}

static void test_late_or_short_second_press()
{
    FakeClock late_clock;
    ScriptedInput late(late_clock);
    late.press(1000, 1400);
    late.press(2600, 2900);
    assert(!run_detect(late_clock, late));

    FakeClock short_clock;
    ScriptedInput blip(short_clock);
    blip.press(1000, 1400);
    blip.press(1700, 1750);
    assert(!run_detect(short_clock, blip));
}

static void test_budget_caps_detection()
{
    TriggerTiming t;
    t.release_window_ms = 2500;
    t.second_window_ms = 1000;
    t.budget_ms = 3000;

    FakeClock clock;
    ScriptedInput input(clock);
    input.press(1000, 3400);
    input.press(4100, 4500);
    assert(!run_detect(clock, input, t));
    assert(clock.now - 1000 <= 3000 + t.poll_ms);
}

static void test_manual_rollback_without_backup()
{
    TempDir dir;
    const FirmwareLayout l = layout_in(dir);
    VersionStore versions(l.version_path());
    BackupSet backup(l);
    assert(versions.write("2.0") == ESP_OK);

    int reboots = 0;
    assert(perform_manual_rollback(backup, versions, [&reboots]() { reboots++; }) == ESP_ERR_NOT_FOUND);
    assert(reboots == 0);
    assert(versions.current() == "2.0");
}

static void test_manual_rollback_restores_and_reboots()
{
    TempDir dir;
    const FirmwareLayout l = layout_in(dir);
    VersionStore versions(l.version_path());
    BackupSet backup(l);

    put(l.live_path("main.py"), "v1\n");
    assert(versions.write("1.0") == ESP_OK);
    assert(backup.begin({"main.py"}, "1.0") == ESP_OK);
    put(l.live_path("main.py"), "v2\n");
    assert(versions.write("2.0") == ESP_OK);

    int reboots = 0;
    assert(perform_manual_rollback(backup, versions, [&reboots]() { reboots++; }) == ESP_OK);
    assert(reboots == 1);
    assert(get(l.live_path("main.py")) == "v1\n");
    assert(!backup.exists());
    assert(!fs::exists(l.version_path()));
    assert(versions.current() == BASELINE_VERSION);
}

static void test_manual_rollback_reboots_after_partial_restore()
{
    TempDir dir;
    const FirmwareLayout l = layout_in(dir);
    VersionStore versions(l.version_path());
    BackupSet backup(l);

    put(l.live_path("boot.py"), "b1\n");
    put(l.live_path("main.py"), "m1\n");
    assert(versions.write("1.0") == ESP_OK);
    assert(backup.begin({"boot.py", "main.py"}, "1.0") == ESP_OK);
    assert(fs::remove_tree(l.live_path("boot.py")) == ESP_OK);
    put(l.live_path("boot.py/stuck"), "x");
    put(l.live_path("main.py"), "m2\n");
    assert(versions.write("2.0") == ESP_OK);

    int reboots = 0;
    assert(perform_manual_rollback(backup, versions, [&reboots]() { reboots++; }) == ESP_FAIL);
    assert(reboots == 1);
    assert(get(l.live_path("main.py")) == "m1\n");
    assert(fs::is_dir(l.live_path("boot.py")));
    assert(!backup.exists());
    assert(versions.current() == BASELINE_VERSION);
}

int main()
{
    test_idle_button_costs_nothing();
    test_double_press_detected();
    test_single_press_times_out();
    test_long_hold_is_not_a_trigger();
    test_bounce_ignored();
    test_late_or_short_second_press();
    test_budget_caps_detection();
    test_manual_rollback_without_backup();
    test_manual_rollback_restores_and_reboots();
    test_manual_rollback_reboots_after_partial_restore();
    return 0;
}
