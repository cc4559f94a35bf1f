#include "update_supervisor.h"
#include "test_support.h"

#include <cassert>
#include <string>
#include <vector>

using namespace fwupd;
using namespace testing_support;

namespace {

struct Rig {
    TempDir dir;
    FirmwareLayout layout = layout_in(dir);
    VersionStore versions{layout.version_path()};
    BackupSet backup{layout};
    FakeSource net{SourceKind::NETWORK, "net"};
    FakeSource sd{SourceKind::LOCAL, "sd"};
    int reboots = 0;
    std::vector<State> states;

    UpdateSupervisor make()
    {
        UpdateSupervisor::Config cfg;
        cfg.sources = {&net, &sd};
        cfg.versions = &versions;
        cfg.backup = &backup;
        cfg.layout = layout;
        cfg.reboot = [this]() { reboots++; };
        cfg.on_status = [this](const Status& s) { states.push_back(s.state); };
        return UpdateSupervisor(cfg);
    }

    std::string live(const std::string& rel) const { return get(layout.live_path(rel)); }
};

} // namespace

static void test_fresh_device_takes_network_update()
{
    Rig r;
    r.net.version = "1.3.0";
    r.net.offer("main.py", "print('1.3.0')\n");
    r.net.offer("lib/sensor.py", "READ = 1\n");
    r.sd.version = "9.9.9";

    UpdateSupervisor sup = r.make();
    assert(sup.run());

    assert(r.versions.current() == "1.3.0");
    assert(!r.backup.exists());
    assert(r.reboots == 1);
    assert(r.live("main.py") == "print('1.3.0')\n");
    assert(r.live("lib/sensor.py") == "READ = 1\n");

    // lower priority source is never consulted once one wins
    assert(r.sd.available_calls == 0);
    assert(r.net.release_calls == 1);

    const Status st = sup.status();
    assert(st.state == State::COMMITTED);
    assert(st.files_applied == 2 && st.files_total == 2);
    assert(st.target_version == "1.3.0");
    assert(std::string(st.source) == "net");

    assert(r.states.size() == 3);
    assert(r.states[0] == State::PROBING);
    assert(r.states[1] == State::APPLYING);
    assert(r.states[2] == State::COMMITTED);

    // same release again: nothing newer
    UpdateSupervisor again = r.make();
    assert(!again.run());
    assert(again.status().reason == FailReason::NO_UPDATE_AVAILABLE);
    assert(r.net.manifest_calls == 1);
    assert(r.reboots == 1);
}

static void test_no_update_when_local_version_equal()
{
    Rig r;
    assert(r.versions.write("1.1.0") == ESP_OK);
    r.net.available = false;
    r.net.version = "5.0.0";
    r.sd.version = "1.1.0";
    r.sd.offer("main.py", "x");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(sup.status().reason == FailReason::NO_UPDATE_AVAILABLE);
    assert(sup.status().state == State::IDLE);
    assert(r.net.version_calls == 0);
    assert(r.net.manifest_calls == 0);
    assert(r.sd.manifest_calls == 0);
    assert(r.net.release_calls == 1 && r.sd.release_calls == 1);
    assert(r.reboots == 0);
    assert(r.versions.current() == "1.1.0");
}

static void test_fetch_failure_is_fail_fast_and_restored()
{
    Rig r;
    assert(r.versions.write("1.0") == ESP_OK);
    for (int i = 1; i <= 5; ++i) {
        const std::string name = "f" + std::to_string(i) + ".py";
        put(r.layout.live_path(name), "old-" + std::to_string(i));
        r.net.offer(name, "new-" + std::to_string(i));
    }
    r.net.version = "2.0";
    r.net.fail_paths.insert("f3.py");

    bool observed = false;
    r.net.on_fetch = [&r, &observed](const ManifestEntry& e) {
        if (e.path != "f3.py") return;
        observed = true;
        assert(r.live("f1.py") == "new-1");
        assert(r.live("f2.py") == "new-2");
        assert(r.live("f3.py") == "old-3");
        assert(r.live("f4.py") == "old-4");
        assert(r.live("f5.py") == "old-5");
        assert(r.backup.exists());
    };

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(observed);
    assert(r.net.fetch_calls == 3);

    for (int i = 1; i <= 5; ++i) {
        assert(r.live("f" + std::to_string(i) + ".py") == "old-" + std::to_string(i));
    }
    assert(!r.backup.exists());
    assert(r.versions.current() == "1.0");
    assert(r.reboots == 0);
    assert(r.sd.available_calls == 0);

    const Status st = sup.status();
    assert(st.reason == FailReason::FETCH_FAILED);
    assert(st.files_applied == 2);
    assert(!st.restore_failed);
    assert(r.states.back() == State::IDLE);
    assert(r.states[r.states.size() - 2] == State::ROLLED_BACK);
}

static void test_secrets_never_written()
{
    Rig r;
    put(r.layout.live_path("secrets.py"), "TOKEN='mine'\n");
    put(r.layout.live_path("lib/secrets.py"), "KEY='mine'\n");
    r.net.version = "1.0.1";
    r.net.offer("secrets.py", "TOKEN='evil'\n");
    r.net.offer("main.py", "ok\n");
    r.net.offer("lib/secrets.py", "KEY='evil'\n");

    UpdateSupervisor sup = r.make();
    assert(sup.run());
    assert(r.live("secrets.py") == "TOKEN='mine'\n");
    assert(r.live("lib/secrets.py") == "KEY='mine'\n");
    assert(r.live("main.py") == "ok\n");
    assert(r.net.fetched.size() == 1 && r.net.fetched[0] == "main.py");
    assert(sup.status().files_total == 1);
}

static void test_version_marker_in_manifest_is_protected()
{
    Rig r;
    r.net.version = "3.0";
    r.net.offer(".version", "99.0\n");
    r.net.offer("backup/x.py", "x");
    r.net.offer("main.py", "three\n");

    UpdateSupervisor sup = r.make();
    assert(sup.run());
    assert(r.versions.current() == "3.0");
    assert(!fs::exists(r.layout.live_path("backup/x.py")));
}

static void test_empty_manifest_stops_the_boot_attempt()
{
    Rig r;
    r.net.version = "2.0";
    r.sd.version = "3.0";
    r.sd.offer("main.py", "sd");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(sup.status().reason == FailReason::MANIFEST_EMPTY);
    assert(r.sd.available_calls == 0);
    assert(!r.backup.exists());
    assert(r.versions.current() == BASELINE_VERSION);

    // a manifest of protected files only counts as empty
    Rig p;
    p.net.version = "2.0";
    p.net.offer("secrets.py", "x");
    UpdateSupervisor sup2 = p.make();
    assert(!sup2.run());
    assert(sup2.status().reason == FailReason::MANIFEST_EMPTY);
    assert(p.net.fetch_calls == 0);
}

static void test_unsafe_manifest_rejected()
{
    Rig r;
    put(r.layout.live_path("main.py"), "live\n");
    r.net.version = "2.0";
    r.net.offer("main.py", "new\n");
    r.net.offer("../boot.py", "escape\n");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(sup.status().reason == FailReason::MANIFEST_REJECTED);
    assert(r.net.fetch_calls == 0);
    assert(!r.backup.exists());
    assert(r.live("main.py") == "live\n");
}

static void test_backup_failure_touches_nothing()
{
    Rig r;
    put(r.layout.live_path("main.py"), "live\n");
    // a plain file where the backup directory must go
    put(r.layout.backup_path(), "not a directory");
    r.net.version = "2.0";
    r.net.offer("main.py", "new\n");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(sup.status().reason == FailReason::BACKUP_FAILED);
    assert(r.net.fetch_calls == 0);
    assert(r.live("main.py") == "live\n");
    assert(r.reboots == 0);
}

static void test_write_failure_rolls_back()
{
    Rig r;
    put(r.layout.live_path("main.py"), "live\n");
    put(r.layout.live_path("blocker"), "regular file");
    r.net.version = "2.0";
    r.net.offer("main.py", "new\n");
    r.net.offer("blocker/inner.py", "cannot land\n");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(sup.status().reason == FailReason::WRITE_FAILED);
    assert(r.live("main.py") == "live\n");
    assert(r.live("blocker") == "regular file");
    assert(!r.backup.exists());
    assert(r.reboots == 0);
}

static void test_new_files_removed_on_rollback()
{
    Rig r;
    put(r.layout.live_path("main.py"), "live\n");
    r.net.version = "2.0";
    r.net.offer("added.py", "brand new\n");
    r.net.offer("main.py", "new\n");
    r.net.fail_paths.insert("main.py");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(!fs::exists(r.layout.live_path("added.py")));
    assert(r.live("main.py") == "live\n");
}

static void test_local_source_when_network_down()
{
    Rig r;
    r.net.available = false;
    r.sd.version = "v1.2";
    r.sd.offer("main.py", "from sd\n");

    UpdateSupervisor sup = r.make();
    assert(sup.run());
    assert(r.live("main.py") == "from sd\n");
    assert(r.versions.current() == "v1.2");
    assert(r.net.release_calls == 1 && r.sd.release_calls == 1);
    assert(std::string(sup.status().source) == "sd");
}

static void test_unreachable_network_falls_through()
{
    Rig r;
    r.net.version.clear();  // e.g. rate limited
    r.sd.version = "1.0";
    r.sd.offer("main.py", "sd\n");

    UpdateSupervisor sup = r.make();
    assert(sup.run());
    assert(r.net.version_calls == 1);
    assert(r.net.manifest_calls == 0);
    assert(r.live("main.py") == "sd\n");
}

static void test_check_only_probes()
{
    Rig r;
    put(r.layout.live_path("main.py"), "live\n");
    r.net.version = "4.0";
    r.net.offer("main.py", "new\n");

    UpdateSupervisor sup = r.make();
    CheckResult res;
    assert(sup.check(res) == ESP_OK);
    assert(res.update_available);
    assert(std::string(res.source) == "net");
    assert(res.current_version == BASELINE_VERSION);
    assert(res.target_version == "4.0");
    assert(r.net.manifest_calls == 0);
    assert(r.net.release_calls == 1);
    assert(!r.backup.exists());
    assert(r.live("main.py") == "live\n");
    assert(r.reboots == 0);

    r.net.version = "0.0";
    assert(sup.check(res) == ESP_OK);
    assert(!res.update_available);
    assert(res.source == nullptr);
}

static void test_recover_interrupted_attempt()
{
    Rig r;
    put(r.layout.live_path("main.py"), "v1\n");
    assert(r.versions.write("1.0") == ESP_OK);
    assert(r.backup.begin({"main.py", "added.py"}, "1.0") == ESP_OK);

    // power lost after the new version was persisted, before cleanup
    put(r.layout.live_path("main.py"), "v2\n");
    put(r.layout.live_path("added.py"), "v2\n");
    assert(r.versions.write("2.0") == ESP_OK);

    UpdateSupervisor sup = r.make();
    assert(sup.recover_interrupted());
    assert(r.live("main.py") == "v1\n");
    assert(!fs::exists(r.layout.live_path("added.py")));
    assert(r.versions.current() == "1.0");
    assert(!r.backup.exists());
    assert(r.reboots == 0);
    assert(!sup.recover_interrupted());
}

static void test_recover_without_prior_version_erases_marker()
{
    Rig r;
    put(r.layout.live_path("main.py"), "factory\n");
    assert(r.backup.begin({"main.py"}) == ESP_OK);
    put(r.layout.live_path("main.py"), "half\n");
    assert(r.versions.write("2.0") == ESP_OK);

    // run() recovers on its own before probing
    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(r.live("main.py") == "factory\n");
    assert(r.versions.current() == BASELINE_VERSION);
    assert(!r.backup.exists());
}

static void test_protected_names_match_in_any_case()
{
    Rig r;
    put(r.layout.live_path("secrets.py"), "TOKEN='mine'\n");
    r.net.version = "3.0";
    r.net.offer("Secrets.py", "TOKEN='evil'\n");
    r.net.offer(".VERSION", "99.0\n");
    r.net.offer("BACKUP/x.py", "x");
    r.net.offer("main.py", "three\n");

    UpdateSupervisor sup = r.make();
    assert(sup.run());
    assert(r.net.fetched.size() == 1 && r.net.fetched[0] == "main.py");
    assert(sup.status().files_total == 1);
    assert(r.live("secrets.py") == "TOKEN='mine'\n");
    assert(!fs::exists(r.layout.live_path("Secrets.py")));
    assert(!fs::exists(r.layout.live_path("BACKUP")));
    assert(r.versions.current() == "3.0");
}

static void test_control_bytes_reject_manifest()
{
    Rig r;
    put(r.layout.live_path("main.py"), "live\n");
    r.net.version = "2.0";
    r.net.offer("main.py", "new\n");
    r.net.offer("x.py\ncreated main.py", "forged\n");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(sup.status().reason == FailReason::MANIFEST_REJECTED);
    assert(r.net.fetch_calls == 0);
    assert(!r.backup.exists());
    assert(r.live("main.py") == "live\n");
}

static void test_restore_failure_is_reported()
{
    Rig r;
    assert(r.versions.write("1.0") == ESP_OK);
    put(r.layout.live_path("a.py"), "old-a");
    put(r.layout.live_path("b.py"), "old-b");
    put(r.layout.live_path("c.py"), "old-c");
    r.net.version = "2.0";
    r.net.offer("a.py", "new-a");
    r.net.offer("b.py", "new-b");
    r.net.offer("c.py", "new-c");
    r.net.fail_paths.insert("c.py");

    // a directory takes the place of a.py, so it cannot be written back
    r.net.on_fetch = [&r](const ManifestEntry& e) {
        if (e.path != "c.py") return;
        assert(fs::remove_tree(r.layout.live_path("a.py")) == ESP_OK);
        put(r.layout.live_path("a.py/stuck"), "x");
    };

    UpdateSupervisor sup = r.make();
    assert(!sup.run());

    const Status st = sup.status();
    assert(st.reason == FailReason::FETCH_FAILED);
    assert(st.restore_failed);
    assert(st.state == State::IDLE);
    assert(fs::is_dir(r.layout.live_path("a.py")));
    assert(r.live("b.py") == "old-b");
    assert(r.live("c.py") == "old-c");
    assert(!r.backup.exists());
    assert(r.versions.current() == "1.0");
    assert(r.reboots == 0);
}

static void test_created_directories_removed_on_rollback()
{
    Rig r;
    put(r.layout.live_path("main.py"), "live\n");
    r.net.version = "2.0";
    r.net.offer("drivers/i2c/bme280.py", "new\n");
    r.net.offer("main.py", "new\n");
    r.net.fail_paths.insert("main.py");

    UpdateSupervisor sup = r.make();
    assert(!sup.run());
    assert(r.net.fetched.size() == 2);
    assert(!fs::exists(r.layout.live_path("drivers")));
    assert(r.live("main.py") == "live\n");
}

static void test_missing_dependencies()
{
    UpdateSupervisor::Config cfg;
    UpdateSupervisor sup(cfg);
    assert(!sup.run());
    CheckResult res;
    assert(sup.check(res) == ESP_ERR_INVALID_ARG);
    assert(!sup.recover_interrupted());
}

int main()
{
    test_fresh_device_takes_network_update();
    test_no_update_when_local_version_equal();
    test_fetch_failure_is_fail_fast_and_restored();
    test_secrets_never_written();
    test_version_marker_in_manifest_is_protected();
    test_empty_manifest_stops_the_boot_attempt();
    test_unsafe_manifest_rejected();
    test_backup_failure_touches_nothing();
    test_write_failure_rolls_back();
    test_new_files_removed_on_rollback();
    test_local_source_when_network_down();
    test_unreachable_network_falls_through();
    test_check_only_probes();
    test_recover_interrupted_attempt();
    test_recover_without_prior_version_erases_marker();
    test_protected_names_match_in_any_case();
    test_control_bytes_reject_manifest();
    test_restore_failure_is_reported();
    test_created_directories_removed_on_rollback();
    test_missing_dependencies();
    return 0;
}
