#include "sync_engine.hpp"
#include "test_runner_utils.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

namespace fs = std::filesystem;
using sharenode::test::FakeRegistry;
using sharenode::test::TempWorkspace;
using namespace std::chrono_literals;

constexpr const char* kOwner = "peer-a";

struct TestContext {
  sharenode::test::LogCapture& logs;
  bool verbose = false;
};

std::unique_ptr<SyncEngine> make_engine(const std::shared_ptr<FakeRegistry>& registry,
                                        TestContext& ctx,
                                        std::optional<fs::path> watched = std::nullopt) {
  SyncEngine::Options options;
  options.owner_id = kOwner;
  options.owner_address = "127.0.0.1";
  options.owner_port = 4100;
  options.watched_directory = std::move(watched);
  auto engine = std::make_unique<SyncEngine>(registry, options, std::make_shared<Logger>("sync-engine"));
  ctx.logs.attach(engine->logger());
  return engine;
}

std::set<std::string> table_names(const SyncEngine& engine) {
  std::set<std::string> names;
  for(const auto& entry : engine.registrations().list()) {
    names.insert(entry.file_name());
  }
  return names;
}

std::set<std::string> names(std::initializer_list<const char*> items) {
  return std::set<std::string>(items.begin(), items.end());
}

bool expect(bool condition, const char* what, TestContext& ctx) {
  if(!condition && ctx.verbose) {
    std::cout << "\n    expectation failed: " << what << "\n";
  }
  return condition;
}

bool test_hidden_files_are_not_shared(TestContext& ctx) {
  TempWorkspace ws("hidden");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");
  ws.write_file("share/b.txt", "bravo");
  ws.write_file("share/.hidden", "secret");
  ws.make_dir("share/nested");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  bool ran = engine->reconcile();

  return expect(ran, "reconcile ran", ctx) &&
         expect(table_names(*engine) == names({"a.txt", "b.txt"}), "table holds visible files", ctx) &&
         expect(registry->listed_names(kOwner) == names({"a.txt", "b.txt"}), "registry holds visible files", ctx);
}

bool test_exclusion_removes_listing(TestContext& ctx) {
  TempWorkspace ws("exclude");
  auto dir = ws.make_dir("share");
  auto a = ws.write_file("share/a.txt", "alpha");
  ws.write_file("share/b.txt", "bravo");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  engine->reconcile();
  engine->exclude_file(a);
  engine->reconcile();

  return expect(fs::exists(a), "file still on disk", ctx) &&
         expect(table_names(*engine) == names({"b.txt"}), "table holds only b.txt", ctx) &&
         expect(registry->listed_names(kOwner) == names({"b.txt"}), "registry holds only b.txt", ctx) &&
         expect(engine->excluded_files().count(normalize_path(a)) == 1, "a.txt recorded as excluded", ctx);
}

bool test_reconcile_is_idempotent(TestContext& ctx) {
  TempWorkspace ws("idempotent");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");
  ws.write_file("share/b.txt", "bravo");
  auto extra = ws.write_file("loose/c.txt", "charlie");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  std::string error;
  engine->add_file(extra, error);
  engine->reconcile();

  auto registers = registry->register_calls();
  auto unregisters = registry->unregister_calls();
  auto before = engine->registrations().list();
  engine->reconcile();
  auto after = engine->registrations().list();

  bool same_ids = before.size() == after.size() &&
                  std::equal(before.begin(), before.end(), after.begin(),
                             [](const Registration& l, const Registration& r){ return l.id == r.id && l.path == r.path; });
  return expect(registry->register_calls() == registers, "no new registrations", ctx) &&
         expect(registry->unregister_calls() == unregisters, "no new de-listings", ctx) &&
         expect(same_ids, "table unchanged", ctx);
}

bool test_shared_and_excluded_stay_disjoint(TestContext& ctx) {
  TempWorkspace ws("disjoint");
  auto file = ws.write_file("loose/x.txt", "x-ray");
  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx);
  auto key = normalize_path(file);

  auto disjoint = [&]{
    auto shared = engine->user_shared_files();
    auto excluded = engine->excluded_files();
    std::vector<fs::path> both;
    std::set_intersection(shared.begin(), shared.end(), excluded.begin(), excluded.end(),
                          std::back_inserter(both));
    return both.empty();
  };

  std::string error;
  bool ok = engine->add_file(file, error) == SyncEngine::AddResult::Added && disjoint();
  engine->exclude_file(file);
  ok = ok && disjoint() && engine->excluded_files().count(key) == 1 &&
       engine->registrations().empty();
  ok = ok && engine->add_file(file, error) == SyncEngine::AddResult::Added && disjoint();
  engine->reconcile();
  return expect(ok, "sets disjoint after each step", ctx) &&
         expect(engine->user_shared_files().count(key) == 1, "re-shared file is user shared", ctx) &&
         expect(engine->excluded_files().empty(), "exclusion lifted", ctx) &&
         expect(table_names(*engine) == names({"x.txt"}), "re-shared file registered", ctx);
}

bool test_name_conflict_keeps_existing_listing(TestContext& ctx) {
  TempWorkspace ws("conflict");
  auto dir = ws.make_dir("share");
  auto original = ws.write_file("share/a.txt", "first");
  auto rival = ws.write_file("other/a.txt", "second");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  engine->reconcile();
  auto before = engine->registrations().find_by_name("a.txt");

  std::string error;
  auto result = engine->add_file(rival, error);
  engine->reconcile();
  auto after = engine->registrations().find_by_name("a.txt");

  return expect(result == SyncEngine::AddResult::NameConflict, "add reports conflict", ctx) &&
         expect(!error.empty(), "conflict explained", ctx) &&
         expect(before && after && before->id == after->id && after->path == normalize_path(original),
                "existing entry untouched", ctx) &&
         expect(engine->user_shared_files().empty(), "rival not tracked", ctx) &&
         expect(ctx.logs.contains("already shared from"), "conflict logged", ctx);
}

bool test_registry_name_conflict_leaves_state_unchanged(TestContext& ctx) {
  TempWorkspace ws("registry_conflict");
  auto file = ws.write_file("loose/z.txt", "zulu");
  auto registry = std::make_shared<FakeRegistry>();
  // Listing left over from an earlier session of the same owner.
  registry->add_foreign_listing(kOwner, "z.txt", "127.0.0.1", 4100);
  auto engine = make_engine(registry, ctx);

  std::string error;
  auto result = engine->add_file(file, error);
  return expect(result == SyncEngine::AddResult::NameConflict, "registry conflict surfaced", ctx) &&
         expect(engine->registrations().empty(), "nothing registered locally", ctx) &&
         expect(engine->user_shared_files().empty(), "file not tracked", ctx);
}

bool test_add_file_failure_leaves_state_unchanged(TestContext& ctx) {
  TempWorkspace ws("add_failure");
  auto file = ws.write_file("loose/q.txt", "quebec");
  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx);

  registry->set_unavailable(true);
  std::string error;
  auto offline = engine->add_file(file, error);
  bool offline_ok = offline == SyncEngine::AddResult::Failed && !error.empty() &&
                    engine->user_shared_files().empty() && engine->registrations().empty();

  auto missing = engine->add_file(ws.root() / "loose" / "missing.txt", error);
  registry->set_unavailable(false);
  auto directory = engine->add_file(ws.root() / "loose", error);

  return expect(offline_ok, "offline registry leaves state alone", ctx) &&
         expect(missing == SyncEngine::AddResult::Failed, "missing file rejected", ctx) &&
         expect(directory == SyncEngine::AddResult::Failed, "directory rejected", ctx) &&
         expect(registry->register_calls() == 1, "only the offline attempt reached the registry", ctx);
}

bool test_heartbeat_loss_recovered_in_same_pass(TestContext& ctx) {
  TempWorkspace ws("heartbeat_once");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");
  ws.write_file("share/b.txt", "bravo");

  auto registry = std::make_shared<FakeRegistry>();
  registry->script_heartbeats({false, true});
  auto engine = make_engine(registry, ctx, dir);
  engine->reconcile();

  return expect(table_names(*engine) == names({"a.txt", "b.txt"}), "table repopulated", ctx) &&
         expect(registry->listed_names(kOwner) == names({"a.txt", "b.txt"}), "registry repopulated", ctx) &&
         expect(registry->heartbeat_calls() == 2, "two heartbeats", ctx) &&
         expect(registry->register_calls() == 4, "each file registered twice", ctx) &&
         expect(engine->completed_passes() == 1, "single invocation", ctx) &&
         expect(ctx.logs.contains("Attempting immediate re-sync"), "loss logged", ctx);
}

bool test_heartbeat_retry_is_bounded(TestContext& ctx) {
  TempWorkspace ws("heartbeat_bound");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");
  ws.write_file("share/b.txt", "bravo");

  auto registry = std::make_shared<FakeRegistry>();
  registry->set_default_heartbeat(false);
  auto engine = make_engine(registry, ctx, dir);

  std::atomic<bool> returned{false};
  std::thread worker([&]{
    engine->reconcile();
    returned = true;
  });
  bool finished = sharenode::test::wait_for_condition([&]{ return returned.load(); }, 5s);
  if(!finished) {
    // Unblock the worker before failing.
    registry->set_default_heartbeat(true);
  }
  worker.join();

  // One initial attempt plus three retries, two files each.
  return expect(finished, "reconcile returned", ctx) &&
         expect(registry->heartbeat_calls() == 4, "four heartbeats", ctx) &&
         expect(registry->register_calls() == 8, "three re-registration rounds", ctx) &&
         expect(ctx.logs.contains("Giving up re-registration"), "give-up logged", ctx);
}

bool test_directory_swap_mid_flight(TestContext& ctx) {
  TempWorkspace ws("swap");
  auto old_dir = ws.make_dir("old");
  auto new_dir = ws.make_dir("new");
  ws.write_file("old/a1.txt", "old one");
  ws.write_file("new/b1.txt", "new one");
  ws.write_file("new/b2.txt", "new two");

  auto registry = std::make_shared<FakeRegistry>();
  sharenode::test::Gate gate;
  std::atomic<bool> first{true};
  registry->set_register_hook([&](const std::string&){
    if(first.exchange(false)) gate.arrive_and_wait();
  });

  auto engine = make_engine(registry, ctx, old_dir);
  std::thread pass([&]{ engine->reconcile(); });

  bool parked = gate.wait_arrived(5s);
  engine->set_watched_directory(new_dir);
  gate.release();
  pass.join();
  registry->set_register_hook(nullptr);

  // The interrupted invocation went around again against the new directory.
  return expect(parked, "pass parked inside register", ctx) &&
         expect(table_names(*engine) == names({"b1.txt", "b2.txt"}), "table follows new directory", ctx) &&
         expect(registry->listed_names(kOwner) == names({"b1.txt", "b2.txt"}), "old listing withdrawn", ctx) &&
         expect(engine->watched_directory() == normalize_path(new_dir), "watched directory switched", ctx);
}

bool test_remove_during_pass_stays_removed(TestContext& ctx) {
  TempWorkspace ws("remove_mid_flight");
  auto dir = ws.make_dir("a");
  ws.write_file("a/a.txt", "alpha");
  auto loose = ws.write_file("loose/r.txt", "loose");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  std::string error;
  bool added = engine->add_file(loose, error) == SyncEngine::AddResult::Added;

  sharenode::test::Gate gate;
  std::atomic<bool> first{true};
  registry->set_register_hook([&](const std::string&){
    if(first.exchange(false)) gate.arrive_and_wait();
  });
  // The pass has already taken r.txt into its desired set when it parks on a.txt.
  std::thread pass([&]{ engine->reconcile(); });
  bool parked = gate.wait_arrived(5s);
  engine->remove_file(loose);
  gate.release();
  pass.join();
  registry->set_register_hook(nullptr);

  engine->reconcile();
  engine->reconcile();

  return expect(added, "loose file shared", ctx) &&
         expect(parked, "pass parked inside register", ctx) &&
         expect(engine->user_shared_files().empty(), "no longer user shared", ctx) &&
         expect(table_names(*engine) == names({"a.txt"}), "table drops the removed file", ctx) &&
         expect(registry->listed_names(kOwner) == names({"a.txt"}), "registry drops the removed file", ctx);
}

bool test_set_watched_directory_does_not_block(TestContext& ctx) {
  TempWorkspace ws("async_swap");
  auto old_dir = ws.make_dir("old");
  auto new_dir = ws.make_dir("new");
  ws.write_file("old/a.txt", "alpha");
  ws.write_file("new/n.txt", "november");

  auto registry = std::make_shared<FakeRegistry>();
  sharenode::test::Gate gate;
  std::atomic<bool> first{true};
  registry->set_register_hook([&](const std::string&){
    if(first.exchange(false)) gate.arrive_and_wait();
  });

  auto engine = make_engine(registry, ctx, old_dir);
  std::thread pass([&]{ engine->reconcile(); });
  bool parked = gate.wait_arrived(5s);

  // A pass is stuck inside the registry; the setter must still return at once.
  auto calls_before = registry->register_calls() + registry->unregister_calls();
  auto started = std::chrono::steady_clock::now();
  engine->set_watched_directory(new_dir);
  auto elapsed = std::chrono::steady_clock::now() - started;
  bool quiet = (registry->register_calls() + registry->unregister_calls()) == calls_before;

  gate.release();
  pass.join();
  registry->set_register_hook(nullptr);

  bool converged = sharenode::test::wait_for_condition([&]{
    return table_names(*engine) == names({"n.txt"}) &&
           registry->listed_names(kOwner) == names({"n.txt"});
  }, 5s);
  return expect(parked, "pass parked inside register", ctx) &&
         expect(elapsed < 1s, "setter returned promptly", ctx) &&
         expect(quiet, "setter did not call the registry", ctx) &&
         expect(converged, "pending change converged", ctx);
}

bool test_unset_watched_directory_delists(TestContext& ctx) {
  TempWorkspace ws("unset");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");
  auto loose = ws.write_file("loose/l.txt", "lima");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  std::string error;
  engine->add_file(loose, error);
  engine->reconcile();
  engine->set_watched_directory(std::nullopt);

  bool converged = sharenode::test::wait_for_condition([&]{
    return table_names(*engine) == names({"l.txt"});
  }, 5s);
  return expect(converged, "only the hand-shared file remains", ctx) &&
         expect(!engine->watched_directory(), "no directory watched", ctx) &&
         expect(registry->listed_names(kOwner) == names({"l.txt"}), "registry agrees", ctx);
}

bool test_convergence_after_mixed_edits(TestContext& ctx) {
  TempWorkspace ws("converge");
  auto dir1 = ws.make_dir("one");
  auto dir2 = ws.make_dir("two");
  auto a = ws.write_file("one/a.txt", "alpha");
  ws.write_file("one/b.txt", "bravo");
  auto c = ws.write_file("loose/c.txt", "charlie");
  ws.write_file("two/d.txt", "delta");
  auto e = ws.write_file("two/e.txt", "echo");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir1);
  engine->reconcile();

  std::string error;
  engine->add_file(c, error);
  engine->exclude_file(a);
  engine->set_watched_directory(dir2);
  engine->exclude_file(e);

  // Let the queued background pass finish, then one quiescent pass.
  sharenode::test::wait_for_condition([&]{ return engine->completed_passes() >= 2; }, 5s);
  bool quiescent = sharenode::test::wait_for_condition([&]{ return engine->reconcile(); }, 5s);

  return expect(quiescent, "final pass ran", ctx) &&
         expect(table_names(*engine) == names({"c.txt", "d.txt"}), "table equals desired set", ctx) &&
         expect(registry->listed_names(kOwner) == names({"c.txt", "d.txt"}), "registry equals desired set", ctx) &&
         expect(engine->path_for_file_name("c.txt") == normalize_path(c), "c.txt resolves to its path", ctx);
}

bool test_disappearing_files_are_dropped(TestContext& ctx) {
  TempWorkspace ws("vanish");
  auto dir = ws.make_dir("share");
  auto a = ws.write_file("share/a.txt", "alpha");
  ws.write_file("share/b.txt", "bravo");
  auto loose = ws.write_file("loose/l.txt", "lima");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  std::string error;
  engine->add_file(loose, error);
  engine->reconcile();

  fs::remove(a);
  fs::remove(loose);
  engine->reconcile();

  return expect(table_names(*engine) == names({"b.txt"}), "vanished files dropped", ctx) &&
         expect(registry->listed_names(kOwner) == names({"b.txt"}), "registry de-listed them", ctx) &&
         expect(engine->user_shared_files().empty(), "vanished hand-shared file forgotten", ctx);
}

bool test_registry_outage_is_tolerated(TestContext& ctx) {
  TempWorkspace ws("outage");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");

  auto registry = std::make_shared<FakeRegistry>();
  registry->set_unavailable(true);
  auto engine = make_engine(registry, ctx, dir);

  bool ran = engine->reconcile();
  bool empty_while_down = engine->registrations().empty();
  bool logged = ctx.logs.contains("Error contacting the registry");

  registry->set_unavailable(false);
  engine->reconcile();

  return expect(ran, "reconcile survived the outage", ctx) &&
         expect(empty_while_down, "nothing registered while down", ctx) &&
         expect(logged, "outage logged", ctx) &&
         expect(table_names(*engine) == names({"a.txt"}), "recovered on the next pass", ctx);
}

bool test_heartbeat_outage_keeps_table(TestContext& ctx) {
  TempWorkspace ws("heartbeat_outage");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  engine->reconcile();

  registry->set_unavailable(true);
  engine->reconcile();
  bool kept = table_names(*engine) == names({"a.txt"});
  registry->set_unavailable(false);

  return expect(kept, "transient failure keeps the table", ctx) &&
         expect(registry->register_calls() == 1, "no re-registration", ctx);
}

bool test_unregister_failure_is_retried(TestContext& ctx) {
  TempWorkspace ws("unregister_failure");
  auto dir = ws.make_dir("share");
  auto a = ws.write_file("share/a.txt", "alpha");
  ws.write_file("share/b.txt", "bravo");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  engine->reconcile();

  registry->set_refuse_unregister(true);
  fs::remove(a);
  engine->reconcile();
  bool retained = table_names(*engine) == names({"a.txt", "b.txt"});

  registry->set_refuse_unregister(false);
  engine->reconcile();

  return expect(retained, "failed de-list kept in table", ctx) &&
         expect(ctx.logs.contains("will retry"), "failure logged", ctx) &&
         expect(table_names(*engine) == names({"b.txt"}), "de-listed once the registry accepts", ctx) &&
         expect(registry->listed_names(kOwner) == names({"b.txt"}), "registry agrees", ctx);
}

bool test_remove_file_drops_entry_even_if_delist_fails(TestContext& ctx) {
  TempWorkspace ws("remove");
  auto file = ws.write_file("loose/r.txt", "romeo");
  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx);

  std::string error;
  engine->add_file(file, error);
  registry->set_refuse_unregister(true);
  engine->remove_file(file);
  registry->set_refuse_unregister(false);

  return expect(engine->registrations().empty(), "local entry removed", ctx) &&
         expect(engine->user_shared_files().empty(), "no longer user shared", ctx) &&
         expect(ctx.logs.contains("Immediate de-list"), "failure logged", ctx);
}

bool test_vanished_watched_directory_is_unset(TestContext& ctx) {
  TempWorkspace ws("vanished_dir");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  engine->reconcile();

  fs::remove_all(dir);
  engine->reconcile();

  return expect(!engine->watched_directory(), "watched directory reset", ctx) &&
         expect(engine->registrations().empty(), "its files de-listed", ctx) &&
         expect(registry->listed_names(kOwner).empty(), "registry emptied", ctx) &&
         expect(ctx.logs.contains("no longer exists"), "reset logged", ctx);
}

bool test_change_notification_delivery(TestContext& ctx) {
  TempWorkspace ws("notify");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");
  auto loose = ws.write_file("loose/l.txt", "lima");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  std::atomic<int> notifications{0};
  auto handle = engine->add_update_listener([&]{ notifications++; });

  engine->reconcile();
  int after_pass = notifications.load();
  std::string error;
  engine->add_file(loose, error);
  int after_add = notifications.load();

  engine->remove_update_listener(handle);
  engine->reconcile();

  return expect(after_pass >= 1, "pass notified", ctx) &&
         expect(after_add > after_pass, "add notified", ctx) &&
         expect(notifications.load() == after_add, "removed listener silent", ctx);
}

bool test_accessors(TestContext& ctx) {
  TempWorkspace ws("accessors");
  auto dir = ws.make_dir("share");
  auto a = ws.write_file("share/a.txt", "alpha");
  auto outside = ws.write_file("loose/o.txt", "oscar");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  std::string error;
  engine->add_file(outside, error);
  engine->reconcile();

  auto shared = engine->shared_files();
  std::vector<fs::path> expected = {normalize_path(a), normalize_path(outside)};
  std::sort(expected.begin(), expected.end());

  return expect(engine->is_from_watched_directory(a), "a.txt inside", ctx) &&
         expect(!engine->is_from_watched_directory(outside), "o.txt outside", ctx) &&
         expect(engine->path_for_file_name("a.txt") == normalize_path(a), "lookup by name", ctx) &&
         expect(!engine->path_for_file_name("nope.txt"), "unknown name", ctx) &&
         expect(shared == expected, "shared snapshot", ctx);
}

bool test_periodic_monitoring(TestContext& ctx) {
  TempWorkspace ws("monitor");
  auto dir = ws.make_dir("share");
  ws.write_file("share/a.txt", "alpha");

  auto registry = std::make_shared<FakeRegistry>();
  auto engine = make_engine(registry, ctx, dir);
  engine->start_monitoring(std::chrono::seconds(1));

  bool first = sharenode::test::wait_for_condition([&]{ return table_names(*engine) == names({"a.txt"}); }, 3s);
  ws.write_file("share/late.txt", "later");
  bool picked_up = sharenode::test::wait_for_condition([&]{
    return table_names(*engine) == names({"a.txt", "late.txt"});
  }, 5s);
  engine->stop();
  auto passes = engine->completed_passes();
  std::this_thread::sleep_for(1500ms);

  return expect(first, "first pass ran immediately", ctx) &&
         expect(picked_up, "later pass saw the new file", ctx) &&
         expect(engine->completed_passes() == passes, "no passes after stop", ctx);
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("SHARENODE_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("SHARENODE_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  sharenode::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"hidden_files_are_not_shared", test_hidden_files_are_not_shared},
    {"exclusion_removes_listing", test_exclusion_removes_listing},
    {"reconcile_is_idempotent", test_reconcile_is_idempotent},
    {"shared_and_excluded_stay_disjoint", test_shared_and_excluded_stay_disjoint},
    {"name_conflict_keeps_existing_listing", test_name_conflict_keeps_existing_listing},
    {"registry_name_conflict_leaves_state_unchanged", test_registry_name_conflict_leaves_state_unchanged},
    {"add_file_failure_leaves_state_unchanged", test_add_file_failure_leaves_state_unchanged},
    {"heartbeat_loss_recovered_in_same_pass", test_heartbeat_loss_recovered_in_same_pass},
    {"heartbeat_retry_is_bounded", test_heartbeat_retry_is_bounded},
    {"directory_swap_mid_flight", test_directory_swap_mid_flight},
    {"remove_during_pass_stays_removed", test_remove_during_pass_stays_removed},
    {"set_watched_directory_does_not_block", test_set_watched_directory_does_not_block},
    {"unset_watched_directory_delists", test_unset_watched_directory_delists},
    {"convergence_after_mixed_edits", test_convergence_after_mixed_edits},
    {"disappearing_files_are_dropped", test_disappearing_files_are_dropped},
    {"registry_outage_is_tolerated", test_registry_outage_is_tolerated},
    {"heartbeat_outage_keeps_table", test_heartbeat_outage_keeps_table},
    {"unregister_failure_is_retried", test_unregister_failure_is_retried},
    {"remove_file_drops_entry_even_if_delist_fails", test_remove_file_drops_entry_even_if_delist_fails},
    {"vanished_watched_directory_is_unset", test_vanished_watched_directory_is_unset},
    {"change_notification_delivery", test_change_notification_delivery},
    {"accessors", test_accessors},
    {"periodic_monitoring", test_periodic_monitoring}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " sync engine tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " sync engine tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
