#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "turngate/core/serialization.h"
#include "turngate/core/state_delta.h"
#include "turngate/core/turn_engine.h"
#include "turngate/persistence/json_snapshot_store.h"
#include "turngate/util/digest.h"
#include "turngate/util/file_io.h"

#include "test_world.h"

#define TG_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_json_snapshot_store() {
  using namespace turngate;
  using tgtest::call;
  namespace fs = std::filesystem;

  const log::Level saved_level = log::level();
  log::set_level(log::Level::Off);

  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");
  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "turngate_test_json_snapshot_store";
  dir /= std::to_string(static_cast<long long>(nonce));
  const std::string path = (dir / "saves" / "world.json").string();

  {
    JsonSnapshotStore store(path);
    TG_ASSERT(store.load().turn == 0);
    TG_ASSERT(!file_exists(path));
  }

  const WorldState seed = tgtest::sample_world();
  std::uint64_t final_digest = 0;
  {
    JsonSnapshotStore store(path);
    store.write_snapshot(seed);
    TG_ASSERT(read_text_file(path) == serialize_world_to_json(seed));

    EngineConfig cfg;
    cfg.log_level = log::Level::Off;
    TurnEngine engine(cfg, std::make_shared<AcceptAllAdjudicator>(), store);
    engine.open();
    TG_ASSERT(engine.run_turn({call("move_npc", {{"npc_id", "rhea"}, {"location", "well"}})}).committed());
    TG_ASSERT(engine.run_turn({call("advance_story", {{"act", "act1"}, {"progress", 0.75}})}).committed());
    final_digest = digest_world_state64(engine.state());
    TG_ASSERT(read_text_file(path) == serialize_world_to_json(engine.state()));
  }

  JsonSnapshotStore reopened(path);
  const WorldState s = reopened.load();
  TG_ASSERT(s.turn == 2);
  TG_ASSERT(digest_world_state64(s) == final_digest);
  TG_ASSERT(s.npcs.at("rhea").location == "well");

  // A delta that does not advance the turn is refused; the file is untouched.
  const std::string before = read_text_file(path);
  StateDelta stale;
  stale.turn = 2;
  std::string err;
  TG_ASSERT(!reopened.persist(stale, &err));
  TG_ASSERT(err.find("does not advance") != std::string::npos);
  TG_ASSERT(read_text_file(path) == before);

  // Corrupt file content surfaces as an error.
  write_text_file(path, "{\"format_version\": 1");
  JsonSnapshotStore corrupt(path);
  bool threw = false;
  try {
    (void)corrupt.load();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  TG_ASSERT(threw);

  fs::remove_all(dir, ec);
  log::set_level(saved_level);
  return 0;
}
