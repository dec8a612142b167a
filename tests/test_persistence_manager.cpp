#include "docvec/core/errors.h"
#include "docvec/store/persistence_manager.h"

#include "test_support.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <fstream>
#include <future>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using namespace docvec;

namespace {

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_file(const std::filesystem::path& path, const std::string& content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

// FakeSnapshotSource writes `payload` into both files. It can fail either step,
// and can hold rebuild_for_snapshot() until the test opens the gate.
class FakeSnapshotSource final : public store::ISnapshotSource {
 public:
  void rebuild_for_snapshot() override {
    ++rebuilds;
    if (gate.valid()) {
      gate.wait();
    }
    if (fail_rebuild) {
      throw std::runtime_error("rebuild exploded");
    }
  }

  void write_snapshot_to(const store::SnapshotPaths& paths) override {
    if (fail_write) {
      write_file(paths.vectors, "partial");
      throw core::PersistenceError("disk full");
    }
    write_file(paths.vectors, payload + ".vectors");
    write_file(paths.meta, payload + ".meta");
  }

  std::string payload{"v1"};
  std::atomic<bool> fail_write{false};
  std::atomic<bool> fail_rebuild{false};
  std::atomic<int> rebuilds{0};
  std::shared_future<void> gate;
};

}  // namespace

TEST_CASE("PersistenceManager writes snapshots on its worker", "[persistence]") {
  testing::ScratchDir dir;
  FakeSnapshotSource source;
  store::PersistenceManager manager(source, dir.path(), 8);

  CHECK(manager.enqueue("idx"));
  manager.wait_idle();

  CHECK(read_file(dir.path() / "idx.vectors") == "v1.vectors");
  CHECK(read_file(dir.path() / "idx.meta") == "v1.meta");
  CHECK(testing::all_files(dir.path()) == std::vector<std::string>{"idx.meta", "idx.vectors"});
  CHECK(source.rebuilds == 1);

  const auto stats = manager.stats();
  CHECK(stats.enqueued == 1);
  CHECK(stats.completed == 1);
  CHECK(stats.failed == 0);
}

TEST_CASE("Failed write restores the previous snapshot byte for byte", "[persistence]") {
  testing::ScratchDir dir;
  FakeSnapshotSource source;
  store::PersistenceManager manager(source, dir.path(), 8);

  manager.enqueue("idx");
  manager.wait_idle();
  const auto vectors_before = read_file(dir.path() / "idx.vectors");
  const auto meta_before = read_file(dir.path() / "idx.meta");

  std::vector<std::string> failures;
  manager.set_failure_listener(
      [&failures](const std::string& name, const std::string& /*error*/) {
        failures.push_back(name);
      });

  source.payload = "v2";
  source.fail_write = true;
  manager.enqueue("idx");
  manager.wait_idle();

  CHECK(read_file(dir.path() / "idx.vectors") == vectors_before);
  CHECK(read_file(dir.path() / "idx.meta") == meta_before);
  CHECK(testing::all_files(dir.path()) == std::vector<std::string>{"idx.meta", "idx.vectors"});

  const auto stats = manager.stats();
  CHECK(stats.completed == 1);
  CHECK(stats.failed == 1);
  CHECK(stats.last_error == "disk full");
  CHECK(failures == std::vector<std::string>{"idx"});
}

TEST_CASE("A throwing failure listener does not stop the worker", "[persistence]") {
  testing::ScratchDir dir;
  FakeSnapshotSource source;
  store::PersistenceManager manager(source, dir.path(), 8);

  std::atomic<int> calls{0};
  manager.set_failure_listener([&calls](const std::string& /*name*/, const std::string& /*error*/) {
    ++calls;
    throw std::runtime_error("listener bug");
  });

  source.fail_write = true;
  manager.enqueue("idx");
  manager.wait_idle();
  CHECK(calls == 1);
  CHECK(manager.stats().failed == 1);

  source.fail_write = false;
  CHECK(manager.enqueue("idx"));
  manager.wait_idle();
  CHECK(manager.stats().completed == 1);
  CHECK(read_file(dir.path() / "idx.vectors") == "v1.vectors");
}

TEST_CASE("Failed first write leaves no partial files", "[persistence]") {
  testing::ScratchDir dir;
  FakeSnapshotSource source;
  source.fail_write = true;
  store::PersistenceManager manager(source, dir.path(), 8);

  manager.enqueue("fresh");
  manager.wait_idle();

  CHECK(testing::all_files(dir.path()).empty());
  CHECK(manager.stats().failed == 1);
}

TEST_CASE("Failed rebuild leaves existing files untouched", "[persistence]") {
  testing::ScratchDir dir;
  FakeSnapshotSource source;
  store::PersistenceManager manager(source, dir.path(), 8);

  manager.enqueue("idx");
  manager.wait_idle();

  source.payload = "v2";
  source.fail_rebuild = true;
  manager.enqueue("idx");
  manager.wait_idle();

  CHECK(read_file(dir.path() / "idx.vectors") == "v1.vectors");
  CHECK(testing::all_files(dir.path()) == std::vector<std::string>{"idx.meta", "idx.vectors"});
  CHECK(manager.stats().last_error == "rebuild exploded");
}

TEST_CASE("A name already waiting in the channel is coalesced", "[persistence]") {
  testing::ScratchDir dir;
  FakeSnapshotSource source;
  std::promise<void> open;
  source.gate = open.get_future().share();
  store::PersistenceManager manager(source, dir.path(), 8);

  CHECK(manager.enqueue("first"));
  CHECK(manager.enqueue("second"));
  CHECK_FALSE(manager.enqueue("second"));

  open.set_value();
  manager.wait_idle();

  const auto stats = manager.stats();
  CHECK(stats.enqueued == 2);
  CHECK(stats.coalesced == 1);
  CHECK(stats.completed == 2);
  CHECK(source.rebuilds == 2);
}

TEST_CASE("shutdown drains the channel and rejects later saves", "[persistence]") {
  testing::ScratchDir dir;
  FakeSnapshotSource source;
  store::PersistenceManager manager(source, dir.path(), 2);

  manager.enqueue("a");
  manager.enqueue("b");
  manager.enqueue("c");
  manager.shutdown();
  manager.shutdown();

  CHECK(manager.stats().completed == 3);
  CHECK_THROWS_AS(manager.enqueue("d"), core::PersistenceError);
  manager.wait_idle();
}
