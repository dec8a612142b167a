#pragma once

#include "docvec/store/snapshot_codec.h"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <variant>

namespace docvec::store {

// ISnapshotSource is the live state a PersistenceManager persists.
// Both calls take the source's own lock; either may throw.
class ISnapshotSource {
 public:
  virtual ~ISnapshotSource() = default;

  // Re-derives the index from the stored documents before a snapshot is written.
  virtual void rebuild_for_snapshot() = 0;

  // Writes a consistent view of the live state to paths.
  virtual void write_snapshot_to(const SnapshotPaths& paths) = 0;

 protected:
  ISnapshotSource() = default;
  ISnapshotSource(const ISnapshotSource&) = default;
  ISnapshotSource& operator=(const ISnapshotSource&) = default;
  ISnapshotSource(ISnapshotSource&&) = default;
  ISnapshotSource& operator=(ISnapshotSource&&) = default;
};

struct SaveRequest {
  std::string name;  // NOLINT(readability-identifier-naming)
};

struct StopRequest {};

using PersistenceMessage = std::variant<SaveRequest, StopRequest>;

struct PersistenceStats {
  std::size_t enqueued{0};   // NOLINT(readability-identifier-naming)
  std::size_t coalesced{0};  // NOLINT(readability-identifier-naming)
  std::size_t completed{0};  // NOLINT(readability-identifier-naming)
  std::size_t failed{0};     // NOLINT(readability-identifier-naming)
  std::string last_error;    // NOLINT(readability-identifier-naming)
};

using PersistenceFailureListener =
    std::function<void(const std::string& name, const std::string& error)>;

// Repairs <name> after a save that died between step 1 and step 5 of the save
// protocol below, i.e. while .bak siblings still exist.
//   - both backups read back as a valid snapshot: they hold the last state known
//     to be consistent and are copied over the main files
//   - otherwise the save died while backing up, so the main files were never
//     touched and the partial backups are discarded
// The backups are deleted once the main files are in place.
// Returns true when the main files were replaced.
// Throws core::PersistenceError when a restore copy fails; the backups are kept.
bool recover_interrupted_save(const SnapshotPaths& paths);

// PersistenceManager owns the single persistence worker thread.
//
// Channel: bounded FIFO of PersistenceMessage. enqueue() blocks only while the
// channel is full. A name already waiting in the channel is not queued twice;
// the waiting request will capture the same live state.
//
// Save protocol per request, on the worker thread:
//   1. copy existing <name>.vectors / <name>.meta to <name>.vectors.bak / <name>.meta.bak
//   2. source.rebuild_for_snapshot()
//   3. source.write_snapshot_to(paths)
//   4. on failure: restore both files from the backups, or remove partial files
//      when no earlier snapshot existed; log, count, notify the listener
//   5. always: delete the .bak files
//
// The destructor calls shutdown().
class PersistenceManager {
 public:
  PersistenceManager(ISnapshotSource& source, std::filesystem::path folder,
                     std::size_t capacity);
  ~PersistenceManager();

  PersistenceManager(const PersistenceManager&) = delete;
  PersistenceManager& operator=(const PersistenceManager&) = delete;
  PersistenceManager(PersistenceManager&&) = delete;
  PersistenceManager& operator=(PersistenceManager&&) = delete;

  // Returns false when name was already pending.
  // Throws core::PersistenceError after shutdown().
  bool enqueue(const std::string& name);

  // Blocks until the channel is empty and no save is in flight.
  void wait_idle();

  // Sends the stop message and joins the worker once everything queued before it
  // has been processed. Idempotent.
  void shutdown();

  [[nodiscard]] PersistenceStats stats() const;

  void set_failure_listener(PersistenceFailureListener listener);

  [[nodiscard]] const std::filesystem::path& folder() const { return folder_; }

 private:
  void worker_loop();
  void persist(const std::string& name);
  void record_failure(const std::string& name, const std::string& error);

  ISnapshotSource& source_;
  std::filesystem::path folder_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable idle_;
  std::deque<PersistenceMessage> channel_;
  std::set<std::string> pending_names_;
  bool in_flight_{false};
  bool stopped_{false};
  bool worker_exited_{false};
  PersistenceStats stats_;
  PersistenceFailureListener listener_;

  std::thread worker_;
};

}  // namespace docvec::store
