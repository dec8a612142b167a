#include "docvec/store/persistence_manager.h"

#include "docvec/core/errors.h"

#include <spdlog/spdlog.h>

#include <system_error>

namespace docvec::store {

namespace {

std::filesystem::path backup_path(const std::filesystem::path& path) {
  auto out = path;
  out += ".bak";
  return out;
}

void backup_file(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return;
  }
  std::filesystem::copy_file(path, backup_path(path),
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    throw core::PersistenceError("backup of " + path.string() + " failed: " + ec.message());
  }
}

// Puts path back to its pre-save state: the backup when one was taken, otherwise
// nothing at all.
void restore_file(const std::filesystem::path& path, const bool existed) {
  std::error_code ec;
  if (existed) {
    std::filesystem::copy_file(backup_path(path), path,
                               std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
      spdlog::error("[Persistence] Restore of {} failed: {}", path.string(), ec.message());
    }
    return;
  }
  std::filesystem::remove(path, ec);
  if (ec) {
    spdlog::error("[Persistence] Removing partial file {} failed: {}", path.string(),
                  ec.message());
  }
}

void remove_backup(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(backup_path(path), ec);
  if (ec) {
    spdlog::warn("[Persistence] Could not delete {}: {}", backup_path(path).string(),
                 ec.message());
  }
}

}  // namespace

bool recover_interrupted_save(const SnapshotPaths& paths) {
  std::error_code ec;
  const bool vectors_bak = std::filesystem::exists(backup_path(paths.vectors), ec);
  const bool meta_bak = std::filesystem::exists(backup_path(paths.meta), ec);
  if (!vectors_bak && !meta_bak) {
    return false;
  }

  bool restored = false;
  if (vectors_bak && meta_bak) {
    const SnapshotPaths backups{backup_path(paths.vectors), backup_path(paths.meta)};
    bool backups_usable = true;
    try {
      static_cast<void>(read_snapshot(backups));
    } catch (const core::PersistenceError& e) {
      spdlog::warn("[Persistence] Discarding unreadable backup of {}: {}", paths.meta.string(),
                   e.what());
      backups_usable = false;
    }

    if (backups_usable) {
      for (const auto& path : {paths.vectors, paths.meta}) {
        std::filesystem::copy_file(backup_path(path), path,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
          throw core::PersistenceError("restore of " + path.string() + " from backup failed: " +
                                       ec.message());
        }
      }
      restored = true;
      spdlog::warn("[Persistence] Interrupted save of {} detected, restored the backup",
                   paths.meta.string());
    }
  }

  remove_backup(paths.vectors);
  remove_backup(paths.meta);
  return restored;
}

PersistenceManager::PersistenceManager(ISnapshotSource& source, std::filesystem::path folder,
                                       std::size_t capacity)
    : source_(source), folder_(std::move(folder)), capacity_(capacity == 0 ? 1 : capacity) {
  worker_ = std::thread([this] { worker_loop(); });
  spdlog::debug("[Persistence] Worker started for {} (capacity={})", folder_.string(), capacity_);
}

PersistenceManager::~PersistenceManager() {
  shutdown();
}

bool PersistenceManager::enqueue(const std::string& name) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (stopped_) {
    throw core::PersistenceError("persistence manager is shut down");
  }
  if (pending_names_.count(name) > 0) {
    ++stats_.coalesced;
    spdlog::debug("[Persistence] Save of '{}' already pending", name);
    return false;
  }

  not_full_.wait(lock, [this] { return channel_.size() < capacity_ || stopped_; });
  if (stopped_) {
    throw core::PersistenceError("persistence manager is shut down");
  }

  channel_.emplace_back(SaveRequest{name});
  pending_names_.insert(name);
  ++stats_.enqueued;
  lock.unlock();
  not_empty_.notify_one();
  spdlog::info("[Persistence] Queued save of '{}'", name);
  return true;
}

void PersistenceManager::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this] {
    return (channel_.empty() && !in_flight_) || worker_exited_;
  });
}

void PersistenceManager::shutdown() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    not_full_.wait(lock, [this] { return channel_.size() < capacity_; });
    stopped_ = true;
    channel_.emplace_back(StopRequest{});
  }
  not_empty_.notify_one();
  not_full_.notify_all();

  if (worker_.joinable()) {
    worker_.join();
  }
  spdlog::debug("[Persistence] Worker stopped for {}", folder_.string());
}

PersistenceStats PersistenceManager::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void PersistenceManager::set_failure_listener(PersistenceFailureListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void PersistenceManager::worker_loop() {
  while (true) {
    PersistenceMessage message;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_empty_.wait(lock, [this] { return !channel_.empty(); });
      message = std::move(channel_.front());
      channel_.pop_front();
      if (const auto* save = std::get_if<SaveRequest>(&message)) {
        pending_names_.erase(save->name);
        in_flight_ = true;
      }
    }
    not_full_.notify_one();

    if (std::holds_alternative<StopRequest>(message)) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_ = false;
        worker_exited_ = true;
      }
      idle_.notify_all();
      return;
    }

    persist(std::get<SaveRequest>(message).name);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = false;
    }
    idle_.notify_all();
  }
}

void PersistenceManager::persist(const std::string& name) {
  const auto paths = snapshot_paths(folder_, name);

  std::error_code ec;
  const bool had_vectors = std::filesystem::exists(paths.vectors, ec);
  const bool had_meta = std::filesystem::exists(paths.meta, ec);

  bool files_touched = false;
  try {
    backup_file(paths.vectors);
    backup_file(paths.meta);

    source_.rebuild_for_snapshot();
    files_touched = true;
    source_.write_snapshot_to(paths);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stats_.completed;
    }
    spdlog::info("[Persistence] Saved '{}' to {}", name, folder_.string());
  } catch (const std::exception& e) {
    if (files_touched) {
      restore_file(paths.vectors, had_vectors);
      restore_file(paths.meta, had_meta);
    }
    record_failure(name, e.what());
  }

  remove_backup(paths.vectors);
  remove_backup(paths.meta);
}

void PersistenceManager::record_failure(const std::string& name, const std::string& error) {
  spdlog::error("[Persistence] Save of '{}' failed: {}", name, error);

  PersistenceFailureListener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.failed;
    stats_.last_error = error;
    listener = listener_;
  }
  if (!listener) {
    return;
  }
  try {
    listener(name, error);
  } catch (const std::exception& e) {
    spdlog::error("[Persistence] Failure listener for '{}' threw: {}", name, e.what());
  }
}

}  // namespace docvec::store
