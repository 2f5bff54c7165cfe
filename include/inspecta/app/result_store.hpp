#pragma once

#include <inspecta/core/decision_record.hpp>
#include <inspecta/core/error.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace inspecta::app {

/// A persisted DecisionRecord plus its storage identity.
struct StoredRecord {
  std::string id;
  std::chrono::system_clock::time_point stored_at{};
  core::DecisionRecord record;
};

/// Append-only store for resolved records. Stores serialise their own writes;
/// save() may be called from several threads.
class IResultStore {
 public:
  virtual ~IResultStore() = default;

  /// Returns the new record's identifier.
  [[nodiscard]] virtual std::expected<std::string, core::PersistenceError>
  save(const core::DecisionRecord& record) = 0;

  /// Best effort: one slot per input, a failed item does not stop the others.
  [[nodiscard]] virtual std::vector<std::expected<std::string, core::PersistenceError>>
  save_batch(std::span<const core::DecisionRecord> records);

  [[nodiscard]] virtual std::expected<StoredRecord, core::PersistenceError>
  get(std::string_view id) const = 0;

  /// Most recently stored first, at most limit entries.
  [[nodiscard]] virtual std::expected<std::vector<StoredRecord>, core::PersistenceError>
  list_recent(std::size_t limit) const = 0;
};

class InMemoryResultStore : public IResultStore {
 public:
  [[nodiscard]] std::expected<std::string, core::PersistenceError>
  save(const core::DecisionRecord& record) override;

  [[nodiscard]] std::expected<StoredRecord, core::PersistenceError>
  get(std::string_view id) const override;

  [[nodiscard]] std::expected<std::vector<StoredRecord>, core::PersistenceError>
  list_recent(std::size_t limit) const override;

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::vector<StoredRecord> records_;
};

/// One JSON object per line, appended to a file.
class JsonlResultStore : public IResultStore {
 public:
  explicit JsonlResultStore(std::string path);

  [[nodiscard]] std::expected<std::string, core::PersistenceError>
  save(const core::DecisionRecord& record) override;

  [[nodiscard]] std::expected<StoredRecord, core::PersistenceError>
  get(std::string_view id) const override;

  [[nodiscard]] std::expected<std::vector<StoredRecord>, core::PersistenceError>
  list_recent(std::size_t limit) const override;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  [[nodiscard]] std::expected<std::vector<StoredRecord>, core::PersistenceError> read_all() const;

  std::string path_;
  mutable std::mutex mutex_;
};

/// Random 128-bit identifier as 32 lowercase hex characters; nullopt if the
/// system RNG fails.
[[nodiscard]] std::optional<std::string> generate_record_id();

/// Single-line JSON form used by JsonlResultStore and the CLI.
[[nodiscard]] std::string to_json_line(const StoredRecord& stored);

/// Inverse of to_json_line; nullopt for malformed lines or invalid records.
[[nodiscard]] std::optional<StoredRecord> from_json_line(std::string_view line);

}  // namespace inspecta::app
