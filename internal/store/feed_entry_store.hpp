#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/feed_entry_record.hpp"

namespace gemfeed::store {

enum class RecordStatus {
  kInserted,
  kDuplicateEntry,
};

struct RecordResult {
  RecordStatus status   = RecordStatus::kInserted;
  int64_t      entry_id = 0; // new row, or the row that already held the dedup key
};

struct EntryInput {
  std::string title;
  std::string published_at;
  std::string url;
};

/*
  FeedEntryStore

  Entries are keyed by (feed_id, published_at, url). Recording the same
  key twice is not an error: the second call reports kDuplicateEntry
  and leaves the store untouched.

  published_at is an ISO-8601 date ("2021-01-07", optionally with a
  time part); ordering is lexicographic on that text.
*/

class FeedEntryStore {
 public:
  explicit FeedEntryStore(db::Repository& repository);

  RecordResult RecordEntry(int64_t feed_id, const std::string& title, const std::string& published_at,
                           const std::string& url);

  // All entries of one fetch in one transaction. Returns the number of new rows.
  std::size_t RecordEntries(int64_t feed_id, const std::vector<EntryInput>& entries);

  // Ascending by (published_at, id); since is exclusive and normalized like published_at.
  std::vector<db::model::FeedEntryRecord> ListEntries(int64_t feed_id,
                                                      const std::optional<std::string>& since = std::nullopt);

  void DeleteEntry(int64_t entry_id);

 private:
  db::Repository& repository_;
};

} // namespace gemfeed::store
