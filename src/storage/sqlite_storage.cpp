/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/storage/sqlite_storage.hpp>

#include <optional>

namespace dds::storage {

  namespace {
    std::string joinIds(const std::vector<ContentHash> &ids) {
      std::string joined;
      joined.reserve(ids.size() * ContentHash::kHexLength);
      for (const auto &id : ids) {
        joined += id.toHex();
      }
      return joined;
    }

    outcome::result<std::vector<ContentHash>> splitIds(
        std::string_view joined) {
      if (joined.size() % ContentHash::kHexLength != 0) {
        return StorageError::CORRUPTED_RECORD;
      }
      std::vector<ContentHash> ids;
      ids.reserve(joined.size() / ContentHash::kHexLength);
      for (size_t pos = 0; pos < joined.size();
           pos += ContentHash::kHexLength) {
        auto id =
            ContentHash::fromHex(joined.substr(pos, ContentHash::kHexLength));
        if (not id) {
          return StorageError::CORRUPTED_RECORD;
        }
        ids.push_back(std::move(id.value()));
      }
      return ids;
    }

    template <typename... Args>
    void bind(::sqlite::database_binder &statement, const Args &...args) {
      (statement << ... << args);
    }
  }  // namespace

  outcome::result<std::unique_ptr<SqliteStorage>> SqliteStorage::create(
      const std::string &db_file) {
    try {
      std::unique_ptr<SqliteStorage> storage{new SqliteStorage(db_file)};
      storage->prepare();
      return storage;
    } catch (const ::sqlite::sqlite_exception &e) {
      log::createLogger("SqliteStorage")
          ->error("cannot open {}: {} ({})", db_file, e.what(), e.get_sql());
      return StorageError::BACKEND_FAILURE;
    }
  }

  SqliteStorage::SqliteStorage(const std::string &db_file)
      : db_{db_file},
        db_file_{db_file},
        log_{log::createLogger("SqliteStorage")} {}

  SqliteStorage::~SqliteStorage() {
    // unused binders would otherwise run when destroyed
    for (auto &statement : statements_) {
      statement.used(true);
    }
  }

  void SqliteStorage::prepare() {
    (db_ << "CREATE TABLE IF NOT EXISTS chunks ("
            "id TEXT PRIMARY KEY, data BLOB NOT NULL, size INTEGER NOT NULL)")
        .execute();
    (db_ << "CREATE TABLE IF NOT EXISTS manifests ("
            "id TEXT PRIMARY KEY, content_id TEXT NOT NULL, "
            "chunk_ids TEXT NOT NULL, total_size INTEGER NOT NULL)")
        .execute();

    statements_.emplace_back(
        db_ << "INSERT OR REPLACE INTO chunks(id, data, size) VALUES(?, ?, ?)");
    statements_.emplace_back(db_
                             << "SELECT data, size FROM chunks WHERE id = ?");
    statements_.emplace_back(
        db_ << "INSERT OR REPLACE INTO manifests(id, content_id, chunk_ids, "
               "total_size) VALUES(?, ?, ?, ?)");
    statements_.emplace_back(
        db_ << "SELECT content_id, chunk_ids, total_size FROM manifests "
               "WHERE id = ?");
    log_->debug("storage ready at {}", db_file_);
  }

  template <typename... Args>
  outcome::result<void> SqliteStorage::execute(Statement statement,
                                               const Args &...args) const {
    try {
      auto &binder = statements_.at(statement);
      bind(binder, args...);
      binder.execute();
      return outcome::success();
    } catch (const ::sqlite::sqlite_exception &e) {
      logFailure(e);
      return StorageError::BACKEND_FAILURE;
    }
  }

  template <typename Sink, typename... Args>
  outcome::result<void> SqliteStorage::query(Statement statement,
                                             Sink &&sink,
                                             const Args &...args) const {
    try {
      auto &binder = statements_.at(statement);
      bind(binder, args...);
      binder >> std::forward<Sink>(sink);
      return outcome::success();
    } catch (const ::sqlite::sqlite_exception &e) {
      logFailure(e);
      return StorageError::BACKEND_FAILURE;
    }
  }

  void SqliteStorage::logFailure(const ::sqlite::sqlite_exception &e) const {
    log_->error("{}: {} ({})",
                e.what(),
                e.get_sql(),
                sqlite3_errmsg(db_.connection().get()));
  }

  outcome::result<void> SqliteStorage::storeChunk(const Chunk &chunk) {
    std::lock_guard lock(mutex_);
    return execute(kPutChunk,
                   chunk.id.toHex(),
                   chunk.data,
                   static_cast<int64_t>(chunk.size));
  }

  outcome::result<Chunk> SqliteStorage::getChunk(const ContentHash &id) const {
    std::lock_guard lock(mutex_);
    std::optional<Chunk> found;
    auto sink = [&](std::vector<uint8_t> data, int64_t size) {
      found.emplace(Chunk{id, std::move(data), static_cast<size_t>(size)});
    };
    OUTCOME_TRY(query(kGetChunk, sink, id.toHex()));
    if (not found) {
      return StorageError::CHUNK_NOT_FOUND;
    }
    return std::move(*found);
  }

  outcome::result<void> SqliteStorage::storeManifest(const Manifest &manifest) {
    std::lock_guard lock(mutex_);
    return execute(kPutManifest,
                   manifest.id.toHex(),
                   manifest.content_id.toHex(),
                   joinIds(manifest.chunk_ids),
                   static_cast<int64_t>(manifest.total_size));
  }

  outcome::result<Manifest> SqliteStorage::getManifest(
      const ContentHash &id) const {
    std::lock_guard lock(mutex_);
    struct Row {
      std::string content_id;
      std::string chunk_ids;
      int64_t total_size;
    };
    std::optional<Row> row;
    auto sink = [&](std::string content_id,
                    std::string chunk_ids,
                    int64_t total_size) {
      row.emplace(Row{std::move(content_id), std::move(chunk_ids), total_size});
    };
    OUTCOME_TRY(query(kGetManifest, sink, id.toHex()));
    if (not row) {
      return StorageError::MANIFEST_NOT_FOUND;
    }

    auto content_id = ContentHash::fromHex(row->content_id);
    if (not content_id or row->total_size < 0) {
      log_->error("manifest {} has a malformed record", id);
      return StorageError::CORRUPTED_RECORD;
    }
    OUTCOME_TRY(chunk_ids, splitIds(row->chunk_ids));
    return Manifest{id,
                    std::move(content_id.value()),
                    std::move(chunk_ids),
                    static_cast<uint64_t>(row->total_size)};
  }

}  // namespace dds::storage
