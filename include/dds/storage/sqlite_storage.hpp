/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <sqlite_modern_cpp.h>

#include <dds/log/logger.hpp>
#include <dds/storage/storage.hpp>

namespace dds::storage {

  /**
   * Storage persisted in an SQLite database. The database connection and
   * its prepared statements are shared, so every access is serialized
   */
  class SqliteStorage : public Storage {
   public:
    /**
     * Open (or create) the database and its tables
     * @param db_file - path to the database, ":memory:" for a transient one
     */
    static outcome::result<std::unique_ptr<SqliteStorage>> create(
        const std::string &db_file);

    SqliteStorage(const SqliteStorage &) = delete;
    SqliteStorage &operator=(const SqliteStorage &) = delete;

    ~SqliteStorage() override;

    outcome::result<void> storeChunk(const Chunk &chunk) override;

    outcome::result<Chunk> getChunk(const ContentHash &id) const override;

    outcome::result<void> storeManifest(const Manifest &manifest) override;

    outcome::result<Manifest> getManifest(const ContentHash &id) const override;

   private:
    enum Statement : size_t {
      kPutChunk,
      kGetChunk,
      kPutManifest,
      kGetManifest,
    };

    explicit SqliteStorage(const std::string &db_file);

    /// Create tables and prepare statements, in the order of Statement
    void prepare();

    template <typename... Args>
    outcome::result<void> execute(Statement statement,
                                  const Args &...args) const;

    /// Sink is called once per selected row
    template <typename Sink, typename... Args>
    outcome::result<void> query(Statement statement,
                                Sink &&sink,
                                const Args &...args) const;

    void logFailure(const ::sqlite::sqlite_exception &e) const;

    mutable std::mutex mutex_;
    ::sqlite::database db_;
    std::string db_file_;
    log::Logger log_;
    mutable std::vector<::sqlite::database_binder> statements_;
  };

}  // namespace dds::storage
