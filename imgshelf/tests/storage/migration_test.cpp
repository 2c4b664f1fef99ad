//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "app/catalog_test_fixation.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/controller/migration/migrator.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace imgshelf {
class MigrationTests : public CatalogTestBase {
 protected:
  auto DBPath() const -> std::filesystem::path { return app_dir_ / "catalog.db"; }

  static auto Count(DBController& db, const std::string& sql) -> int64_t {
    auto guard = db.GetConnectionGuard();
    return duckorm::query_int64(guard.conn_, sql);
  }

  static auto AppliedCount(DBController& db) -> size_t {
    auto     guard = db.GetConnectionGuard();
    Migrator migrator(guard.conn_);
    return migrator.Applied().size();
  }
};

TEST_F(MigrationTests, FreshDatabaseGetsEveryMigrationWithoutBackup) {
  DBController db(DBPath());
  EXPECT_EQ(AppliedCount(db), Migrator::Migrations().size());
  EXPECT_FALSE(db.GetLastBackupPath().has_value());

  auto     guard = db.GetConnectionGuard();
  Migrator migrator(guard.conn_);
  EXPECT_TRUE(migrator.Pending().empty());
  // Nothing left to apply
  EXPECT_EQ(migrator.Up(), 0u);
}

TEST_F(MigrationTests, RollbackAndReapplyBackfillsPreparedFlag) {
  {
    DBController db(DBPath());
    EXPECT_EQ(db.RollbackMigrations(3), 3u);
    EXPECT_EQ(AppliedCount(db), 3u);

    auto guard = db.GetConnectionGuard();
    duckorm::execute_script(guard.conn_,
                            "INSERT INTO images (path, thumbnail_path, description) "
                            "VALUES ('/legacy/1.png', '/legacy/thumb_1.png', 'legacy');"
                            "INSERT INTO tags (name) VALUES ('old');");
  }

  DBController reopened(DBPath());
  EXPECT_EQ(AppliedCount(reopened), Migrator::Migrations().size());
  // Rows written before the flag existed count as complete
  EXPECT_EQ(Count(reopened, "SELECT COUNT(*) FROM images WHERE is_prepared = true;"), 1);
  EXPECT_EQ(Count(reopened, "SELECT COUNT(*) FROM images WHERE is_folder = false;"), 1);
  EXPECT_EQ(Count(reopened, "SELECT COUNT(*) FROM tags WHERE color = 'blue';"), 1);

  ASSERT_TRUE(reopened.GetLastBackupPath().has_value());
  const auto& backup = *reopened.GetLastBackupPath();
  EXPECT_TRUE(std::filesystem::exists(backup));
  EXPECT_TRUE(backup.filename().string().starts_with("catalog.db.backup_"));
}

TEST_F(MigrationTests, UpToDateDatabaseIsNotBackedUp) {
  { DBController db(DBPath()); }
  DBController again(DBPath());
  EXPECT_FALSE(again.GetLastBackupPath().has_value());
}

TEST_F(MigrationTests, RollingBackEverythingDropsTables) {
  DBController db(DBPath());
  EXPECT_EQ(db.RollbackMigrations(100), Migrator::Migrations().size());
  EXPECT_EQ(AppliedCount(db), 0u);
  EXPECT_EQ(Count(db, "SELECT COUNT(*) FROM information_schema.tables "
                      "WHERE table_name IN ('images', 'tags', 'image_tags');"),
            0);
}
};  // namespace imgshelf
