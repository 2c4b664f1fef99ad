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

#include <algorithm>
#include <memory>
#include <set>
#include <vector>

#include "app/catalog_test_fixation.hpp"
#include "catalog/catalog_error.hpp"
#include "storage/controller/db_controller.hpp"
#include "storage/controller/image/image_controller.hpp"
#include "storage/controller/tag/tag_controller.hpp"
#include "storage/mapper/duckorm/duckdb_orm.hpp"

namespace imgshelf {
class CatalogRepositoryTests : public CatalogTestBase {
 protected:
  std::unique_ptr<DBController>    db_;
  std::shared_ptr<TagController>   tags_;
  std::unique_ptr<ImageController> images_;

  void                             SetUp() override {
    CatalogTestBase::SetUp();
    db_     = std::make_unique<DBController>(app_dir_ / "catalog.db");
    tags_   = std::make_shared<TagController>(db_->GetConnectionGuard());
    images_ = std::make_unique<ImageController>(db_->GetConnectionGuard(), tags_);
  }

  void TearDown() override {
    images_.reset();
    tags_.reset();
    db_.reset();
    CatalogTestBase::TearDown();
  }

  auto AddPrepared(const std::string& description, const std::vector<std::string>& tag_names)
      -> image_id_t {
    image_id_t          id = images_->InsertPlaceholder(description);
    ImageUpdateDTO      update;
    std::vector<TagDTO> tags;
    for (const auto& name : tag_names) tags.push_back(TagDTO{0, name, TagColor::GREEN});
    update.path_           = std::format("/catalog/{}/image_{}.png", id, id);
    update.thumbnail_path_ = std::format("/catalog/{}/thumb_image_{}.png", id, id);
    if (!tags.empty()) update.tags_ = tags;
    update.is_prepared_ = true;
    images_->UpdateFromDTO(id, update);
    return id;
  }

  static auto IdsOf(const Page<ImageDTO>& page) -> std::set<image_id_t> {
    std::set<image_id_t> ids;
    for (const auto& dto : page.content_) ids.insert(dto.id_);
    return ids;
  }

  auto CountRows(const std::string& sql) -> int64_t {
    auto guard = db_->GetConnectionGuard();
    return duckorm::query_int64(guard.conn_, sql);
  }
};

TEST_F(CatalogRepositoryTests, PlaceholderIsUnpreparedAndHidden) {
  image_id_t id    = images_->InsertPlaceholder("pending");
  auto       found = images_->FindById(id);
  ASSERT_TRUE(found.has_value());
  EXPECT_FALSE(found->is_prepared_);
  EXPECT_FALSE(found->is_folder_);
  EXPECT_TRUE(found->path_.empty());
  EXPECT_TRUE(found->thumbnail_path_.empty());
  EXPECT_EQ(found->description_, "pending");
  EXPECT_FALSE(found->created_at_.empty());

  auto page = images_->FindAll(Filter{}, 0, 10);
  EXPECT_TRUE(page.content_.empty());
  EXPECT_EQ(page.total_pages_, 0u);

  auto unprepared = images_->ListUnprepared();
  ASSERT_EQ(unprepared.size(), 1u);
  EXPECT_EQ(unprepared.front().id_, id);
}

TEST_F(CatalogRepositoryTests, IdsAreDistinctAndIncreasing) {
  image_id_t a = images_->InsertPlaceholder("a");
  image_id_t b = images_->InsertPlaceholder("b");
  EXPECT_GT(b, a);
}

TEST_F(CatalogRepositoryTests, TagResolutionIsCaseInsensitive) {
  auto first  = tags_->ResolveOrCreate(TagDTO{0, "Red", TagColor::RED});
  auto second = tags_->ResolveOrCreate(TagDTO{0, "red", TagColor::GREEN});
  EXPECT_EQ(first.id_, second.id_);
  EXPECT_EQ(second.name_, "red");
  // Resolution never recolors an existing tag
  EXPECT_EQ(second.color_, TagColor::RED);
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM tags WHERE name = 'red';"), 1);
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM tags;"), 1);

  EXPECT_THROW(tags_->ResolveOrCreate(TagDTO{0, "   ", TagColor::RED}), CatalogException);
}

TEST_F(CatalogRepositoryTests, TagFilterRequiresEveryTag) {
  image_id_t a = AddPrepared("first", {"x", "y"});
  image_id_t b = AddPrepared("second", {"x"});
  image_id_t c = AddPrepared("third", {"x", "y", "z"});

  Filter     filter;
  filter.tags_ = {"x", "y"};
  auto page    = images_->FindAll(filter, 0, 10);
  EXPECT_EQ(IdsOf(page), (std::set<image_id_t>{a, c}));
  EXPECT_EQ(page.total_items_, 2u);
  EXPECT_EQ(page.total_pages_, 1u);

  filter.tags_ = {"X"};
  EXPECT_EQ(IdsOf(images_->FindAll(filter, 0, 10)), (std::set<image_id_t>{a, b, c}));

  filter.tags_ = {"x", "y", "z"};
  EXPECT_EQ(IdsOf(images_->FindAll(filter, 0, 10)), (std::set<image_id_t>{c}));

  filter.tags_ = {"nope"};
  EXPECT_TRUE(images_->FindAll(filter, 0, 10).content_.empty());
}

TEST_F(CatalogRepositoryTests, QueryTermsAreOrCombined) {
  image_id_t cat   = AddPrepared("A sleepy Cat", {});
  image_id_t dog   = AddPrepared("dog in the park", {});
  image_id_t bird  = AddPrepared("bird", {"sky"});
  AddPrepared("fish", {});

  Filter filter;
  filter.query_ = "cat";
  EXPECT_EQ(IdsOf(images_->FindAll(filter, 0, 10)), (std::set<image_id_t>{cat}));

  filter.query_ = " cat + dog ";
  EXPECT_EQ(IdsOf(images_->FindAll(filter, 0, 10)), (std::set<image_id_t>{cat, dog}));

  // Text and tags combine with AND
  filter.query_ = "cat+bird";
  filter.tags_  = {"sky"};
  EXPECT_EQ(IdsOf(images_->FindAll(filter, 0, 10)), (std::set<image_id_t>{bird}));

  filter.query_ = "+";
  filter.tags_.clear();
  EXPECT_EQ(images_->FindAll(filter, 0, 10).total_items_, 4u);
}

TEST_F(CatalogRepositoryTests, PaginationMath) {
  auto empty = images_->FindAll(Filter{}, 0, 3);
  EXPECT_EQ(empty.total_pages_, 0u);
  EXPECT_TRUE(empty.content_.empty());

  for (int i = 0; i < 10; ++i) AddPrepared(std::format("item {}", i), {});

  auto first = images_->FindAll(Filter{}, 0, 3);
  EXPECT_EQ(first.total_pages_, 4u);
  EXPECT_EQ(first.total_items_, 10u);
  EXPECT_EQ(first.content_.size(), 3u);

  auto last = images_->FindAll(Filter{}, 3, 3);
  EXPECT_EQ(last.page_number_, 3u);
  EXPECT_EQ(last.content_.size(), 1u);

  EXPECT_TRUE(images_->FindAll(Filter{}, 4, 3).content_.empty());
  EXPECT_THROW(images_->FindAll(Filter{}, 0, 0), CatalogException);

  EXPECT_EQ(Page<ImageDTO>::TotalPages(0, 3), 0u);
  EXPECT_EQ(Page<ImageDTO>::TotalPages(10, 3), 4u);
  EXPECT_EQ(Page<ImageDTO>::TotalPages(9, 3), 3u);
}

TEST_F(CatalogRepositoryTests, SortOrderFollowsCreation) {
  std::vector<image_id_t> ids;
  for (int i = 0; i < 4; ++i) ids.push_back(AddPrepared(std::format("n{}", i), {}));

  Filter filter;
  filter.sort_ = SortOrder::CREATED_ASC;
  auto asc     = images_->FindAll(filter, 0, 10);
  ASSERT_EQ(asc.content_.size(), 4u);
  for (size_t i = 0; i < ids.size(); ++i) EXPECT_EQ(asc.content_[i].id_, ids[i]);

  filter.sort_ = SortOrder::CREATED_DESC;
  auto desc    = images_->FindAll(filter, 0, 10);
  ASSERT_EQ(desc.content_.size(), 4u);
  for (size_t i = 0; i < ids.size(); ++i) EXPECT_EQ(desc.content_[i].id_, ids[ids.size() - 1 - i]);
}

TEST_F(CatalogRepositoryTests, SparseUpdateKeepsUntouchedFields) {
  image_id_t id     = AddPrepared("before", {"keep", "these"});
  auto       before = images_->FindById(id);
  ASSERT_TRUE(before.has_value());

  ImageUpdateDTO update = ImageUpdateDTO::KeepingFlagsOf(*before);
  update.description_   = "after";
  auto after            = images_->UpdateFromDTO(id, update);

  EXPECT_EQ(after.description_, "after");
  EXPECT_EQ(after.path_, before->path_);
  EXPECT_EQ(after.thumbnail_path_, before->thumbnail_path_);
  EXPECT_EQ(after.tags_, before->tags_);
  EXPECT_TRUE(after.is_prepared_);

  // Empty values count as absent
  ImageUpdateDTO blanks  = ImageUpdateDTO::KeepingFlagsOf(after);
  blanks.path_           = "";
  blanks.description_    = "";
  blanks.tags_           = std::vector<TagDTO>{};
  auto unchanged         = images_->UpdateFromDTO(id, blanks);
  EXPECT_EQ(unchanged.path_, before->path_);
  EXPECT_EQ(unchanged.description_, "after");
  EXPECT_EQ(unchanged.tags_.size(), 2u);
}

TEST_F(CatalogRepositoryTests, FlagsAreAlwaysWritten) {
  image_id_t     id = AddPrepared("flagged", {});
  ImageUpdateDTO update;
  update.description_ = "hidden again";
  auto updated        = images_->UpdateFromDTO(id, update);
  EXPECT_FALSE(updated.is_prepared_);
  EXPECT_FALSE(updated.is_folder_);
  EXPECT_TRUE(images_->FindAll(Filter{}, 0, 10).content_.empty());
}

TEST_F(CatalogRepositoryTests, TagUpdateReplacesTheWholeSet) {
  image_id_t     id = AddPrepared("tagged", {"a", "b"});
  ImageUpdateDTO update;
  update.is_prepared_ = true;
  update.tags_        = std::vector<TagDTO>{{0, "B", TagColor::BLUE}, {0, "c", TagColor::BLUE}};
  auto updated        = images_->UpdateFromDTO(id, update);

  EXPECT_FALSE(updated.HasTag("a"));
  EXPECT_TRUE(updated.HasTag("b"));
  EXPECT_TRUE(updated.HasTag("c"));
  EXPECT_EQ(CountRows(std::format("SELECT COUNT(*) FROM image_tags WHERE image_id = {};", id)), 2);
  // Tags outlive their last image association
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM tags;"), 3);
}

TEST_F(CatalogRepositoryTests, BlankTagNamesLeaveTagsAlone) {
  image_id_t     id = AddPrepared("tagged", {"a", "b"});
  ImageUpdateDTO update;
  update.is_prepared_ = true;
  update.tags_        = std::vector<TagDTO>{{0, " ", TagColor::BLUE}, {0, "", TagColor::RED}};
  auto updated        = images_->UpdateFromDTO(id, update);

  EXPECT_TRUE(updated.HasTag("a"));
  EXPECT_TRUE(updated.HasTag("b"));
  EXPECT_EQ(CountRows(std::format("SELECT COUNT(*) FROM image_tags WHERE image_id = {};", id)), 2);
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM tags;"), 2);
}

TEST_F(CatalogRepositoryTests, UpdateOfMissingImageIsNotFound) {
  ImageUpdateDTO update;
  update.description_ = "ghost";
  try {
    images_->UpdateFromDTO(4242, update);
    FAIL() << "update of a missing row succeeded";
  } catch (const CatalogException& e) {
    EXPECT_EQ(e.Code(), CatalogErrorCode::NOT_FOUND);
  }
}

TEST_F(CatalogRepositoryTests, DeleteIsIdempotentAndCascades) {
  image_id_t id = AddPrepared("doomed", {"t1", "t2"});
  EXPECT_TRUE(images_->Delete(id));
  EXPECT_FALSE(images_->FindById(id).has_value());
  EXPECT_EQ(CountRows("SELECT COUNT(*) FROM image_tags;"), 0);
  EXPECT_FALSE(images_->Delete(id));
}

TEST_F(CatalogRepositoryTests, HydrationGroupsTagsPerImage) {
  image_id_t a     = AddPrepared("a", {"one", "two"});
  image_id_t b     = AddPrepared("b", {"two"});
  image_id_t c     = AddPrepared("c", {});

  auto       tags  = tags_->HydrateTags({a, b, c});
  EXPECT_EQ(tags[a].size(), 2u);
  EXPECT_EQ(tags[b].size(), 1u);
  EXPECT_EQ(tags.count(c), 0u);
  EXPECT_TRUE(tags_->HydrateTags({}).empty());
}

TEST_F(CatalogRepositoryTests, TagManagement) {
  auto created = tags_->CreateTag(TagDTO{0, " Sunset ", TagColor::ORANGE});
  EXPECT_EQ(created.name_, "sunset");
  EXPECT_EQ(created.color_, TagColor::ORANGE);
  EXPECT_THROW(tags_->CreateTag(TagDTO{0, "SUNSET", TagColor::RED}), CatalogException);

  auto recolored = tags_->UpdateTag(created.id_, TagDTO{0, "", TagColor::PURPLE});
  EXPECT_EQ(recolored.name_, "sunset");
  EXPECT_EQ(recolored.color_, TagColor::PURPLE);

  auto renamed = tags_->UpdateTag(created.id_, TagDTO{0, "Dusk", TagColor::PURPLE});
  EXPECT_EQ(renamed.name_, "dusk");

  tags_->CreateTag(TagDTO{0, "dawn", TagColor::RED});
  EXPECT_THROW(tags_->UpdateTag(created.id_, TagDTO{0, "dawn", TagColor::RED}), CatalogException);
  EXPECT_THROW(tags_->UpdateTag(999, TagDTO{0, "x", TagColor::RED}), CatalogException);

  auto all = tags_->ListTags();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].name_, "dawn");
  EXPECT_EQ(all[1].name_, "dusk");

  image_id_t id = AddPrepared("evening", {"dusk"});
  tags_->DeleteTag(renamed.id_);
  auto image = images_->FindById(id);
  ASSERT_TRUE(image.has_value());
  EXPECT_TRUE(image->tags_.empty());
  EXPECT_EQ(tags_->ListTags().size(), 1u);
}

TEST_F(CatalogRepositoryTests, OldPlaceholdersAreListedForPurge) {
  image_id_t id = images_->InsertPlaceholder("stale");
  AddPrepared("fresh", {});
  EXPECT_TRUE(images_->ListUnpreparedOlderThan(3600).empty());
  auto stale = images_->ListUnpreparedOlderThan(-60);
  ASSERT_EQ(stale.size(), 1u);
  EXPECT_EQ(stale.front().id_, id);
}
};  // namespace imgshelf
