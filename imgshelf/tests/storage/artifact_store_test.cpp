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
#include <fstream>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

#include "app/catalog_test_fixation.hpp"
#include "catalog/catalog_error.hpp"
#include "storage/artifact/artifact_store.hpp"
#include "storage/artifact/folder_meta.hpp"

namespace imgshelf {
namespace fs = std::filesystem;

class ArtifactStoreTests : public CatalogTestBase {
 protected:
  auto MakeStore() -> ArtifactStore { return ArtifactStore(app_dir_, settings_, 2); }

  auto MakeSourceFolder(const std::vector<std::string>& names) -> fs::path {
    auto source = scratch_dir_ / "source";
    fs::create_directories(source);
    for (const auto& name : names) {
      WriteTestImage(source / name, 640, 320);
    }
    return source;
  }
};

TEST_F(ArtifactStoreTests, SaveImageWritesOriginalAndThumbnail) {
  ArtifactStore store(app_dir_, settings_, 1);
  DecodedImage  image{MakeTestImage(1000, 800), ImageFormat::JPEG};

  auto          saved = store.SaveImage(7, image);
  EXPECT_EQ(saved.path_, app_dir_ / "images" / "7" / "image_7.jpg");
  EXPECT_EQ(saved.thumbnail_path_, app_dir_ / "images" / "7" / "thumb_image_7.png");
  ASSERT_TRUE(fs::exists(saved.path_));
  ASSERT_TRUE(fs::exists(saved.thumbnail_path_));

  cv::Mat original = cv::imread(saved.path_.string(), cv::IMREAD_UNCHANGED);
  EXPECT_EQ(original.cols, 1000);
  EXPECT_EQ(original.rows, 800);
  cv::Mat thumb = cv::imread(saved.thumbnail_path_.string(), cv::IMREAD_UNCHANGED);
  EXPECT_EQ(thumb.cols, 500);
  EXPECT_EQ(thumb.rows, 400);
}

TEST_F(ArtifactStoreTests, FailedSaveLeavesNoDirectory) {
  ArtifactStore store(app_dir_, settings_, 1);
  DecodedImage  empty{cv::Mat(), ImageFormat::PNG};
  try {
    store.SaveImage(3, empty);
    FAIL() << "empty image saved";
  } catch (const CatalogException& e) {
    EXPECT_EQ(e.Code(), CatalogErrorCode::ENCODE_FAILED);
  }
  EXPECT_FALSE(fs::exists(store.EntryDirectory(3)));
}

TEST_F(ArtifactStoreTests, SaveFolderOrdersNaturallyAndWritesMeta) {
  auto source = MakeSourceFolder({"img2.png", "img10.png", "img1.png"});
  // Not images, or not directly inside the folder
  std::ofstream(source / "notes.txt") << "skip me";
  fs::create_directories(source / "nested");
  WriteTestImage(source / "nested" / "img0.png", 10, 10);
  // Named .png but JPEG inside
  cv::imwrite((scratch_dir_ / "real.jpg").string(), MakeTestImage(64, 64));
  fs::copy_file(scratch_dir_ / "real.jpg", source / "img20.PNG");

  ArtifactStore store(app_dir_, settings_, 3);
  auto          job = std::make_shared<FolderImportJob>();
  std::vector<uint32_t> progress;
  job->on_progress_ = [&progress](uint32_t done, uint32_t total) {
    EXPECT_EQ(total, 4u);
    progress.push_back(done);
  };

  auto saved = store.SaveFolder(11, source, job);
  auto dir   = app_dir_ / "images" / "11";
  EXPECT_EQ(saved.folder_path_, dir);
  EXPECT_EQ(saved.folder_thumbnail_, dir / "thumb_folder.png");
  EXPECT_FALSE(saved.canceled_);
  ASSERT_EQ(saved.files_.size(), 4u);
  EXPECT_EQ(progress, (std::vector<uint32_t>{1, 2, 3, 4}));

  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(saved.files_[i].path_, dir / std::format("image_11_{}.png", i));
    EXPECT_EQ(saved.files_[i].thumbnail_path_, dir / std::format("thumb_image_11_{}.png", i));
  }
  // Content decides the extension
  EXPECT_EQ(saved.files_[3].path_, dir / "image_11_3.jpg");
  EXPECT_TRUE(fs::exists(dir / "thumb_folder.png"));

  auto meta = ReadFolderMeta(dir);
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->image_count_, 4u);
  EXPECT_EQ(meta->next_index_, 4u);
  EXPECT_EQ(meta->folder_thumb_, (dir / "thumb_folder.png").string());

  std::ifstream  raw(dir / "meta.json");
  nlohmann::json on_disk;
  raw >> on_disk;
  EXPECT_TRUE(on_disk.contains("image_count"));
  EXPECT_TRUE(on_disk.contains("next_index"));
  EXPECT_TRUE(on_disk.contains("folder_thumb"));
}

TEST_F(ArtifactStoreTests, EmptyFolderIsAnError) {
  auto source = scratch_dir_ / "empty";
  fs::create_directories(source);
  std::ofstream(source / "readme.md") << "no images here";

  auto store = MakeStore();
  try {
    store.SaveFolder(5, source);
    FAIL() << "empty folder imported";
  } catch (const CatalogException& e) {
    EXPECT_EQ(e.Code(), CatalogErrorCode::EMPTY_FOLDER);
  }
  EXPECT_FALSE(fs::exists(store.EntryDirectory(5)));
}

TEST_F(ArtifactStoreTests, UndecodableFileFailsWholeImport) {
  auto source = MakeSourceFolder({"a1.png", "a2.png"});
  std::ofstream(source / "a3.png") << "definitely not a png";

  auto store = MakeStore();
  try {
    store.SaveFolder(6, source);
    FAIL() << "broken file imported";
  } catch (const CatalogException& e) {
    EXPECT_EQ(e.Code(), CatalogErrorCode::DECODE_FAILED);
  }
  EXPECT_FALSE(fs::exists(store.EntryDirectory(6)));
}

TEST_F(ArtifactStoreTests, CanceledBeforeStartThrows) {
  auto source = MakeSourceFolder({"a.png", "b.png"});
  auto store  = MakeStore();
  auto job    = std::make_shared<FolderImportJob>();
  job->Cancel();
  try {
    store.SaveFolder(8, source, job);
    FAIL() << "canceled import succeeded";
  } catch (const CatalogException& e) {
    EXPECT_EQ(e.Code(), CatalogErrorCode::CANCELED);
  }
  EXPECT_FALSE(fs::exists(store.EntryDirectory(8)));
}

TEST_F(ArtifactStoreTests, CanceledMidwayKeepsCompletedFiles) {
  // A tiny first file, then large ones, so the cancel lands while the single worker is busy
  auto source = scratch_dir_ / "source";
  fs::create_directories(source);
  WriteTestImage(source / "f0.png", 8, 8);
  for (int i = 1; i <= 6; ++i) {
    WriteTestImage(source / std::format("f{}.png", i), 2400, 2400);
  }

  ArtifactStore store(app_dir_, settings_, 1);
  auto          job = std::make_shared<FolderImportJob>();
  std::vector<uint32_t> progress;
  job->on_progress_ = [&job, &progress](uint32_t done, uint32_t total) {
    progress.push_back(done);
    EXPECT_EQ(total, 7u);
    if (done == 1) job->Cancel();
  };

  auto saved = store.SaveFolder(9, source, job);
  EXPECT_TRUE(saved.canceled_);
  ASSERT_FALSE(saved.files_.empty());
  EXPECT_LT(saved.files_.size(), 7u);
  EXPECT_EQ(progress.size(), 7u);

  // One worker runs the files in order, so the kept ones are a prefix
  for (size_t i = 0; i < saved.files_.size(); ++i) {
    EXPECT_EQ(saved.files_[i].path_, saved.folder_path_ / std::format("image_9_{}.png", i));
    EXPECT_TRUE(fs::exists(saved.files_[i].path_));
    EXPECT_TRUE(fs::exists(saved.files_[i].thumbnail_path_));
  }
  EXPECT_EQ(ArtifactStore::CountQualifyingImages(saved.folder_path_), saved.files_.size());
  EXPECT_TRUE(fs::exists(saved.folder_thumbnail_));

  auto meta = ReadFolderMeta(saved.folder_path_);
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->image_count_, saved.files_.size());
  EXPECT_EQ(meta->next_index_, saved.files_.size());
  EXPECT_EQ(meta->folder_thumb_, saved.folder_thumbnail_.string());
}

TEST_F(ArtifactStoreTests, TifExtensionIsNotImported) {
  auto source = scratch_dir_ / "source";
  fs::create_directories(source);
  WriteTestImage(source / "scan.tif", 64, 64);

  auto store = MakeStore();
  try {
    store.SaveFolder(10, source);
    FAIL() << "folder of .tif files imported";
  } catch (const CatalogException& e) {
    EXPECT_EQ(e.Code(), CatalogErrorCode::EMPTY_FOLDER);
  }
}

TEST_F(ArtifactStoreTests, ExpandFolderListsChildrenInOrder) {
  auto source = MakeSourceFolder({"p2.png", "p10.png", "p1.png"});
  auto store  = MakeStore();
  auto saved  = store.SaveFolder(12, source);

  ImageDTO folder;
  folder.id_             = 12;
  folder.path_           = saved.folder_path_.string();
  folder.thumbnail_path_ = saved.folder_thumbnail_.string();
  folder.description_    = "holiday";
  folder.tags_           = {TagDTO{1, "beach", TagColor::TEAL}};
  folder.created_at_     = "2026-01-02 03:04:05";
  folder.is_folder_      = true;
  folder.is_prepared_    = true;

  auto children = store.ExpandFolder(folder);
  ASSERT_EQ(children.size(), 3u);
  for (size_t i = 0; i < children.size(); ++i) {
    EXPECT_EQ(children[i].id_, static_cast<image_id_t>(i));
    EXPECT_EQ(children[i].path_, (saved.folder_path_ / std::format("image_12_{}.png", i)).string());
    EXPECT_EQ(children[i].thumbnail_path_,
              (saved.folder_path_ / std::format("thumb_image_12_{}.png", i)).string());
    EXPECT_EQ(children[i].description_, "holiday");
    EXPECT_TRUE(children[i].HasTag("beach"));
    EXPECT_EQ(children[i].created_at_, folder.created_at_);
    EXPECT_FALSE(children[i].is_folder_);
    EXPECT_TRUE(children[i].is_prepared_);
  }

  folder.path_ = (scratch_dir_ / "missing").string();
  EXPECT_TRUE(store.ExpandFolder(folder).empty());
}

TEST_F(ArtifactStoreTests, DeletingFolderChildrenRemovesFolderWithLastOne) {
  auto source = MakeSourceFolder({"one.png", "two.png"});
  auto store  = MakeStore();
  auto saved  = store.SaveFolder(21, source);
  ASSERT_EQ(saved.files_.size(), 2u);
  const auto& first  = saved.files_[0];
  const auto& second = saved.files_[1];

  EXPECT_FALSE(store.Delete(first.path_, DeleteContext::FROM_FOLDER));
  EXPECT_FALSE(fs::exists(first.path_));
  EXPECT_FALSE(fs::exists(first.thumbnail_path_));
  EXPECT_TRUE(fs::exists(second.path_));
  EXPECT_TRUE(fs::exists(second.thumbnail_path_));
  EXPECT_TRUE(fs::exists(saved.folder_path_));
  EXPECT_EQ(ArtifactStore::CountQualifyingImages(saved.folder_path_), 1u);

  auto meta = ReadFolderMeta(saved.folder_path_);
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->image_count_, 1u);
  EXPECT_EQ(meta->next_index_, 2u);

  EXPECT_TRUE(store.Delete(second.path_, DeleteContext::FROM_FOLDER));
  EXPECT_FALSE(fs::exists(saved.folder_path_));
  EXPECT_TRUE(fs::exists(store.ImagesRoot()));
}

TEST_F(ArtifactStoreTests, DeletingSingleImageRemovesItsDirectory) {
  auto store = MakeStore();
  auto saved = store.SaveImage(30, DecodedImage{MakeTestImage(50, 50), ImageFormat::PNG});

  EXPECT_FALSE(store.Delete(saved.path_, DeleteContext::IMAGE));
  EXPECT_FALSE(fs::exists(store.EntryDirectory(30)));
  // Already gone
  EXPECT_NO_THROW(store.Delete(saved.path_, DeleteContext::IMAGE));
}

TEST_F(ArtifactStoreTests, DeletingFolderEntryRemovesTree) {
  auto source = MakeSourceFolder({"x.png"});
  auto store  = MakeStore();
  auto saved  = store.SaveFolder(31, source);

  store.Delete(saved.folder_path_, DeleteContext::FOLDER);
  EXPECT_FALSE(fs::exists(saved.folder_path_));
  EXPECT_NO_THROW(store.Delete(saved.folder_path_, DeleteContext::FOLDER));
  // The source is never touched
  EXPECT_TRUE(fs::exists(source / "x.png"));
}

TEST_F(ArtifactStoreTests, RootFolderIsNeverDeleted) {
  auto store = MakeStore();
  store.SaveImage(40, DecodedImage{MakeTestImage(20, 20), ImageFormat::PNG});

  EXPECT_THROW(store.Delete(store.ImagesRoot(), DeleteContext::FOLDER), CatalogException);
  EXPECT_THROW(store.Delete(store.ImagesRoot() / "", DeleteContext::FOLDER), CatalogException);
  // A file placed directly in the root would make its parent the root
  std::ofstream(store.ImagesRoot() / "stray.png") << "x";
  EXPECT_THROW(store.Delete(store.ImagesRoot() / "stray.png", DeleteContext::IMAGE),
               CatalogException);
  // Anything outside the root is refused as well
  auto outside = scratch_dir_ / "keep";
  fs::create_directories(outside);
  EXPECT_THROW(store.Delete(outside, DeleteContext::FOLDER), CatalogException);

  EXPECT_TRUE(fs::exists(store.ImagesRoot()));
  EXPECT_TRUE(fs::exists(store.EntryDirectory(40)));
  EXPECT_TRUE(fs::exists(outside));
}

TEST_F(ArtifactStoreTests, ThumbnailNamesFollowImageNames) {
  EXPECT_EQ(ArtifactStore::ThumbnailPathFor("/a/7/image_7_3.jpg"), fs::path("/a/7/thumb_image_7_3.png"));
  EXPECT_EQ(ArtifactStore::ThumbnailPathFor("/a/7/image_7.webp"), fs::path("/a/7/thumb_image_7.png"));
  EXPECT_EQ(ArtifactStore::ThumbnailPathFor("/a/7/cover.png"), fs::path("/a/7/thumb_cover.png"));
}

TEST_F(ArtifactStoreTests, QualifyingCountSkipsThumbnailsAndMeta) {
  auto dir = scratch_dir_ / "count";
  fs::create_directories(dir);
  WriteTestImage(dir / "image_1_0.png", 8, 8);
  WriteTestImage(dir / "thumb_image_1_0.png", 8, 8);
  WriteTestImage(dir / "thumb_folder.png", 8, 8);
  std::ofstream(dir / "meta.json") << "{}";
  EXPECT_EQ(ArtifactStore::CountQualifyingImages(dir), 1u);
  EXPECT_EQ(ArtifactStore::CountQualifyingImages(scratch_dir_ / "missing"), 0u);
}
};  // namespace imgshelf
