#include "storage_factory.hpp"

#include <arrow/filesystem/localfs.h>

#include <tuple>

#include "common/arrow_utils.hpp"
#include "internal/observability/logging.hpp"
#include "object/arrow_object_store.hpp"

namespace circulate::storage {

ObjectStorePtr StorageFactory::Build(const circulate::runtime::config::ObjectStorageConfig& cfg) {
  std::shared_ptr<arrow::fs::FileSystem> fs;
  std::string                            root;

  if (cfg.root_path().empty()) {
    fs   = std::make_shared<arrow::fs::LocalFileSystem>();
    root = kDefaultObjectRoot;
  } else {
    std::tie(fs, root) = common::Unwrap(common::ResolveFileSystem(cfg.root_path(), cfg));
  }

  if (fs->type_name() == "local") common::Unwrap(fs->CreateDir(root, /*recursive=*/true));

  CIRCULATE_LOG_INFO("object store ready", {observability::StringField("filesystem", fs->type_name()), observability::StringField("root", root)});
  return std::make_shared<ArrowObjectStore>(std::move(fs), std::move(root));
}

} // namespace circulate::storage
