#include "arrow_utils.hpp"

#include <arrow/filesystem/localfs.h>
#include <arrow/filesystem/s3fs.h>

#include <string_view>

namespace circulate::storage::common {

namespace {

arrow::Result<std::shared_ptr<arrow::fs::FileSystem>> MakeS3FileSystem(const circulate::runtime::config::S3Options& proto_options) {
  ARROW_RETURN_NOT_OK(arrow::fs::EnsureS3Initialized());

  arrow::fs::S3Options options = arrow::fs::S3Options::Defaults();
  if (!proto_options.access_key().empty()) {
    options.ConfigureAccessKey(proto_options.access_key(), proto_options.secret_key());
  }
  if (!proto_options.region().empty()) options.region = proto_options.region();
  if (!proto_options.endpoint_override().empty()) options.endpoint_override = proto_options.endpoint_override();
  if (!proto_options.scheme().empty()) options.scheme = proto_options.scheme();
  if (proto_options.connect_timeout() > 0) options.connect_timeout = proto_options.connect_timeout();
  if (proto_options.request_timeout() > 0) options.request_timeout = proto_options.request_timeout();
  options.allow_bucket_creation = proto_options.allow_bucket_creation();

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::static_pointer_cast<arrow::fs::FileSystem>(fs);
}

} // namespace

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(
    const std::string& path, const circulate::runtime::config::ObjectStorageConfig& config) {
  std::string resolved_path = path;

  switch (config.filesystem()) {
    case circulate::runtime::config::FILE_SYSTEM_LOCAL:
      return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::make_shared<arrow::fs::LocalFileSystem>()), resolved_path);

    case circulate::runtime::config::FILE_SYSTEM_S3: {
      if (config.has_s3()) {
        // s3://bucket/prefix -> bucket/prefix
        constexpr std::string_view kScheme = "s3://";
        if (resolved_path.compare(0, kScheme.size(), kScheme) == 0) resolved_path.erase(0, kScheme.size());
        ARROW_ASSIGN_OR_RAISE(auto fs, MakeS3FileSystem(config.s3()));
        return std::make_pair(std::move(fs), resolved_path);
      }
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }

    case circulate::runtime::config::FILE_SYSTEM_AUTO:
    default: {
      ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUriOrPath(resolved_path, &resolved_path));
      return std::make_pair(std::move(fs), resolved_path);
    }
  }
}

} // namespace circulate::storage::common
