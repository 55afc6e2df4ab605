#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/object_store.hpp"

namespace circulate::storage {

/*
  Object store on an Arrow filesystem (S3 / MinIO / local).

  Arrow filesystems expose whole-object writes only, so multipart uploads are
  staged as one object per part and concatenated on completion:

      <root>/.multipart/<upload_id>/manifest      target key + content type
      <root>/.multipart/<upload_id>/00001.part
      ...
      <root>/<key>                                written by MultipartComplete

  Part etags are the FNV-1a 64 digest of the part bytes and are re-checked
  when the parts are assembled.
*/
class ArrowObjectStore final : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::string MultipartCreate(const std::string& key, const std::string& content_type) override;

  circulate::v1::UploadPart MultipartUpload(const std::string& key, const std::string& upload_id, int32_t part_number,
                                            const std::string& bytes) override;

  void MultipartComplete(const std::string& key, const std::string& upload_id, const std::vector<circulate::v1::UploadPart>& parts) override;

  void MultipartAbort(const std::string& key, const std::string& upload_id) override;

  void Store(const std::string& key, const std::string& bytes, const std::string& content_type) override;

  std::string Read(const std::string& key) override;

 private:
  std::string ObjectPath(const std::string& key) const;
  std::string StagingDir(const std::string& upload_id) const;
  std::string PartPath(const std::string& upload_id, int32_t part_number) const;

  // Key the upload was created for; throws util::NotFound for unknown uploads.
  std::string StagedKey(const std::string& upload_id);

  void WriteObject(const std::string& path, const std::string& bytes, const std::string& content_type);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
};

} // namespace circulate::storage
