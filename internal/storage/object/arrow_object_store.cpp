#include "arrow_object_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/util/key_value_metadata.h>

#include <cstdio>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/uuid.hpp"

namespace circulate::storage {

using namespace circulate::storage::common;

namespace {

constexpr const char* kStagingDir = ".multipart";

std::string Etag(const std::string& bytes) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }

  char out[17];
  std::snprintf(out, sizeof(out), "%016llx", static_cast<unsigned long long>(hash));
  return out;
}

std::shared_ptr<const arrow::KeyValueMetadata> ContentMetadata(const std::string& content_type) {
  if (content_type.empty()) return {};
  return arrow::key_value_metadata({"Content-Type"}, {content_type});
}

} // namespace

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  if (!fs_) throw std::invalid_argument("object store requires a filesystem");
}

std::string ArrowObjectStore::ObjectPath(const std::string& key) const {
  ValidateObjectKey(key);
  return JoinPath(root_path_, key);
}

std::string ArrowObjectStore::StagingDir(const std::string& upload_id) const {
  // upload ids are canonical uuids, nothing else may reach the path
  if (util::ToString(util::FromString(upload_id)) != upload_id) {
    throw std::invalid_argument("malformed multipart upload id " + upload_id);
  }
  return JoinPath(root_path_, std::string(kStagingDir) + "/" + upload_id);
}

std::string ArrowObjectStore::PartPath(const std::string& upload_id, int32_t part_number) const {
  char name[32];
  std::snprintf(name, sizeof(name), "%05d.part", part_number);
  return StagingDir(upload_id) + "/" + name;
}

void ArrowObjectStore::WriteObject(const std::string& path, const std::string& bytes, const std::string& content_type) {
  const auto parent = ParentPath(path);
  if (!parent.empty()) Unwrap(fs_->CreateDir(parent, /*recursive=*/true));

  auto out = Unwrap(fs_->OpenOutputStream(path, ContentMetadata(content_type)));
  Unwrap(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())));
  Unwrap(out->Close());
}

std::string ArrowObjectStore::StagedKey(const std::string& upload_id) {
  const auto manifest_path = StagingDir(upload_id) + "/manifest";
  auto       info          = Unwrap(fs_->GetFileInfo(manifest_path));
  if (info.type() != arrow::fs::FileType::File) {
    throw util::NotFound("unknown multipart upload " + upload_id);
  }

  auto manifest = ReadAll(Unwrap(fs_->OpenInputFile(manifest_path)))->ToString();
  return manifest.substr(0, manifest.find('\n'));
}

// ------------------------------------------------------------------
// Multipart
// ------------------------------------------------------------------

std::string ArrowObjectStore::MultipartCreate(const std::string& key, const std::string& content_type) {
  ValidateObjectKey(key);

  const auto upload_id = util::NewToken();
  WriteObject(StagingDir(upload_id) + "/manifest", key + "\n" + content_type, "");

  CIRCULATE_LOG_DEBUG("multipart upload created", {observability::StringField("key", key), observability::StringField("upload_id", upload_id)});
  return upload_id;
}

circulate::v1::UploadPart ArrowObjectStore::MultipartUpload(const std::string& key, const std::string& upload_id, int32_t part_number,
                                                            const std::string& bytes) {
  if (part_number < 1) throw std::invalid_argument("part numbers start at 1");
  if (StagedKey(upload_id) != key) {
    throw std::invalid_argument("multipart upload " + upload_id + " belongs to a different key");
  }

  WriteObject(PartPath(upload_id, part_number), bytes, "");

  circulate::v1::UploadPart part;
  part.set_part_number(part_number);
  part.set_etag(Etag(bytes));
  return part;
}

void ArrowObjectStore::MultipartComplete(const std::string& key, const std::string& upload_id, const std::vector<circulate::v1::UploadPart>& parts) {
  if (parts.empty()) throw std::invalid_argument("multipart upload needs at least one part");

  const auto manifest_path = StagingDir(upload_id) + "/manifest";
  if (StagedKey(upload_id) != key) {
    throw std::invalid_argument("multipart upload " + upload_id + " belongs to a different key");
  }
  auto manifest     = ReadAll(Unwrap(fs_->OpenInputFile(manifest_path)))->ToString();
  auto content_type = manifest.substr(manifest.find('\n') + 1);

  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (parts[i].part_number() != static_cast<int32_t>(i + 1)) {
      throw std::invalid_argument("multipart parts must be numbered 1..N without gaps");
    }
  }

  const auto path   = ObjectPath(key);
  const auto parent = ParentPath(path);
  if (!parent.empty()) Unwrap(fs_->CreateDir(parent, /*recursive=*/true));

  auto out = Unwrap(fs_->OpenOutputStream(path, ContentMetadata(content_type)));
  for (const auto& part : parts) {
    auto bytes = ReadAll(Unwrap(fs_->OpenInputFile(PartPath(upload_id, part.part_number()))));
    if (Etag(bytes->ToString()) != part.etag()) {
      Unwrap(out->Abort());
      throw std::invalid_argument("etag mismatch for part " + std::to_string(part.part_number()) + " of upload " + upload_id);
    }
    Unwrap(out->Write(bytes));
  }
  Unwrap(out->Close());

  Unwrap(fs_->DeleteDir(StagingDir(upload_id)));
}

void ArrowObjectStore::MultipartAbort(const std::string& key, const std::string& upload_id) {
  const auto dir  = StagingDir(upload_id);
  auto       info = Unwrap(fs_->GetFileInfo(dir));
  if (info.type() == arrow::fs::FileType::NotFound) return;

  Unwrap(fs_->DeleteDir(dir));
  CIRCULATE_LOG_DEBUG("multipart upload aborted", {observability::StringField("key", key), observability::StringField("upload_id", upload_id)});
}

// ------------------------------------------------------------------
// Single shot
// ------------------------------------------------------------------

void ArrowObjectStore::Store(const std::string& key, const std::string& bytes, const std::string& content_type) {
  WriteObject(ObjectPath(key), bytes, content_type);
}

std::string ArrowObjectStore::Read(const std::string& key) {
  return ReadAll(Unwrap(fs_->OpenInputFile(ObjectPath(key))))->ToString();
}

} // namespace circulate::storage
