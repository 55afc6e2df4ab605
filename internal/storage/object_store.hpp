#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "circulate/v1.hpp"

namespace circulate::storage {

/*
  Object storage abstraction used by the upload manager.

  Multipart protocol:

      id    = MultipartCreate(key)
      part  = MultipartUpload(key, id, 1, bytes)   ... parts 1..N in order
      MultipartComplete(key, id, [part 1..N])      object becomes visible
   or MultipartAbort(key, id)                      staged parts discarded

  Small outputs skip the protocol and go through Store().

  Implementations:
    ArrowObjectStore  -> Arrow filesystem (S3 / MinIO / local)
*/

class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // ------------------------------------------------------------------
  // Multipart
  // ------------------------------------------------------------------
  virtual std::string MultipartCreate(const std::string& key, const std::string& content_type) = 0;

  virtual circulate::v1::UploadPart MultipartUpload(const std::string& key, const std::string& upload_id, int32_t part_number,
                                                    const std::string& bytes) = 0;

  /*
    Assemble the object from `parts`, which must be numbered 1..N without
    gaps and carry the etags MultipartUpload returned.
  */
  virtual void MultipartComplete(const std::string& key, const std::string& upload_id, const std::vector<circulate::v1::UploadPart>& parts) = 0;

  // Idempotent; aborting an unknown upload is not an error.
  virtual void MultipartAbort(const std::string& key, const std::string& upload_id) = 0;

  // ------------------------------------------------------------------
  // Single shot
  // ------------------------------------------------------------------
  virtual void Store(const std::string& key, const std::string& bytes, const std::string& content_type) = 0;

  virtual std::string Read(const std::string& key) = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

} // namespace circulate::storage
