#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/storage/object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace circulate::testing {

/*
  In-memory ObjectStore that records every call. Part uploads can be made
  to fail after a number of successful ones, or for the next few calls.
*/
class FakeObjectStore final : public storage::ObjectStore {
 public:
  struct Upload {
    std::string                    key;
    std::map<int32_t, std::string> parts;
  };

  std::string MultipartCreate(const std::string& key, const std::string&) override {
    std::lock_guard lock(mutex_);
    auto            id = util::NewToken();
    open_[id]          = Upload{key, {}};
    ++creates;
    return id;
  }

  circulate::v1::UploadPart MultipartUpload(const std::string& key, const std::string& upload_id, int32_t part_number,
                                            const std::string& bytes) override {
    std::lock_guard lock(mutex_);
    if (fail_next_part_uploads > 0) {
      --fail_next_part_uploads;
      throw util::ObjectStoreError("injected part upload failure");
    }
    if (fail_part_uploads_after >= 0 && part_uploads >= fail_part_uploads_after) {
      throw util::ObjectStoreError("injected part upload failure");
    }

    auto it = open_.find(upload_id);
    if (it == open_.end() || it->second.key != key) throw util::NotFound("no such upload " + upload_id);

    it->second.parts[part_number] = bytes;
    ++part_uploads;

    circulate::v1::UploadPart part;
    part.set_part_number(part_number);
    part.set_etag("etag-" + std::to_string(part_number) + "-" + std::to_string(bytes.size()));
    return part;
  }

  void MultipartComplete(const std::string& key, const std::string& upload_id, const std::vector<circulate::v1::UploadPart>& parts) override {
    std::lock_guard lock(mutex_);
    auto            it = open_.find(upload_id);
    if (it == open_.end()) throw util::NotFound("no such upload " + upload_id);

    std::string object;
    for (std::size_t i = 0; i < parts.size(); ++i) {
      if (parts[i].part_number() != static_cast<int32_t>(i + 1)) throw std::invalid_argument("non contiguous parts");
      object += it->second.parts.at(parts[i].part_number());
    }
    objects[key] = object;
    open_.erase(it);
  }

  void MultipartAbort(const std::string& key, const std::string& upload_id) override {
    std::lock_guard lock(mutex_);
    if (fail_aborts) throw util::ObjectStoreError("injected abort failure");
    aborted.push_back(key);
    open_.erase(upload_id);
  }

  void Store(const std::string& key, const std::string& bytes, const std::string&) override {
    std::lock_guard lock(mutex_);
    objects[key] = bytes;
    ++stores;
  }

  std::string Read(const std::string& key) override {
    std::lock_guard lock(mutex_);
    auto            it = objects.find(key);
    if (it == objects.end()) throw util::NotFound(key);
    return it->second;
  }

  std::size_t OpenUploads() const {
    std::lock_guard lock(mutex_);
    return open_.size();
  }

  std::map<std::string, std::string> objects;
  std::vector<std::string>           aborted;
  int                                creates                 = 0;
  int                                part_uploads            = 0;
  int                                stores                  = 0;
  int                                fail_part_uploads_after = -1;
  int                                fail_next_part_uploads  = 0;
  bool                               fail_aborts             = false;

 private:
  mutable std::mutex            mutex_;
  std::map<std::string, Upload> open_;
};

} // namespace circulate::testing
