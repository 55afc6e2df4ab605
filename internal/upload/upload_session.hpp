#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "circulate/v1.hpp"
#include "internal/lock/lock.hpp"
#include "internal/store/api/coordination_store.hpp"

namespace circulate::upload {

// Persisted state of one output key.
struct UploadRecord {
  std::string                            buffer;
  std::optional<std::string>             upload_id;
  std::vector<circulate::v1::UploadPart> parts;
};

struct UploadSessionOptions {
  // Lease on the session lock and lifetime of all session data.
  std::chrono::milliseconds session_timeout = std::chrono::minutes(30);
  std::chrono::milliseconds retry_delay{200};
};

/*
  UploadSession

  Per-output-key buffers and multipart upload descriptors shared by every
  invocation of one export run, stored under

      {prefix}:upload:{session}                        lock owner token
      {prefix}:upload:{session}:meta:update_number
      {prefix}:upload:{session}:meta:state
      {prefix}:upload:{session}:meta:writer            token of the last mutation
      {prefix}:upload:{session}:buffer:{output_key}
      {prefix}:upload:{session}:parts:{output_key}     UploadDescriptor

  The session is its own lock. Acquiring it (re)starts the lease on every
  key above; releasing it leaves the data in place for the next invocation.

  Every mutation requires the lock and an update number equal to the stored
  one, and is committed as one guarded batch that also bumps the stored
  number. A holder with a stale number gets UploadSessionError instead of
  clobbering a newer invocation's work.

  Reads do not require the lock.
*/
class UploadSession : public lock::Lock {
 public:
  UploadSession(std::shared_ptr<store::CoordinationStore> store,
                const std::string&                        key_prefix,
                std::string                               session_id,
                std::optional<std::string>                token         = std::nullopt,
                int64_t                                   update_number = 0,
                UploadSessionOptions                      options       = {});

  using Lock::Acquire;

  lock::AcquireResult Acquire() override;
  bool          Release() override;
  bool          ExtendTimeout() override;
  bool          Locked(bool by_us = false) override;

  const std::string& Key() const override {
    return key_;
  }

  const std::string& Token() const override {
    return token_;
  }

  const std::string& SessionId() const {
    return session_id_;
  }

  // Number this instance expects to find in the store.
  int64_t UpdateNumber() const {
    return update_number_;
  }

  // Number the next mutation expects. For a holder that just (re)created the
  // session and owns the run.
  void SetUpdateNumber(int64_t update_number) {
    update_number_ = update_number;
  }

  std::optional<int64_t> StoredUpdateNumber();

  // Token of the holder that made the last mutation.
  std::optional<std::string> LastWriter();

  // Appends to each key's buffer; returns the new buffer lengths.
  std::map<std::string, int64_t> AppendBuffers(const std::map<std::string, std::string>& data);

  // All keys, or only `keys`; missing keys are left out.
  std::map<std::string, UploadRecord> Get(const std::optional<std::vector<std::string>>& keys = std::nullopt);

  std::map<std::string, std::optional<std::string>> GetUploadIds(const std::vector<std::string>& keys);

  // Fails when the key has no buffer yet or already has an upload id.
  void SetUploadId(const std::string& key, const std::string& upload_id);

  // Records the next part and empties the buffer in one step.
  void AddPartAndClearBuffer(const std::string& key, const circulate::v1::UploadPart& part);

  // Last recorded part number (0 when none) and the current buffer.
  std::pair<int32_t, std::string> GetPartNumAndBuffer(const std::string& key);

  // Drops the buffers and descriptors of `keys` (all keys when unset),
  // keeping the session itself. Fails when none of them exist.
  void ClearUploads(const std::optional<std::vector<std::string>>& keys = std::nullopt);

  std::optional<circulate::v1::UploadState> State();
  void                                      SetState(circulate::v1::UploadState state);

  // Removes the lock and all session data. Owner only.
  bool Delete();

 protected:
  std::chrono::milliseconds NextRetryDelay(int attempt) const override;

 private:
  std::string MetaKey(const char* name) const;
  std::string BufferKey(const std::string& output_key) const;
  std::string PartsKey(const std::string& output_key) const;

  void CheckMutable();

  // Guarded commit of `ops` plus the update number bump, state change and
  // lease refresh. Replies are returned for `ops` only.
  std::vector<store::OperationReply> Mutate(std::vector<store::Operation> ops,
                                            circulate::v1::UploadState state = circulate::v1::UPLOAD_STATE_UPLOADING);

  std::shared_ptr<store::CoordinationStore> store_;
  std::string                               session_id_;
  std::string                               key_;
  std::string                               data_prefix_;
  std::string                               token_;
  int64_t                                   update_number_;
  UploadSessionOptions                      options_;
};

} // namespace circulate::upload
