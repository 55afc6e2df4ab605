#include "upload_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace circulate::upload {

UploadManager::UploadManager(storage::ObjectStorePtr objects, std::shared_ptr<UploadSession> session, UploadOptions options)
    : objects_(std::move(objects)), session_(std::move(session)), options_(std::move(options)) {
  if (!objects_ || !session_) throw std::invalid_argument("upload manager requires an object store and a session");
  if (options_.minimum_part_size <= 0) throw std::invalid_argument("minimum part size must be positive");
}

void UploadManager::AddRecord(const std::string& key, std::string_view bytes) {
  buffers_[key].append(bytes.data(), bytes.size());
}

// ------------------------------------------------------------------
// Sync
// ------------------------------------------------------------------

void UploadManager::Sync(bool complete) {
  observability::SpanScope span("upload.sync");
  span.SetAttribute("session", session_->SessionId());

  if (!buffers_.empty()) {
    session_->AppendBuffers(buffers_);
    buffers_.clear();
  }

  for (const auto& [key, record] : session_->Get()) {
    if (record.buffer.empty()) continue;

    const bool full = static_cast<int64_t>(record.buffer.size()) >= options_.minimum_part_size;
    if (full || (complete && record.upload_id)) {
      Flush(key, record);
    }
  }
}

void UploadManager::Flush(const std::string& key, const UploadRecord& record) {
  std::string upload_id;
  if (record.upload_id) {
    upload_id = *record.upload_id;
  } else {
    upload_id = objects_->MultipartCreate(key, options_.content_type);
    session_->SetUploadId(key, upload_id);
  }

  auto [last_part, buffer] = session_->GetPartNumAndBuffer(key);
  auto part                = objects_->MultipartUpload(key, upload_id, last_part + 1, buffer);
  session_->AddPartAndClearBuffer(key, part);

  observability::Metrics::Instance().RecordPartUploaded(buffer.size());
  CIRCULATE_LOG_DEBUG("uploaded part",
                      {observability::StringField("key", key), observability::IntField("part", part.part_number()),
                       observability::IntField("bytes", static_cast<int64_t>(buffer.size()))});
}

// ------------------------------------------------------------------
// Complete
// ------------------------------------------------------------------

std::set<std::string> UploadManager::Complete() {
  Sync(true);

  // each key leaves the session as soon as its object exists, so a retry
  // only finishes what is left
  std::set<std::string> finalized;
  for (const auto& [key, record] : session_->Get()) {
    if (record.upload_id && !record.parts.empty()) {
      objects_->MultipartComplete(key, *record.upload_id, record.parts);
    } else {
      if (record.upload_id) objects_->MultipartAbort(key, *record.upload_id);
      objects_->Store(key, record.buffer, options_.content_type);
    }
    session_->ClearUploads(std::vector<std::string>{key});
    finalized.insert(key);
  }

  CIRCULATE_LOG_INFO("upload session completed",
                     {observability::StringField("session", session_->SessionId()), observability::IntField("keys", static_cast<int64_t>(finalized.size()))});
  return finalized;
}

// ------------------------------------------------------------------
// Scoped session
// ------------------------------------------------------------------

void UploadManager::AbortUploads(const std::map<std::string, UploadRecord>& records) {
  for (const auto& [key, record] : records) {
    if (!record.upload_id) continue;
    try {
      objects_->MultipartAbort(key, *record.upload_id);
      observability::Metrics::Instance().RecordUploadAborted();
    } catch (const std::exception& e) {
      CIRCULATE_LOG_ERROR("Failed to abort upload " + key + " (UploadID: " + *record.upload_id + ") due to exception (" + e.what() + ")");
    }
  }
}

void UploadManager::AbortSession() {
  // a fresh lease keeps the next owner out until the uploads read below are gone
  if (!session_->ExtendTimeout()) {
    CIRCULATE_LOG_WARN("upload session no longer held, leaving its uploads to the current owner", {observability::StringField("session", session_->SessionId())});
    return;
  }

  try {
    AbortUploads(session_->Get());
  } catch (const std::exception& e) {
    CIRCULATE_LOG_ERROR("failed to list session uploads", {observability::StringField("session", session_->SessionId()), observability::StringField("error", e.what())});
  }

  if (!session_->Delete()) {
    CIRCULATE_LOG_WARN("upload session not deleted, lock no longer held", {observability::StringField("session", session_->SessionId())});
  }
}

void UploadManager::Reset() {
  buffers_.clear();

  auto records = session_->Get();
  if (records.empty()) {
    session_->SetState(v1::UPLOAD_STATE_UPLOADING);
    return;
  }

  AbortUploads(records);
  session_->ClearUploads();
}

util::Outcome UploadManager::Begin(const std::function<util::Outcome(bool locked)>& fn, bool final_attempt) {
  const auto acquired = session_->Acquire();
  const bool locked   = lock::Held(acquired);

  auto abort_quietly = [&] {
    if (!locked) return;
    try {
      AbortSession();
    } catch (const std::exception& e) {
      CIRCULATE_LOG_ERROR("upload session cleanup failed", {observability::StringField("session", session_->SessionId()), observability::StringField("error", e.what())});
    }
  };

  util::Outcome outcome;
  try {
    outcome = fn(locked);
  } catch (const util::UploadSessionError& e) {
    if (!e.Superseded()) {
      abort_quietly();
      throw;
    }
    outcome = util::Outcome::Superseded(e.what());
  } catch (const util::TransientError& e) {
    if (final_attempt) {
      abort_quietly();
    } else {
      CIRCULATE_LOG_WARN("upload session kept for retry", {observability::StringField("session", session_->SessionId()), observability::StringField("error", e.what())});
      if (locked) lock::detail::ReleaseQuietly(*session_);
    }
    throw;
  } catch (const std::exception&) {
    abort_quietly();
    throw;
  }

  if (outcome.IsError()) {
    abort_quietly();
  } else if (outcome.kind == util::Outcome::Kind::kSuperseded && acquired == lock::AcquireResult::kExtended) {
    CIRCULATE_LOG_DEBUG("superseded holder leaves the session lock in place", {observability::StringField("session", session_->SessionId())});
  } else if (locked) {
    lock::detail::ReleaseQuietly(*session_);
  }
  return outcome;
}

} // namespace circulate::upload
