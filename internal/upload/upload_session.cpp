#include "upload_session.hpp"

#include <random>
#include <stdexcept>

#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace circulate::upload {

using lock::AcquireResult;
using store::Condition;
using store::Operation;
using util::UploadSessionError;
using Reason = util::UploadSessionError::Reason;

namespace {

constexpr const char* kSessionLockType = "upload";
constexpr const char* kBufferSegment   = "buffer:";
constexpr const char* kPartsSegment    = "parts:";

circulate::v1::UploadDescriptor ParseDescriptor(const std::string& key, const std::string& bytes) {
  circulate::v1::UploadDescriptor descriptor;
  if (!descriptor.ParseFromString(bytes)) {
    throw UploadSessionError(Reason::kCorrupt, "Corrupt upload descriptor for key " + key);
  }
  return descriptor;
}

std::string SerializeDescriptor(const circulate::v1::UploadDescriptor& descriptor) {
  std::string out;
  if (!descriptor.SerializeToString(&out)) {
    throw std::runtime_error("failed to serialize upload descriptor");
  }
  return out;
}

bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

UploadSession::UploadSession(std::shared_ptr<store::CoordinationStore> store,
                             const std::string&                        key_prefix,
                             std::string                               session_id,
                             std::optional<std::string>                token,
                             int64_t                                   update_number,
                             UploadSessionOptions                      options)
    : store_(std::move(store)),
      session_id_(std::move(session_id)),
      token_(token ? std::move(*token) : util::NewToken()),
      update_number_(update_number),
      options_(options) {
  if (!store_) throw std::invalid_argument("upload session requires a coordination store");
  if (session_id_.empty() || session_id_.find(':') != std::string::npos) {
    throw std::invalid_argument("upload session id must be non-empty and must not contain ':'");
  }

  key_         = store::JoinKey({key_prefix, kSessionLockType, session_id_});
  data_prefix_ = key_ + ":";
}

std::string UploadSession::MetaKey(const char* name) const {
  return data_prefix_ + "meta:" + name;
}

std::string UploadSession::BufferKey(const std::string& output_key) const {
  return data_prefix_ + kBufferSegment + output_key;
}

std::string UploadSession::PartsKey(const std::string& output_key) const {
  return data_prefix_ + kPartsSegment + output_key;
}

// ------------------------------------------------------------------
// Lock
// ------------------------------------------------------------------

AcquireResult UploadSession::Acquire() {
  const auto ttl = options_.session_timeout;

  auto created = store_->Commit({Condition::Absent(key_)},
                                {
                                    Operation::Set(key_, token_, ttl),
                                    Operation::SetIfAbsent(MetaKey("update_number"), "0", ttl),
                                    Operation::SetIfAbsent(MetaKey("state"), circulate::v1::UploadState_Name(circulate::v1::UPLOAD_STATE_INITIAL), ttl),
                                    Operation::ExpirePrefix(data_prefix_, ttl),
                                });

  AcquireResult result = AcquireResult::kFailed;
  if (created) {
    result = AcquireResult::kAcquired;
  } else if (ExtendTimeout()) {
    result = AcquireResult::kExtended;
  }

  observability::Metrics::Instance().RecordLockAcquire(kSessionLockType, lock::AcquireResultName(result));
  return result;
}

bool UploadSession::Release() {
  return store_->CompareAndDelete(key_, token_);
}

bool UploadSession::ExtendTimeout() {
  const auto ttl = options_.session_timeout;
  return store_->Commit({Condition::Equals(key_, token_)}, {Operation::Expire(key_, ttl), Operation::ExpirePrefix(data_prefix_, ttl)}).has_value();
}

bool UploadSession::Locked(bool by_us) {
  auto current = store_->Get(key_);
  if (!current) return false;
  return !by_us || *current == token_;
}

bool UploadSession::Delete() {
  return store_->Commit({Condition::Equals(key_, token_)}, {Operation::Delete(key_), Operation::DeletePrefix(data_prefix_)}).has_value();
}

std::chrono::milliseconds UploadSession::NextRetryDelay(int) const {
  const auto max_ms = options_.retry_delay.count();
  if (max_ms <= 0) return std::chrono::milliseconds(0);

  static thread_local std::mt19937_64   rng{std::random_device{}()};
  std::uniform_int_distribution<int64_t> dist(0, max_ms);
  return std::chrono::milliseconds(dist(rng));
}

// ------------------------------------------------------------------
// Guarded mutation
// ------------------------------------------------------------------

std::optional<int64_t> UploadSession::StoredUpdateNumber() {
  auto value = store_->Get(MetaKey("update_number"));
  if (!value) return std::nullopt;
  try {
    return std::stoll(*value);
  } catch (const std::exception&) {
    throw UploadSessionError(Reason::kCorrupt, "Corrupt update number: " + *value);
  }
}

std::optional<std::string> UploadSession::LastWriter() {
  return store_->Get(MetaKey("writer"));
}

void UploadSession::CheckMutable() {
  if (!Locked(true)) throw UploadSessionError(Reason::kNotLocked, "Must hold lock");

  auto stored = StoredUpdateNumber();
  if (!stored || *stored != update_number_) {
    throw UploadSessionError(Reason::kUpdateNumberMismatch, "Update number mismatch");
  }
}

std::vector<store::OperationReply> UploadSession::Mutate(std::vector<Operation> ops, circulate::v1::UploadState state) {
  const auto ttl       = options_.session_timeout;
  const auto requested = ops.size();

  ops.push_back(Operation::Set(MetaKey("update_number"), std::to_string(update_number_ + 1), ttl));
  ops.push_back(Operation::Set(MetaKey("state"), circulate::v1::UploadState_Name(state), ttl));
  ops.push_back(Operation::Set(MetaKey("writer"), token_, ttl));
  ops.push_back(Operation::Expire(key_, ttl));
  ops.push_back(Operation::ExpirePrefix(data_prefix_, ttl));

  auto replies = store_->Commit({Condition::Equals(key_, token_), Condition::Equals(MetaKey("update_number"), std::to_string(update_number_))}, ops);
  if (!replies) {
    throw UploadSessionError(Reason::kConcurrentModification, "Another process is modifying the buffers");
  }

  ++update_number_;
  replies->resize(requested);
  return std::move(*replies);
}

// ------------------------------------------------------------------
// Buffers and descriptors
// ------------------------------------------------------------------

std::map<std::string, int64_t> UploadSession::AppendBuffers(const std::map<std::string, std::string>& data) {
  if (data.empty()) return {};
  CheckMutable();

  std::vector<Operation> ops;
  ops.reserve(data.size());
  for (const auto& [key, bytes] : data) {
    ops.push_back(Operation::Append(BufferKey(key), bytes));
  }

  auto replies = Mutate(std::move(ops));

  std::map<std::string, int64_t> lengths;
  std::size_t                    i = 0;
  for (const auto& [key, bytes] : data) {
    lengths[key] = replies[i++].count;
  }
  return lengths;
}

std::map<std::string, UploadRecord> UploadSession::Get(const std::optional<std::vector<std::string>>& keys) {
  const std::string buffer_prefix = data_prefix_ + kBufferSegment;
  const std::string parts_prefix  = data_prefix_ + kPartsSegment;

  std::map<std::string, UploadRecord> records;
  for (const auto& [key, value] : store_->Scan(data_prefix_)) {
    if (StartsWith(key, buffer_prefix)) {
      records[key.substr(buffer_prefix.size())].buffer = value;
    } else if (StartsWith(key, parts_prefix)) {
      const auto output_key = key.substr(parts_prefix.size());
      const auto descriptor = ParseDescriptor(output_key, value);

      auto& record = records[output_key];
      if (!descriptor.upload_id().empty()) record.upload_id = descriptor.upload_id();
      record.parts.assign(descriptor.parts().begin(), descriptor.parts().end());
    }
  }

  if (!keys) return records;

  std::map<std::string, UploadRecord> selected;
  for (const auto& key : *keys) {
    if (auto it = records.find(key); it != records.end()) selected.emplace(key, std::move(it->second));
  }
  return selected;
}

std::map<std::string, std::optional<std::string>> UploadSession::GetUploadIds(const std::vector<std::string>& keys) {
  auto records = Get(keys);

  std::map<std::string, std::optional<std::string>> ids;
  for (const auto& key : keys) {
    auto it  = records.find(key);
    ids[key] = it == records.end() ? std::nullopt : it->second.upload_id;
  }
  return ids;
}

void UploadSession::SetUploadId(const std::string& key, const std::string& upload_id) {
  CheckMutable();

  auto records = Get(std::vector<std::string>{key});
  auto it      = records.find(key);
  if (it == records.end()) {
    throw UploadSessionError(Reason::kNotInitialized, "Failed to set upload ID for " + key + ": key not initialized");
  }
  if (it->second.upload_id) {
    throw UploadSessionError(Reason::kUploadIdConflict, "Failed to set upload ID for " + key + ": already set");
  }

  circulate::v1::UploadDescriptor descriptor;
  descriptor.set_upload_id(upload_id);
  for (const auto& part : it->second.parts) *descriptor.add_parts() = part;

  Mutate({Operation::Set(PartsKey(key), SerializeDescriptor(descriptor))});
}

void UploadSession::AddPartAndClearBuffer(const std::string& key, const circulate::v1::UploadPart& part) {
  CheckMutable();

  auto records = Get(std::vector<std::string>{key});
  auto it      = records.find(key);
  if (it == records.end()) {
    throw UploadSessionError(Reason::kNotInitialized, "Failed to add part and clear buffer for " + key + ": key not initialized");
  }

  const auto expected = static_cast<int32_t>(it->second.parts.size()) + 1;
  if (part.part_number() != expected) {
    throw UploadSessionError(Reason::kPartOutOfOrder, "Failed to add part and clear buffer for " + key + ": expected part " +
                                                          std::to_string(expected) + ", got " + std::to_string(part.part_number()));
  }

  circulate::v1::UploadDescriptor descriptor;
  if (it->second.upload_id) descriptor.set_upload_id(*it->second.upload_id);
  for (const auto& existing : it->second.parts) *descriptor.add_parts() = existing;
  *descriptor.add_parts() = part;

  Mutate({Operation::Set(PartsKey(key), SerializeDescriptor(descriptor)), Operation::Set(BufferKey(key), "")});
}

std::pair<int32_t, std::string> UploadSession::GetPartNumAndBuffer(const std::string& key) {
  auto records = Get(std::vector<std::string>{key});
  auto it      = records.find(key);
  if (it == records.end()) {
    throw UploadSessionError(Reason::kNotInitialized, "Failed to get part number and buffer data for " + key);
  }

  const int32_t last = it->second.parts.empty() ? 0 : it->second.parts.back().part_number();
  return {last, std::move(it->second.buffer)};
}

void UploadSession::ClearUploads(const std::optional<std::vector<std::string>>& keys) {
  CheckMutable();

  if (Get(keys).empty()) {
    throw UploadSessionError(Reason::kNotInitialized, "Failed to clear uploads: session has no uploads");
  }

  if (!keys) {
    Mutate({Operation::DeletePrefix(data_prefix_ + kBufferSegment), Operation::DeletePrefix(data_prefix_ + kPartsSegment)});
    return;
  }

  std::vector<Operation> ops;
  for (const auto& key : *keys) {
    ops.push_back(Operation::Delete(BufferKey(key)));
    ops.push_back(Operation::Delete(PartsKey(key)));
  }
  Mutate(std::move(ops));
}

// ------------------------------------------------------------------
// State
// ------------------------------------------------------------------

std::optional<circulate::v1::UploadState> UploadSession::State() {
  auto value = store_->Get(MetaKey("state"));
  if (!value) return std::nullopt;

  circulate::v1::UploadState state;
  if (!circulate::v1::UploadState_Parse(*value, &state)) {
    throw UploadSessionError(Reason::kCorrupt, "Corrupt session state: " + *value);
  }
  return state;
}

void UploadSession::SetState(circulate::v1::UploadState state) {
  CheckMutable();
  Mutate({}, state);
}

} // namespace circulate::upload
