#include <arrow/filesystem/localfs.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/feed/directory_page_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/upload/upload_manager.hpp"
#include "internal/util/backoff.hpp"

using namespace circulate;

static void Usage() {
  std::cout << "Usage:\n"
            << "  circulatectl [--config <config.yaml>] lock-status <lock_type> <name>...\n"
            << "  circulatectl [--config <config.yaml>] lock-release <lock_type> <name>...\n"
            << "  circulatectl [--config <config.yaml>] session-show <session_id>\n"
            << "  circulatectl [--config <config.yaml>] session-abort <session_id>\n"
            << "  circulatectl backoff <retries> [factor] [base] [jitter] [max_time_s]\n"
            << "  circulatectl [--config <config.yaml>] export <source_dir> <resource_id> [--force] [--page-size N] [--output-key K]\n";
}

static std::string LockKey(const factory::Application& app, const std::vector<std::string>& args) {
  return store::JoinKey(store::JoinKey({app.key_prefix, args[0]}), std::vector<std::string>(args.begin() + 1, args.end()));
}

// ------------------------------------------------------------

static int LockStatus(factory::Application& app, const std::vector<std::string>& args) {
  const auto key   = LockKey(app, args);
  auto       owner = app.store->Get(key);
  if (!owner) {
    std::cout << key << " free\n";
    return 0;
  }

  std::cout << key << " held token=" << *owner;
  if (auto ttl = app.store->Ttl(key)) std::cout << " ttl_ms=" << ttl->count();
  std::cout << "\n";
  return 0;
}

static int LockRelease(factory::Application& app, const std::vector<std::string>& args) {
  const auto key   = LockKey(app, args);
  auto       owner = app.store->Get(key);
  if (!owner || !app.store->CompareAndDelete(key, *owner)) {
    std::cout << key << " not held\n";
    return 0;
  }

  CIRCULATE_LOG_WARN("lock released by operator", {observability::StringField("key", key), observability::StringField("token", *owner)});
  std::cout << key << " released\n";
  return 0;
}

// ------------------------------------------------------------

static int SessionShow(factory::Application& app, const std::string& session_id) {
  upload::UploadSession session(app.store, app.key_prefix, session_id, std::nullopt, 0, app.export_options.session);

  auto state = session.State();
  if (!state) {
    std::cout << "session " << session_id << " not found\n";
    return 3;
  }

  std::cout << "session=" << session_id << " state=" << v1::UploadState_Name(*state) << " update_number=" << session.StoredUpdateNumber().value_or(0)
            << " locked=" << (session.Locked() ? "true" : "false") << "\n";

  for (const auto& [key, record] : session.Get()) {
    std::cout << "  " << key << " buffered=" << record.buffer.size() << " upload_id=" << record.upload_id.value_or("-") << " parts=" << record.parts.size()
              << "\n";
  }
  return 0;
}

static int SessionAbort(factory::Application& app, const std::string& session_id) {
  auto session = std::make_shared<upload::UploadSession>(app.store, app.key_prefix, session_id, std::nullopt, 0, app.export_options.session);
  if (!lock::Held(session->Acquire())) {
    std::cerr << "session " << session_id << " is locked by another task\n";
    return 2;
  }

  upload::UploadManager manager(app.objects, session, app.export_options.upload);
  manager.AbortSession();
  std::cout << "session " << session_id << " aborted\n";
  return 0;
}

// ------------------------------------------------------------

static int BackoffTable(const std::vector<std::string>& args) {
  const int retries = std::stoi(args[0]);

  util::BackoffPolicy policy;
  if (args.size() > 1) policy.factor = std::stod(args[1]);
  if (args.size() > 2) policy.base = std::stod(args[2]);
  if (args.size() > 3) policy.jitter = std::stod(args[3]);
  if (args.size() > 4) policy.max_time = std::stod(args[4]);

  for (int i = 0; i <= retries; ++i) {
    std::cout << "retry=" << i << " delay_s=" << util::Backoff(i, policy) << "\n";
  }
  return 0;
}

// ------------------------------------------------------------

static int Export(factory::Application& app, const std::vector<std::string>& args) {
  const std::string source_dir  = args[0];
  const std::string resource_id = args[1];

  bool        force      = false;
  std::size_t page_size  = 100;
  std::string output_key = "records";
  for (std::size_t i = 2; i < args.size(); ++i) {
    if (args[i] == "--force") {
      force = true;
    } else if (args[i] == "--page-size" && i + 1 < args.size()) {
      page_size = std::stoul(args[++i]);
    } else if (args[i] == "--output-key" && i + 1 < args.size()) {
      output_key = args[++i];
    } else {
      Usage();
      return 1;
    }
  }

  auto fs       = std::make_shared<arrow::fs::LocalFileSystem>();
  auto source   = std::make_shared<feed::DirectoryPageSource>(fs, source_dir, page_size, output_key);
  auto exporter = std::make_shared<task::ExportTask>(app.store, app.objects, source, app.export_options);

  std::mutex            finalized_mutex;
  std::set<std::string> finalized;
  app.worker->Register(task::ExportTask::kName, [&](const v1::TaskRequest& request) {
    auto result = exporter->Run(request.cursor());
    std::lock_guard lock(finalized_mutex);
    finalized.insert(result.finalized_keys.begin(), result.finalized_keys.end());
    return result;
  });

  auto args_to_run = task::ScheduleExport(app.store, app.export_options, resource_id, std::nullopt, force);
  if (!args_to_run) {
    std::cerr << "export for " << resource_id << " is already queued or running\n";
    return 2;
  }

  app.queue->Enqueue(task::ExportTask::kName, *args_to_run);
  app.worker->Start();
  app.queue->WaitIdle();
  app.worker->Stop();

  for (const auto& failure : app.worker->Failures()) {
    std::cerr << "failed: " << failure.request.task_name() << " " << failure.error << "\n";
  }
  for (const auto& key : finalized) {
    std::cout << key << "\n";
  }
  return app.worker->Failures().empty() ? 0 : 2;
}

// ------------------------------------------------------------

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];
  args.erase(args.begin());

  try {
    if (cmd == "backoff") {
      if (args.empty()) {
        Usage();
        return 1;
      }
      return BackoffTable(args);
    }

    circulate::runtime::config::RuntimeConfig runtime_config;
    if (!config_path.empty()) runtime_config = config::ConfigLoader::LoadFromYaml(config_path);

    observability::InitializeLogging(runtime_config);
    observability::InitializeTracing(runtime_config);
    observability::InitializeMetrics(runtime_config);

    auto app = factory::Build(runtime_config);

    int rc = 1;
    if (cmd == "lock-status" && args.size() >= 2) {
      rc = LockStatus(app, args);
    } else if (cmd == "lock-release" && args.size() >= 2) {
      rc = LockRelease(app, args);
    } else if (cmd == "session-show" && args.size() == 1) {
      rc = SessionShow(app, args[0]);
    } else if (cmd == "session-abort" && args.size() == 1) {
      rc = SessionAbort(app, args[0]);
    } else if (cmd == "export" && args.size() >= 2) {
      rc = Export(app, args);
    } else {
      Usage();
    }

    observability::ShutdownMetrics();
    observability::ShutdownTracing();
    observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    CIRCULATE_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    observability::ShutdownMetrics();
    observability::ShutdownTracing();
    observability::ShutdownLogging();
    return 2;
  }
}
