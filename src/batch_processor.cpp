/**
 * @file batch_processor.cpp
 * @brief Directory walk and per-sidecar pipeline implementation
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Sorted recursive sidecar discovery
 *
 *          - Per-sidecar pipeline with explicit result values
 *
 *          - Optional work-queue parallelism across streams
 *
 *          - Summary output and the JSON failure report
 */

#include "takeout_timefix/batch_processor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <thread>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "takeout_timefix/sidecar.hpp"
#include "takeout_timefix/system.hpp"

namespace takeout_timefix {

namespace fs = std::filesystem;

namespace {

bool has_json_extension(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".json";
}

FileResult failed(const fs::path &path, std::string reason) {
  FileResult result;
  result.failure = FailureRecord{path.string(), std::move(reason)};
  return result;
}

} // anonymous namespace

BatchProcessor::BatchProcessor(ProcessRunner &runner, EventSink &log,
                               ExecutorOptions options, int num_streams,
                               Sleeper sleeper)
    : log_(log), resolver_(log),
      executor_(runner, log, std::move(options), std::move(sleeper)) {
  if (num_streams == 1) {
    num_streams_ = 1;
  } else {
    num_streams_ = calculate_parallel_streams(std::max(0, num_streams));
  }
}

// **---- Discovery ----**

std::vector<fs::path> BatchProcessor::collect_sidecars(const fs::path &root) {
  std::vector<fs::path> sidecars;
  std::vector<fs::path> pending{root};

  while (!pending.empty()) {
    fs::path dir = std::move(pending.back());
    pending.pop_back();

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
      /// An unreadable subtree is skipped; its siblings are still walked
      if (dir == root) {
        LOG_ERROR(log_, "Cannot walk {}: {}", root.string(), ec.message());
      } else {
        LOG_WARN(log_, "Skipping {}: {}", dir.string(), ec.message());
      }
      continue;
    }

    for (fs::directory_iterator end; it != end;) {
      std::error_code type_ec;
      const fs::directory_entry &entry = *it;
      if (entry.is_directory(type_ec) && !entry.is_symlink(type_ec)) {
        pending.push_back(entry.path());
      } else if (entry.is_regular_file(type_ec) &&
                 has_json_extension(entry.path())) {
        sidecars.push_back(entry.path());
      }

      it.increment(ec);
      if (ec) {
        LOG_WARN(log_, "Listing of {} cut short: {}", dir.string(),
                 ec.message());
        break;
      }
    }
  }

  std::sort(sidecars.begin(), sidecars.end());
  return sidecars;
}

// **---- Per-Sidecar Pipeline ----**

FileResult BatchProcessor::process_sidecar(const fs::path &sidecar_path) {
  try {
    MatchResult match = matcher_.match(sidecar_path);
    if (!match.ok) {
      LOG_WARN(log_, "No media file for {}: {}", sidecar_path.string(),
               match.reason);
      return failed(sidecar_path, match.reason);
    }
    LOG_DEBUG(log_, "Matched {} -> {}", sidecar_path.filename().string(),
              match.media_path.filename().string());

    SidecarReadResult sidecar = read_sidecar(sidecar_path);
    if (!sidecar.ok) {
      LOG_ERROR(log_, "{}: {}", sidecar_path.string(), sidecar.reason);
      return failed(sidecar_path, sidecar.reason);
    }

    auto timestamp = resolver_.resolve(sidecar.record);
    if (!timestamp) {
      LOG_WARN(log_, "No usable timestamp in {}", sidecar_path.string());
      return failed(match.media_path, "no usable timestamp");
    }

    ExecutionResult exec =
        executor_.run(match.media_path, *timestamp, sidecar.record.geo);
    if (!exec.ok()) {
      return failed(match.media_path,
                    fmt::format("{}: {}", outcome_name(exec.outcome),
                                exec.detail));
    }

    LOG_INFO(log_, "Updated: {}", match.media_path.string());
    FileResult result;
    result.success = true;
    return result;

  } catch (const std::exception &e) {
    LOG_ERROR(log_, "Processing error [{}]: {}", sidecar_path.string(),
              e.what());
    return failed(sidecar_path, fmt::format("processing error: {}", e.what()));
  }
}

void BatchProcessor::record(RunLedger &ledger, size_t index,
                            FileResult result) {
  if (result.success) {
    ledger.record_success();
  } else {
    ledger.record_failure(index, std::move(result.failure));
  }
}

// **---- Batch ----**

RunSummary BatchProcessor::process(const fs::path &root) {
  auto batch_start = std::chrono::steady_clock::now();

  LOG_PHASE(log_, "================== TIMESTAMP REPAIR ==================");
  LOG_INFO(log_, "Directory: {}", root.string());

  std::vector<fs::path> sidecars = collect_sidecars(root);
  const int total = static_cast<int>(sidecars.size());
  int streams = std::max(1, std::min(num_streams_, total));

  LOG_INFO(log_, "Sidecars found: {}", total);
  if (streams > 1) {
    LOG_INFO(log_, "Parallel streams: {}", streams);
  }
  LOG_PHASE(log_, "=======================================================");

  RunLedger ledger;

  if (streams == 1) {
    for (size_t i = 0; i < sidecars.size(); ++i) {
      LOG_DEBUG(log_, "[{}/{}] {}", i + 1, total, sidecars[i].string());
      record(ledger, i, process_sidecar(sidecars[i]));
    }
  } else {
    SidecarQueue queue;
    for (size_t i = 0; i < sidecars.size(); ++i) {
      queue.push({i, sidecars[i]});
    }
    queue.finish();

    std::vector<std::thread> workers;
    for (int s = 0; s < streams; ++s) {
      workers.emplace_back(&BatchProcessor::stream_worker, this, s, &queue,
                           &ledger, total);
    }
    for (auto &w : workers) {
      w.join();
    }
  }

  RunSummary summary;
  summary.sidecars = total;
  summary.succeeded = ledger.succeeded();
  summary.failures = ledger.extract_failures();
  summary.elapsed_sec = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - batch_start)
                            .count();

  print_summary(summary);
  return summary;
}

void BatchProcessor::stream_worker(int stream_id, SidecarQueue *queue,
                                   RunLedger *ledger, int total) {
  SidecarTask task;
  while (queue->pop(task)) {
    LOG_DEBUG(log_, "[Stream {}] [{}/{}] {}", stream_id, task.index + 1, total,
              task.path.string());
    record(*ledger, task.index, process_sidecar(task.path));
  }
  LOG_DEBUG(log_, "[Stream {}] Finished (no more sidecars)", stream_id);
}

void BatchProcessor::print_summary(const RunSummary &summary) {
  int failed_count = static_cast<int>(summary.failures.size());

  LOG_PHASE(log_, "============== TIMESTAMP REPAIR SUMMARY ==============");
  LOG_INFO(log_, "{:<25} {:>25}", "Sidecars:", summary.sidecars);
  LOG_INFO(log_, "{:<25} {:>25}", "Updated:", summary.succeeded);
  LOG_INFO(log_, "{:<25} {:>25}", "Failed:", failed_count);
  LOG_INFO(log_, "{:<25} {:>25}", "Wall-clock time:",
           format_time(summary.elapsed_sec));
  LOG_PHASE(log_, "======================================================");

  if (failed_count > 0) {
    LOG_ERROR(log_, "Failed files:");
    for (const auto &f : summary.failures) {
      LOG_ERROR(log_, "  - {} ({})", f.path, f.reason);
    }
  } else if (summary.sidecars > 0) {
    LOG_SUCCESS(log_, "All files processed successfully");
  }
}

// **---- Failure Report ----**

bool write_failure_report(const std::vector<FailureRecord> &failures,
                          const fs::path &path) {
  nlohmann::json report = nlohmann::json::array();
  for (const auto &f : failures) {
    report.push_back(nlohmann::json::array({f.path, f.reason}));
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    return false;
  /// Paths are not guaranteed to be valid UTF-8
  out << report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
      << "\n";
  return static_cast<bool>(out);
}

} // namespace takeout_timefix
