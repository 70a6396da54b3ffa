/**
 * @file batch_processor.hpp
 * @brief Directory walk and per-sidecar pipeline
 *
 * @details The BatchProcessor class drives one run:
 *
 *          - Recursively collects every *.json (any case) under the root,
 *            sorted so repeated runs visit files in the same order
 *
 *          - For each sidecar: match -> read -> resolve -> execute
 *
 *          - Folds every per-file outcome into the RunLedger; nothing a
 *            single file does can stop the walk
 *
 *          - Prints a summary and returns it to the caller
 *
 * @note With num_streams > 1 sidecars are spread over worker threads pulling
 *       from a SidecarQueue. Each file still gets the full retry/backoff
 *       treatment on its own stream.
 */

#ifndef TAKEOUT_TIMEFIX_BATCH_PROCESSOR_HPP
#define TAKEOUT_TIMEFIX_BATCH_PROCESSOR_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "exiftool_executor.hpp"
#include "logging.hpp"
#include "matcher.hpp"
#include "process_runner.hpp"
#include "timestamp_resolver.hpp"
#include "types.hpp"
#include "work_queue.hpp"

namespace takeout_timefix {

/**
 * @struct FileResult
 * @brief Result from processing a single sidecar.
 */
struct FileResult {
  bool success = false;  //< Media file updated
  FailureRecord failure; //< Valid when !success
};

/**
 * @struct RunSummary
 * @brief Totals for one run.
 */
struct RunSummary {
  int sidecars = 0;                   //< Sidecars found by the walk
  int succeeded = 0;                  //< Media files updated
  std::vector<FailureRecord> failures; //< In walk order
  double elapsed_sec = 0.0;           //< Wall-clock time
};

/**
 * @class BatchProcessor
 * @brief Runs the sidecar pipeline over a directory tree.
 */
class BatchProcessor {
public:
  /**
   * @brief Construct a batch processor.
   * @param runner Process runner used for the metadata writer
   * @param log Sink for all events of the run
   * @param options Executor settings
   * @param num_streams Concurrent sidecars (1 = sequential, 0 = auto-detect)
   * @param sleeper Backoff sleeper handed to the executor
   */
  BatchProcessor(ProcessRunner &runner, EventSink &log, ExecutorOptions options,
                 int num_streams = 1, Sleeper sleeper = real_sleep);

  /**
   * @brief Process every sidecar under root.
   * @param root Directory to walk recursively
   * @return Summary with success count and ordered failures
   */
  RunSummary process(const std::filesystem::path &root);

  /**
   * @brief Run the pipeline for one sidecar.
   * @note Never throws for per-file problems; they come back as a failure.
   */
  FileResult process_sidecar(const std::filesystem::path &sidecar_path);

  /// Sorted list of sidecar paths under root (case-insensitive ".json").
  /// Directories that cannot be listed are logged and skipped.
  std::vector<std::filesystem::path>
  collect_sidecars(const std::filesystem::path &root);

  int num_streams() const { return num_streams_; }

private:
  EventSink &log_;
  Matcher matcher_;
  TimestampResolver resolver_;
  ExifToolExecutor executor_;
  int num_streams_;

  /// Worker function for each stream thread
  void stream_worker(int stream_id, SidecarQueue *queue, RunLedger *ledger,
                     int total);

  /// Fold one result into the ledger
  void record(RunLedger &ledger, size_t index, FileResult result);

  /// Print final batch summary
  void print_summary(const RunSummary &summary);
};

/**
 * @brief Write failures as a JSON array of [path, reason] pairs.
 * @param failures Ordered failure list
 * @param path Report file to create
 * @return true if the report was written
 */
bool write_failure_report(const std::vector<FailureRecord> &failures,
                          const std::filesystem::path &path);

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_BATCH_PROCESSOR_HPP
