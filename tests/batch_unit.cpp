// End-to-end coverage of the batch driver over a temporary export tree with a
// scripted metadata writer: failure taxonomy, report format, idempotence and
// parallel streams.
#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "takeout_timefix/batch_processor.hpp"
#include "test_utils.hpp"

using namespace takeout_timefix;
using namespace std::chrono_literals;
using test_utils::CaptureSink;
using test_utils::check;
using test_utils::RecordingSleeper;
using test_utils::ScriptedRunner;
using test_utils::Step;
using test_utils::TempDir;
using test_utils::touch;
using test_utils::write_file;

namespace {

const std::string kGoodSidecar =
    R"({"title":"x","photoTakenTime":{"timestamp":"1609459200"}})";

ExecutorOptions test_options() {
  ExecutorOptions options;
  options.retry_base = 1ms;
  return options;
}

/// Export tree with one sidecar per failure kind plus two good pairs
void build_tree(const std::filesystem::path &root) {
  // good, top level
  touch(root / "IMG_0001.jpg");
  write_file(root / "IMG_0001.jpg.json", kGoodSidecar);
  // good, nested, supplemental marker + duplicate-suffixed media
  touch(root / "2021" / "IMG_0002.jpg(1).jpg");
  write_file(root / "2021" / "IMG_0002.jpg.supplemental-metadata.json",
             kGoodSidecar);
  // unrecognized sidecar name (album metadata)
  write_file(root / "2021" / "metadata.json", R"({"title":"Album"})");
  // no media file
  write_file(root / "orphan.mp4.json", kGoodSidecar);
  // malformed json
  touch(root / "broken.png");
  write_file(root / "broken.png.json", "{not json");
  // no usable timestamp
  touch(root / "notime.gif");
  write_file(root / "notime.gif.JSON", R"({"title":"notime.gif"})");
}

bool test_collect_sidecars() {
  TempDir dir;
  build_tree(dir.path());
  touch(dir.path() / "readme.txt");

  CaptureSink sink;
  ScriptedRunner runner;
  BatchProcessor batch(runner, sink, test_options());
  auto sidecars = batch.collect_sidecars(dir.path());
  bool ok = check(sidecars.size() == 6, "all json files found, any case");
  ok &= check(std::is_sorted(sidecars.begin(), sidecars.end()),
              "sidecars in sorted walk order");
  return ok;
}

bool test_unreadable_subtree_skipped() {
  TempDir dir;
  const auto &root = dir.path();
  write_file(root / "a_locked" / "x.jpg.json", kGoodSidecar);
  write_file(root / "b" / "y.jpg.json", kGoodSidecar);
  write_file(root / "z.jpg.json", kGoodSidecar);
  std::filesystem::permissions(root / "a_locked",
                               std::filesystem::perms::none);

  CaptureSink sink;
  ScriptedRunner runner;
  BatchProcessor batch(runner, sink, test_options());
  auto sidecars = batch.collect_sidecars(root);

  std::filesystem::permissions(root / "a_locked",
                               std::filesystem::perms::owner_all);

  auto found = [&](const std::filesystem::path &p) {
    return std::find(sidecars.begin(), sidecars.end(), p) != sidecars.end();
  };
  bool ok = check(found(root / "b" / "y.jpg.json"),
                  "sibling subtree after the unreadable one still walked");
  ok &= check(found(root / "z.jpg.json"), "top-level sidecar still walked");
  // root ignores directory permissions, so the locked subtree stays readable
  if (::geteuid() != 0) {
    ok &= check(sidecars.size() == 2, "unreadable subtree contributes nothing");
    ok &= check(sink.count(LogLevel::Warn) == 1, "skipped subtree logged");
  }
  return ok;
}

bool test_failure_taxonomy() {
  TempDir dir;
  build_tree(dir.path());
  const auto &root = dir.path();

  CaptureSink sink;
  ScriptedRunner runner;
  BatchProcessor batch(runner, sink, test_options());
  RunSummary s = batch.process(root);

  bool ok = check(s.sidecars == 6, "six sidecars walked");
  ok &= check(s.succeeded == 2, "two media files updated");
  ok &= check(s.failures.size() == 4, "four failures recorded");
  ok &= check(runner.calls.size() == 2, "writer invoked only for good pairs");

  auto find = [&](const std::filesystem::path &p) -> const FailureRecord * {
    for (const auto &f : s.failures) {
      if (f.path == p.string())
        return &f;
    }
    return nullptr;
  };

  auto *album = find(root / "2021" / "metadata.json");
  ok &= check(album && album->reason == "filename format not recognized",
              "unrecognized name recorded against the sidecar");
  auto *orphan = find(root / "orphan.mp4.json");
  ok &= check(orphan && orphan->reason == "no media file found",
              "missing media recorded against the sidecar");
  auto *broken = find(root / "broken.png.json");
  ok &= check(broken && broken->reason.rfind("sidecar parse error", 0) == 0,
              "malformed json recorded against the sidecar");
  auto *notime = find(root / "notime.gif");
  ok &= check(notime && notime->reason == "no usable timestamp",
              "missing timestamp recorded against the media file");

  bool metadata_targeted = false;
  for (const auto &call : runner.calls) {
    metadata_targeted |= call.back().find("metadata") != std::string::npos;
  }
  ok &= check(!metadata_targeted,
              "unrecognized sidecar never becomes a media candidate");
  return ok;
}

bool test_execution_failures_recorded() {
  TempDir dir;
  touch(dir.path() / "a.jpg");
  write_file(dir.path() / "a.jpg.json", kGoodSidecar);
  touch(dir.path() / "b.mov");
  write_file(dir.path() / "b.mov.json", kGoodSidecar);

  CaptureSink sink;
  // a.jpg: locked through every retry; b.mov: hangs
  ScriptedRunner runner({Step::locked(), Step::locked(), Step::locked(),
                         Step::locked(), Step::timeout()});
  std::vector<std::chrono::milliseconds> delays;
  BatchProcessor batch(runner, sink, test_options(), 1,
                       RecordingSleeper{&delays});
  RunSummary s = batch.process(dir.path());

  bool ok = check(s.succeeded == 0, "nothing updated");
  ok &= check(s.failures.size() == 2, "both failures recorded");
  if (s.failures.size() == 2) {
    ok &= check(s.failures[0].path == (dir.path() / "a.jpg").string() &&
                    s.failures[0].reason.rfind("TransientFailure", 0) == 0,
                "exhausted retries recorded against the media file");
    ok &= check(s.failures[1].path == (dir.path() / "b.mov").string() &&
                    s.failures[1].reason.rfind("Timeout", 0) == 0,
                "timeout recorded against the media file");
  }
  ok &= check(delays.size() == 3, "backoff only for the locked file");
  ok &= check(runner.calls.size() == 5, "four attempts plus one timeout");
  return ok;
}

bool test_idempotent_counts() {
  TempDir dir;
  build_tree(dir.path());

  CaptureSink sink;
  ScriptedRunner runner;
  BatchProcessor batch(runner, sink, test_options());
  RunSummary first = batch.process(dir.path());
  RunSummary second = batch.process(dir.path());

  bool ok = check(first.succeeded == second.succeeded,
                  "same success count on rerun");
  ok &= check(first.failures.size() == second.failures.size(),
              "same failure count on rerun");
  bool same_order = first.failures.size() == second.failures.size();
  for (size_t i = 0; same_order && i < first.failures.size(); ++i) {
    same_order = first.failures[i].path == second.failures[i].path &&
                 first.failures[i].reason == second.failures[i].reason;
  }
  ok &= check(same_order, "same failures in the same order");
  return ok;
}

bool test_parallel_streams_match_sequential() {
  TempDir dir;
  build_tree(dir.path());
  for (int i = 0; i < 12; ++i) {
    std::string name = "P" + std::to_string(100 + i) + ".mp4";
    touch(dir.path() / "bulk" / name);
    write_file(dir.path() / "bulk" / (name + ".json"), kGoodSidecar);
  }

  CaptureSink sink;
  ScriptedRunner seq_runner;
  BatchProcessor sequential(seq_runner, sink, test_options(), 1);
  RunSummary a = sequential.process(dir.path());

  ScriptedRunner par_runner;
  BatchProcessor parallel(par_runner, sink, test_options(), 4);
  RunSummary b = parallel.process(dir.path());

  bool ok = check(a.succeeded == 14 && b.succeeded == 14,
                  "all good pairs updated in both modes");
  bool same = a.failures.size() == b.failures.size();
  for (size_t i = 0; same && i < a.failures.size(); ++i) {
    same = a.failures[i].path == b.failures[i].path;
  }
  ok &= check(same, "parallel failures reported in walk order");
  ok &= check(par_runner.calls.size() == 14, "each media file written once");
  return ok;
}

bool test_failure_report() {
  TempDir dir;
  std::vector<FailureRecord> failures = {
      {"/x/metadata.json", "filename format not recognized"},
      {"/x/IMG.jpg", "no usable timestamp"},
  };
  auto report = dir.path() / "FAILURES_timefix_test.json";
  bool ok = check(write_failure_report(failures, report), "report written");

  auto doc = nlohmann::json::parse(test_utils::read_text(report));
  ok &= check(doc.is_array() && doc.size() == 2, "report is a 2-entry array");
  ok &= check(doc[0].is_array() && doc[0].size() == 2 &&
                  doc[0][0] == "/x/metadata.json" &&
                  doc[0][1] == "filename format not recognized",
              "entries are [path, reason] pairs in order");
  ok &= check(doc[1][0] == "/x/IMG.jpg", "second entry kept in order");

  ok &= check(!write_failure_report(failures, dir.path() / "no" / "such.json"),
              "unwritable report path reported");
  return ok;
}

bool test_empty_tree() {
  TempDir dir;
  CaptureSink sink;
  ScriptedRunner runner;
  BatchProcessor batch(runner, sink, test_options());
  RunSummary s = batch.process(dir.path());
  return check(s.sidecars == 0 && s.succeeded == 0 && s.failures.empty(),
               "empty directory is a clean run");
}

} // namespace

int main() {
  bool ok = true;
  ok &= test_collect_sidecars();
  ok &= test_unreadable_subtree_skipped();
  ok &= test_failure_taxonomy();
  ok &= test_execution_failures_recorded();
  ok &= test_idempotent_counts();
  ok &= test_parallel_streams_match_sequential();
  ok &= test_failure_report();
  ok &= test_empty_tree();
  if (ok) {
    std::cout << "[batch_unit] all checks passed\n";
  }
  return ok ? 0 : 1;
}
