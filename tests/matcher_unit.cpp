// Unit coverage for sidecar name parsing and the three matching strategies.
#include <iostream>
#include <string>

#include "takeout_timefix/matcher.hpp"
#include "test_utils.hpp"

using namespace takeout_timefix;
using test_utils::check;
using test_utils::TempDir;
using test_utils::touch;

namespace {

bool test_parse_plain_and_supplemental() {
  bool ok = true;

  auto plain = parse_sidecar_name("IMG_0001.jpg.json");
  ok &= check(plain.has_value(), "plain sidecar parses");
  if (plain) {
    ok &= check(plain->base == "IMG_0001", "plain base");
    ok &= check(plain->extension == ".jpg", "plain extension");
    ok &= check(plain->supplement.empty(), "plain has no supplement");
    ok &= check(plain->media_name() == "IMG_0001.jpg", "plain media name");
  }

  auto full = parse_sidecar_name("IMG_0002.jpg.supplemental-metadata.json");
  ok &= check(full.has_value(), "supplemental sidecar parses");
  if (full) {
    ok &= check(full->media_name() == "IMG_0002.jpg",
                "supplemental marker is dropped from media name");
    ok &= check(full->supplement == ".supplemental-metadata",
                "supplement recorded");
  }

  // Exporter truncates long names inside the marker.
  auto trunc = parse_sidecar_name("memory.mp4.su.json");
  ok &= check(trunc && trunc->media_name() == "memory.mp4",
              "truncated marker .su is dropped");
  auto suppl = parse_sidecar_name("clip.MOV.suppl.json");
  ok &= check(suppl && suppl->media_name() == "clip.MOV",
              "truncated marker .suppl is dropped");
  auto counted =
      parse_sidecar_name("IMG_0003.HEIC.supplemental-metadata(1).json");
  ok &= check(counted && counted->media_name() == "IMG_0003.HEIC",
              "marker with duplicate counter is dropped");
  return ok;
}

bool test_parse_preserves_case() {
  bool ok = true;
  auto p = parse_sidecar_name("Vacation.Day1.JPG.JSON");
  ok &= check(p.has_value(), "upper-case .JSON accepted");
  if (p) {
    ok &= check(p->base == "Vacation.Day1", "base keeps inner dots");
    ok &= check(p->extension == ".JPG", "extension case preserved");
    ok &= check(p->media_name() == "Vacation.Day1.JPG",
                "reconstructed name is original minus .JSON");
  }
  return ok;
}

bool test_parse_rejects_bad_shapes() {
  bool ok = true;
  ok &= check(!parse_sidecar_name("metadata.json"), "no media extension");
  ok &= check(!parse_sidecar_name("notes.suppl.json"),
              "only a marker, no media extension");
  ok &= check(!parse_sidecar_name("IMG_0001.jpg"), "not a json file");
  ok &= check(!parse_sidecar_name(".json"), "bare .json");
  ok &= check(!parse_sidecar_name(".jpg.json"), "empty base");
  ok &= check(!parse_sidecar_name("IMG..json"), "empty extension");
  return ok;
}

bool test_marker_detection() {
  bool ok = true;
  ok &= check(is_supplemental_marker("supplemental-metadata"), "full marker");
  ok &= check(is_supplemental_marker("SUPPLEMENTAL-META"), "any case");
  ok &= check(is_supplemental_marker("supp(2)"), "marker with counter");
  ok &= check(!is_supplemental_marker("jpg"), "media extension");
  ok &= check(!is_supplemental_marker("(1)"), "counter alone");
  ok &= check(!is_supplemental_marker(""), "empty");
  return ok;
}

bool test_exact_match() {
  TempDir dir;
  touch(dir.path() / "IMG_0001.jpg");
  touch(dir.path() / "IMG_0001.jpg.json");
  touch(dir.path() / "IMG_0001(1).jpg");

  Matcher matcher;
  MatchResult r = matcher.match(dir.path() / "IMG_0001.jpg.json");
  bool ok = check(r.ok, "exact match found");
  ok &= check(r.media_path == dir.path() / "IMG_0001.jpg",
              "exact name wins over looser candidates");
  return ok;
}

bool test_trailing_match_after_marker() {
  TempDir dir;
  touch(dir.path() / "IMG_0002.jpg(1).jpg");
  touch(dir.path() / "IMG_0002.jpg.supplemental-metadata.json");

  Matcher matcher;
  MatchResult r =
      matcher.match(dir.path() / "IMG_0002.jpg.supplemental-metadata.json");
  bool ok = check(r.ok, "trailing-characters match found");
  ok &= check(r.media_path == dir.path() / "IMG_0002.jpg(1).jpg",
              "duplicate-suffixed media file selected");
  return ok;
}

bool test_loose_prefix_match() {
  TempDir dir;
  // Exporter truncated the media name; only the stem survives.
  touch(dir.path() / "PXL_20210101_1200.mp4");
  touch(dir.path() / "PXL_20210101_120000123.mp4.json");

  Matcher matcher;
  MatchResult r = matcher.match(dir.path() / "PXL_20210101_120000123.mp4.json");
  bool ok = check(!r.ok, "no match when the stem itself differs");

  TempDir dir2;
  touch(dir2.path() / "holiday.mov");
  touch(dir2.path() / "holiday.edited.mp4.json");
  r = matcher.match(dir2.path() / "holiday.edited.mp4.json");
  ok &= check(r.ok, "loose prefix match found");
  ok &= check(r.media_path == dir2.path() / "holiday.mov",
              "prefix before first dot used as last resort");
  return ok;
}

bool test_allow_list_and_tie_break() {
  TempDir dir;
  touch(dir.path() / "IMG_0005.jpg.txt");
  touch(dir.path() / "IMG_0005.jpg.json");
  touch(dir.path() / "IMG_0005.jpg(2).jpg");
  touch(dir.path() / "IMG_0005.jpg(1).jpg");

  Matcher matcher;
  MatchResult r = matcher.match(dir.path() / "IMG_0005.jpg.json");
  bool ok = check(r.ok, "match found past rejected candidates");
  ok &= check(r.media_path == dir.path() / "IMG_0005.jpg(1).jpg",
              "lexicographically first accepted candidate wins");

  ok &= check(is_media_file("a.WEBP"), "allow-list is case-insensitive");
  ok &= check(!is_media_file("a.json"), "json never a media file");
  ok &= check(!is_media_file("a.avi"), "avi not in the allow-list");
  return ok;
}

bool test_failures() {
  TempDir dir;
  touch(dir.path() / "metadata.json");
  touch(dir.path() / "IMG_0009.jpg.json");
  touch(dir.path() / "IMG_0009.txt");

  Matcher matcher;
  MatchResult bad = matcher.match(dir.path() / "metadata.json");
  bool ok = check(!bad.ok, "unrecognized sidecar name fails");
  ok &= check(bad.reason == "filename format not recognized",
              "reason for unrecognized name");

  MatchResult none = matcher.match(dir.path() / "IMG_0009.jpg.json");
  ok &= check(!none.ok, "no media file fails");
  ok &= check(none.reason == "no media file found", "reason for no media");
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok &= test_parse_plain_and_supplemental();
  ok &= test_parse_preserves_case();
  ok &= test_parse_rejects_bad_shapes();
  ok &= test_marker_detection();
  ok &= test_exact_match();
  ok &= test_trailing_match_after_marker();
  ok &= test_loose_prefix_match();
  ok &= test_allow_list_and_tie_break();
  ok &= test_failures();
  if (ok) {
    std::cout << "[matcher_unit] all checks passed\n";
  }
  return ok ? 0 : 1;
}
