/*
 * test_evidence_store.cpp — Tests for the Evidence Acquisition Store
 */

#include "evidence_store/evidence_store.h"
#include "test_harness.h"

#include <sys/stat.h>

using namespace forensics_lab;

static int tests_passed = 0;
static int tests_failed = 0;

// 2024-03-09 10:15:30 UTC; the prefix is rendered in local time
static time_t fixed_clock() { return 1709979330; }

static time_t ticking_now = 1709979330;
static time_t ticking_clock() { return ticking_now++; }

static void test_stored_name_format() {
  std::string name = EvidenceStore::stored_name(fixed_clock(), "a.txt", 0);
  ASSERT_EQ(name.size(), std::string("YYYYmmdd_HHMMSS_a.txt").size(),
            "Prefix is YYYYmmdd_HHMMSS_");
  ASSERT_EQ(name.substr(8, 1), std::string("_"), "Date/time separator");
  ASSERT_EQ(name.substr(15), std::string("_a.txt"),
            "Original name follows prefix");
  std::string with_counter =
      EvidenceStore::stored_name(fixed_clock(), "a.txt", 2);
  ASSERT_EQ(with_counter.substr(15), std::string("_2_a.txt"),
            "Counter inserted before original name");
}

static void test_acquire_round_trip() {
  std::string dir = test_harness::make_scratch_dir("store");
  std::string src_dir = dir + "/src";
  std::string ev_dir = dir + "/evidence";
  ::mkdir(src_dir.c_str(), 0755);
  ::mkdir(ev_dir.c_str(), 0755);

  std::string payload;
  for (int i = 0; i < 200000; i++)
    payload.push_back(static_cast<char>(i % 251));
  std::string src = src_dir + "/dump.bin";
  test_harness::write_file(src, payload);

  EvidenceStore store(fixed_clock);
  AcquireResult r = store.acquire(src, ev_dir);
  ASSERT_TRUE(r.status == AcquireStatus::OK, "Acquire succeeds");
  ASSERT_EQ(test_harness::read_file(r.stored_path), payload,
            "Stored copy is byte-identical to source");
  ASSERT_EQ(r.stored_path.substr(0, 1), std::string("/"),
            "Stored path is absolute");
  ASSERT_EQ(r.stored_filename,
            EvidenceStore::stored_name(fixed_clock(), "dump.bin", 0),
            "Stored filename is timestamp-prefixed");
  ASSERT_EQ(r.descriptor.filename, std::string("dump.bin"),
            "Descriptor describes the source");
  ASSERT_EQ(r.descriptor.size_bytes, (uint64_t)payload.size(),
            "Descriptor size matches source");

  struct stat s1, s2;
  ::stat(src.c_str(), &s1);
  ::stat(r.stored_path.c_str(), &s2);
  ASSERT_EQ(s1.st_mtime, s2.st_mtime, "Modification time carried over");

  test_harness::remove_tree(dir);
}

static void test_same_second_collision() {
  std::string dir = test_harness::make_scratch_dir("collide");
  std::string ev_dir = dir + "/evidence";
  ::mkdir(ev_dir.c_str(), 0755);
  std::string a_dir = dir + "/a";
  std::string b_dir = dir + "/b";
  ::mkdir(a_dir.c_str(), 0755);
  ::mkdir(b_dir.c_str(), 0755);
  test_harness::write_file(a_dir + "/note.txt", "first");
  test_harness::write_file(b_dir + "/note.txt", "second");

  EvidenceStore store(fixed_clock);
  AcquireResult r1 = store.acquire(a_dir + "/note.txt", ev_dir);
  AcquireResult r2 = store.acquire(b_dir + "/note.txt", ev_dir);
  ASSERT_TRUE(r1.status == AcquireStatus::OK && r2.status == AcquireStatus::OK,
              "Both same-second acquisitions succeed");
  ASSERT_TRUE(r1.stored_filename != r2.stored_filename,
              "Same-second stored names are distinct");
  ASSERT_EQ(test_harness::read_file(r1.stored_path), std::string("first"),
            "First copy not overwritten");
  ASSERT_EQ(test_harness::read_file(r2.stored_path), std::string("second"),
            "Second copy intact");
  ASSERT_EQ(test_harness::count_entries(ev_dir), 2,
            "Two files in evidence directory");

  test_harness::remove_tree(dir);
}

static void test_different_second_names() {
  std::string dir = test_harness::make_scratch_dir("seconds");
  std::string ev_dir = dir + "/evidence";
  ::mkdir(ev_dir.c_str(), 0755);
  std::string src = dir + "/photo.png";
  test_harness::write_file(src, "png bytes");

  EvidenceStore store(ticking_clock);
  AcquireResult r1 = store.acquire(src, ev_dir);
  AcquireResult r2 = store.acquire(src, ev_dir);
  ASSERT_TRUE(r1.stored_filename != r2.stored_filename,
              "Different seconds give different names");
  ASSERT_EQ(r2.stored_filename.find("_1_"), std::string::npos,
            "No counter needed across seconds");

  test_harness::remove_tree(dir);
}

static void test_acquire_failures() {
  std::string dir = test_harness::make_scratch_dir("store_fail");
  std::string ev_dir = dir + "/evidence";
  ::mkdir(ev_dir.c_str(), 0755);

  EvidenceStore store(fixed_clock);
  AcquireResult missing = store.acquire(dir + "/absent.txt", ev_dir);
  ASSERT_TRUE(missing.status == AcquireStatus::SOURCE_NOT_FOUND,
              "Missing source is SOURCE_NOT_FOUND");

  AcquireResult directory = store.acquire(ev_dir, ev_dir);
  ASSERT_TRUE(directory.status == AcquireStatus::CLASSIFICATION_FAILED,
              "Directory source is CLASSIFICATION_FAILED");

  std::string broken = dir + "/evil\nname.txt";
  test_harness::write_file(broken, "data");
  AcquireResult line_break = store.acquire(broken, ev_dir);
  ASSERT_TRUE(line_break.status == AcquireStatus::CLASSIFICATION_FAILED,
              "Filename with a line break is CLASSIFICATION_FAILED");

  std::string src = dir + "/ok.txt";
  test_harness::write_file(src, "data");
  AcquireResult no_dir = store.acquire(src, dir + "/no_such_dir");
  ASSERT_TRUE(no_dir.status == AcquireStatus::COPY_FAILED,
              "Missing evidence directory is COPY_FAILED");
  ASSERT_FALSE(no_dir.error_message.empty(), "COPY_FAILED carries OS error");
  ASSERT_EQ(test_harness::count_entries(ev_dir), 0,
            "Failed acquisitions leave evidence directory empty");

  ASSERT_FALSE(EvidenceStore::can_overwrite_stored_file(),
               "Overwrite guard is off");

  test_harness::remove_tree(dir);
}

extern "C" bool test_evidence_store() {
  tests_passed = 0;
  tests_failed = 0;

  test_stored_name_format();
  test_acquire_round_trip();
  test_same_second_collision();
  test_different_second_names();
  test_acquire_failures();

  std::printf("  evidence_store: %d passed, %d failed\n", tests_passed,
              tests_failed);
  return tests_failed == 0;
}
