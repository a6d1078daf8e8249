/**
 * @file fake_runner.cpp
 * @brief Fixture-writing CommandRunner
 */

#include "fixtures/fake_runner.hpp"

#include <filesystem>
#include <fstream>

namespace auto_shorts {
namespace test_support {

namespace fs = std::filesystem;

std::string arg_after(const std::vector<std::string> &argv,
                      const std::string &flag) {
  for (size_t i = 0; i + 1 < argv.size(); ++i) {
    if (argv[i] == flag)
      return argv[i + 1];
  }
  return "";
}

bool has_arg_containing(const std::vector<std::string> &argv,
                        const std::string &needle) {
  for (const auto &a : argv) {
    if (a.find(needle) != std::string::npos)
      return true;
  }
  return false;
}

int FakeRunner::run(const std::vector<std::string> &argv) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(argv);
  }
  if (argv.empty())
    return -1;
  if (fail_when && fail_when(argv) && !write_then_fail)
    return fail_code;

  const std::string &last = argv.back();
  std::string filename = fs::path(last).filename().string();

  if (filename == "composed.mkv") {
    write_media_fixture(last, composed);
  } else if (filename == "encoded.mp4") {
    write_media_fixture(last, encoded);
  } else if (fs::path(last).extension() == ".jpg") {
    std::ofstream out(last, std::ios::binary);
    out << "\xff\xd8\xff\xe0 still \xff\xd9";
  } else {
    std::string templ = arg_after(argv, "-o");
    if (templ.empty())
      return 2;
    fs::path target = fs::path(templ).parent_path() / "video.mp4";
    write_media_fixture(target.string(), downloaded);
  }

  if (write_then_fail && (!fail_when || fail_when(argv)))
    return fail_code;
  return 0;
}

std::vector<std::vector<std::string>> FakeRunner::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_;
}

size_t FakeRunner::call_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_.size();
}

} // namespace test_support
} // namespace auto_shorts
