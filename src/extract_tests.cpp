#include "extract.h"

#include "test_support.h"

#include "doctest.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::string> collect_files(std::filesystem::path const &root) {
  std::vector<std::string> files;
  for (auto const &entry : std::filesystem::recursive_directory_iterator(root)) {
    if (entry.is_regular_file()) {
      files.push_back(entry.path().lexically_relative(root).generic_string());
    }
  }
  std::ranges::sort(files);
  return files;
}

void make_distribution(std::filesystem::path const &zip) {
  rtpack::test::make_zip(zip,
                         { { "python-3.11.9-embed/python.exe", "MZ" },
                           { "python-3.11.9-embed/python311._pth", "python311.zip\r\n" },
                           { "python-3.11.9-embed/Lib/os.py", "# os" } });
}

}  // namespace

TEST_CASE("extract_entry_name_is_safe") {
  CHECK(rtpack::extract_entry_name_is_safe("runtime/python/python.exe"));
  CHECK(rtpack::extract_entry_name_is_safe("a..b/c"));
  CHECK(rtpack::extract_entry_name_is_safe("./x"));

  CHECK_FALSE(rtpack::extract_entry_name_is_safe(""));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("/etc/passwd"));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("\\windows\\system32"));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("C:/x"));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("c:runtime"));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("../escape"));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("runtime/../../escape"));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("runtime\\..\\escape"));
  CHECK_FALSE(rtpack::extract_entry_name_is_safe("runtime/.."));
}

TEST_CASE("extract_list_entries returns stored names in order") {
  rtpack::test::temp_dir tmp;
  auto const zip{ tmp / "names.zip" };
  rtpack::test::make_zip(zip, { { "b.txt", "b" }, { "/abs.txt", "x" }, { "a/c.txt", "c" } });

  auto const names{ rtpack::extract_list_entries(zip) };
  CHECK(names == std::vector<std::string>{ "b.txt", "/abs.txt", "a/c.txt" });
}

TEST_CASE("extract keeps structure without stripping") {
  rtpack::test::temp_dir tmp;
  auto const zip{ tmp / "dist.zip" };
  make_distribution(zip);

  auto const count{ rtpack::extract(zip, tmp / "out") };

  CHECK(count == 3);
  CHECK(collect_files(tmp / "out") ==
        std::vector<std::string>{ "python-3.11.9-embed/Lib/os.py",
                                  "python-3.11.9-embed/python.exe",
                                  "python-3.11.9-embed/python311._pth" });
  CHECK(rtpack::test::read_text(tmp / "out" / "python-3.11.9-embed" / "python311._pth") ==
        "python311.zip\r\n");
}

TEST_CASE("extract strips leading components") {
  rtpack::test::temp_dir tmp;
  auto const zip{ tmp / "dist.zip" };
  make_distribution(zip);

  rtpack::extract(zip, tmp / "out", rtpack::extract_options{ .strip_components = 1 });

  CHECK(collect_files(tmp / "out") ==
        std::vector<std::string>{ "Lib/os.py", "python.exe", "python311._pth" });
}

TEST_CASE("extract refuses unsafe entries by default") {
  rtpack::test::temp_dir tmp;
  auto const zip{ tmp / "evil.zip" };
  rtpack::test::make_zip(zip, { { "ok.txt", "fine" }, { "../escape.txt", "bad" } });

  CHECK_THROWS_WITH_AS(rtpack::extract(zip, tmp / "out"),
                       doctest::Contains("Unsafe archive entry"),
                       std::runtime_error);
  CHECK_FALSE(std::filesystem::exists(tmp / "escape.txt"));
}

TEST_CASE("extract skips unsafe entries when asked") {
  rtpack::test::temp_dir tmp;
  auto const zip{ tmp / "evil.zip" };
  rtpack::test::make_zip(zip,
                         { { "ok.txt", "fine" },
                           { "../escape.txt", "bad" },
                           { "C:/abs.txt", "bad" } });

  auto const count{ rtpack::extract(zip,
                                    tmp / "out",
                                    rtpack::extract_options{ .strip_components = 0,
                                                             .skip_unsafe = true }) };

  CHECK(count == 1);
  CHECK(collect_files(tmp / "out") == std::vector<std::string>{ "ok.txt" });
  CHECK_FALSE(std::filesystem::exists(tmp / "escape.txt"));
}

TEST_CASE("extract rejects files that are not archives") {
  rtpack::test::temp_dir tmp;
  auto const bogus{ tmp / "page.zip" };
  rtpack::util_write_file(bogus, "<html>404</html>");

  CHECK_THROWS_AS(rtpack::extract(bogus, tmp / "out"), std::runtime_error);
}
