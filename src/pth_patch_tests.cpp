#include "pth_patch.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <string>
#include <vector>

namespace {

std::vector<std::string> const kRequired{ "python311.zip", ".", "Lib\\site-packages", "import site" };

}  // namespace

TEST_CASE("pth_required_lines uses backslashes for the package dir") {
  rtpack::interpreter_cfg const interp;
  CHECK(rtpack::pth_required_lines(interp, "Lib/site-packages") == kRequired);
}

TEST_CASE("pth_merge of an empty file is exactly the required lines") {
  CHECK(rtpack::pth_merge("", kRequired) == kRequired);
}

TEST_CASE("pth_merge keeps extra entries after the required ones") {
  auto const merged{ rtpack::pth_merge("python311.zip\r\n.\r\n\r\n# Uncomment to run site.main()\r\n"
                                       "#import site\r\nextras\r\n",
                                       kRequired) };

  std::vector<std::string> expected{ kRequired };
  expected.push_back("extras");
  CHECK(merged == expected);
}

TEST_CASE("pth_merge drops a leading byte-order mark") {
  auto const merged{ rtpack::pth_merge("\xEF\xBB\xBFpython311.zip\n.\n", kRequired) };
  CHECK(merged == kRequired);
}

TEST_CASE("pth_serialize writes CRLF lines") {
  CHECK(rtpack::pth_serialize({ "a", "b" }) == "a\r\nb\r\n");
}

TEST_CASE("pth_patch rewrites a BOM-prefixed path file") {
  rtpack::test::temp_dir tmp;
  rtpack::interpreter_cfg const interp;
  auto const file{ tmp / "python311._pth" };
  rtpack::util_write_file(file, "\xEF\xBB\xBFpython311.zip\n.\n#import site\n");
  CHECK(rtpack::pth_starts_with_bom(file));

  auto const patched{ rtpack::pth_patch(tmp.path(), interp, "Lib/site-packages") };

  CHECK(patched == file);
  CHECK_FALSE(rtpack::pth_starts_with_bom(file));
  CHECK(rtpack::test::read_text(file) ==
        "python311.zip\r\n.\r\nLib\\site-packages\r\nimport site\r\n");
}

TEST_CASE("pth_patch creates a missing path file and is stable on rerun") {
  rtpack::test::temp_dir tmp;
  rtpack::interpreter_cfg interp;
  interp.python_version = "312";

  rtpack::pth_patch(tmp.path(), interp, "Lib/site-packages");
  auto const first{ rtpack::test::read_text(tmp / "python312._pth") };
  rtpack::pth_patch(tmp.path(), interp, "Lib/site-packages");

  CHECK(first == "python312.zip\r\n.\r\nLib\\site-packages\r\nimport site\r\n");
  CHECK(rtpack::test::read_text(tmp / "python312._pth") == first);
}
