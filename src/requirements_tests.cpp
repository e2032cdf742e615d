#include "requirements.h"

#include "test_support.h"
#include "util.h"

#include "doctest.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::string> names(std::vector<rtpack::requirement> const &reqs) {
  std::vector<std::string> out;
  for (auto const &r : reqs) { out.push_back(r.name); }
  return out;
}

}  // namespace

TEST_CASE("requirement_normalize_name folds case and separators") {
  CHECK(rtpack::requirement_normalize_name("llama-cpp-python") == "llama-cpp-python");
  CHECK(rtpack::requirement_normalize_name("Llama_Cpp.Python") == "llama-cpp-python");
  CHECK(rtpack::requirement_normalize_name("zope__interface") == "zope-interface");
  CHECK(rtpack::requirement_normalize_name("FastAPI") == "fastapi");
}

TEST_CASE("requirement_parse_line keeps the specifier and drops comments") {
  auto const req{ rtpack::requirement_parse_line("  uvicorn[standard]>=0.29  # server") };
  REQUIRE(req);
  CHECK(req->line == "uvicorn[standard]>=0.29");
  CHECK(req->name == "uvicorn");

  auto const url_fragment{ rtpack::requirement_parse_line("pkg @ https://x.invalid/p.whl#sha=1") };
  REQUIRE(url_fragment);
  CHECK(url_fragment->line == "pkg @ https://x.invalid/p.whl#sha=1");
}

TEST_CASE("requirement_parse_line skips blanks, comments and option lines") {
  CHECK_FALSE(rtpack::requirement_parse_line(""));
  CHECK_FALSE(rtpack::requirement_parse_line("   \r"));
  CHECK_FALSE(rtpack::requirement_parse_line("# pinned for the desktop build"));
  CHECK_FALSE(rtpack::requirement_parse_line("--extra-index-url https://x.invalid"));
  CHECK_FALSE(rtpack::requirement_parse_line("-r other.txt"));
}

TEST_CASE("requirement_parse_line rejects lines without a project name") {
  CHECK_THROWS_AS(rtpack::requirement_parse_line(">=1.0"), std::runtime_error);
}

TEST_CASE("requirements_parse handles CRLF files") {
  auto const reqs{ rtpack::requirements_parse("fastapi==0.110\r\n\r\n# c\r\nuvicorn\r\n") };
  CHECK(names(reqs) == std::vector<std::string>{ "fastapi", "uvicorn" });
  CHECK(reqs[0].line == "fastapi==0.110");
}

TEST_CASE("requirements_partition separates the isolated package") {
  auto const closure{ rtpack::requirements_partition(
      rtpack::requirements_parse("fastapi\nLlama_CPP_Python==0.2.90\nuvicorn\n"),
      "llama-cpp-python") };

  CHECK(names(closure.bulk) == std::vector<std::string>{ "fastapi", "uvicorn" });
  REQUIRE(closure.isolated);
  CHECK(closure.isolated->line == "Llama_CPP_Python==0.2.90");
}

TEST_CASE("requirements_partition tolerates an unlisted isolated package") {
  auto const closure{ rtpack::requirements_partition(rtpack::requirements_parse("fastapi\n"),
                                                     "llama-cpp-python") };
  CHECK(closure.bulk.size() == 1);
  CHECK_FALSE(closure.isolated);
}

TEST_CASE("requirements_partition rejects a duplicated isolated package") {
  CHECK_THROWS_AS(rtpack::requirements_partition(
                      rtpack::requirements_parse("llama-cpp-python\nllama_cpp_python==1\n"),
                      "llama-cpp-python"),
                  std::runtime_error);
}

TEST_CASE("requirements_load strips a byte-order mark") {
  rtpack::test::temp_dir tmp;
  auto const file{ tmp / "requirements.txt" };
  rtpack::util_write_file(file, "\xEF\xBB\xBF" "fastapi\nllama-cpp-python\n");

  auto const closure{ rtpack::requirements_load(file, "llama-cpp-python") };
  CHECK(names(closure.bulk) == std::vector<std::string>{ "fastapi" });
  CHECK(closure.isolated);
}
