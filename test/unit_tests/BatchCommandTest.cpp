#include <cmath>
#include <limits>

#include "BatchCommand.hpp"
#include "TestHeaders.hpp"

using namespace igv;

TEST_CASE("encodeCommand joins present arguments in order", "[BatchCommand]") {
  REQUIRE(encodeCommand("goto", {"chr1:100-200"}) == "goto chr1:100-200");
  REQUIRE(encodeCommand("region", {"chr1", 100, 200}) == "region chr1 100 200");
  REQUIRE(encodeCommand("clear", {}) == "clear");
}

TEST_CASE("encodeCommand drops absent arguments", "[BatchCommand]") {
  optional<string> noTrack;
  REQUIRE(encodeCommand("expand", {noTrack}) == "expand");
  REQUIRE(encodeCommand("colorBy", {"TAG", nullopt}) == "colorBy TAG");
  REQUIRE(encodeCommand("group", {nullopt, "HP"}) == "group HP");
  const char* missing = NULL;
  REQUIRE(encodeCommand("squish", {missing}) == "squish");
  REQUIRE(encodeCommand("load", {"a.bam", nullopt, "b.bam"}) ==
          encodeCommand("load", {"a.bam", "b.bam"}));
}

TEST_CASE("encodeCommand keeps empty strings but trims the line",
          "[BatchCommand]") {
  // An empty token still adds a separator, which trimming removes at the end
  REQUIRE(encodeCommand("echo", {""}) == "echo");
  REQUIRE(encodeCommand("  echo", {"hi  "}) == "echo hi");
}

TEST_CASE("encodeCommand renders booleans and numbers", "[BatchCommand]") {
  REQUIRE(encodeCommand("setLogScale", {true}) == "setLogScale true");
  REQUIRE(encodeCommand("setLogScale", {false, "track"}) ==
          "setLogScale false track");
  REQUIRE(encodeCommand("setSleepInterval", {200}) == "setSleepInterval 200");
  REQUIRE(encodeCommand("region", {"chr2", int64_t(3000000000LL), 5}) ==
          "region chr2 3000000000 5");
  REQUIRE(encodeCommand("setDataRange", {0.5}) == "setDataRange 0.5");
}

TEST_CASE("CommandArg keeps every digit of a double", "[BatchCommand]") {
  REQUIRE(CommandArg(1234567.5).value() == "1234567.5");
  REQUIRE(CommandArg(12345678.0).value() == "12345678");
  REQUIRE(CommandArg(0.1234567891).value() == "0.1234567891");
  REQUIRE(CommandArg(0.1).value() == "0.1");
  REQUIRE(CommandArg(-2.25).value() == "-2.25");
  REQUIRE(encodeCommand("setDataRange", {0.0, 1234567.5}) ==
          "setDataRange 0 1234567.5");
}

TEST_CASE("CommandArg sends a char as text", "[BatchCommand]") {
  REQUIRE(CommandArg('x').value() == "x");
  REQUIRE(CommandArg('+').value() == "+");
  REQUIRE(encodeCommand("sort", {"base", 'A'}) == "sort base A");
  // Byte-sized integers are numbers, not characters
  REQUIRE(CommandArg(uint8_t(7)).value() == "7");
  REQUIRE(CommandArg(int8_t(-3)).value() == "-3");
}

TEST_CASE("encodeCommand rejects bad input", "[BatchCommand]") {
  REQUIRE_THROWS_AS(encodeCommand("", {}), InvalidArgument);
  REQUIRE_THROWS_AS(encodeCommand("   ", {}), InvalidArgument);
  REQUIRE_THROWS_AS(encodeCommand("echo", {"a\nb"}), InvalidArgument);
  REQUIRE_THROWS_AS(encodeCommand("echo", {"a\rb", "c"}), InvalidArgument);
  REQUIRE_THROWS_AS(CommandArg(std::nan("")), InvalidArgument);
  REQUIRE_THROWS_AS(CommandArg(std::numeric_limits<double>::infinity()), InvalidArgument);
}

TEST_CASE("expandPath makes paths absolute", "[BatchCommand]") {
  string cwd = fs::current_path().string();
  REQUIRE(expandPath("data/file.bam") == cwd + "/data/file.bam");
  REQUIRE(expandPath("/tmp/a/../b/") == "/tmp/b");
  REQUIRE(expandPath("/") == "/");

  const char* home = ::getenv("HOME");
  if (home != NULL && string(home).size() > 1) {
    string expectedHome = fs::path(home).lexically_normal().string();
    while (expectedHome.size() > 1 && expectedHome.back() == '/') {
      expectedHome.pop_back();
    }
    REQUIRE(expandPath("~") == expectedHome);
    REQUIRE(expandPath("~/reads.bam") == expectedHome + "/reads.bam");
  }
  // Only a leading "~/" is a home reference
  REQUIRE(expandPath("/data/~x") == "/data/~x");
}

TEST_CASE("hasUriScheme recognizes URLs", "[BatchCommand]") {
  REQUIRE(hasUriScheme("http://example.org/a.bam"));
  REQUIRE(hasUriScheme("https://example.org/a.bam?x=1"));
  REQUIRE(hasUriScheme("s3://bucket/key.bam"));
  REQUIRE(hasUriScheme("gs://bucket/key.cram"));
  REQUIRE(hasUriScheme("ftp+x.y-z://host/file"));

  REQUIRE_FALSE(hasUriScheme("/data/a.bam"));
  REQUIRE_FALSE(hasUriScheme("relative/a.bam"));
  REQUIRE_FALSE(hasUriScheme(":nothing"));
  REQUIRE_FALSE(hasUriScheme("1http://example.org"));
  REQUIRE_FALSE(hasUriScheme("http://exa mple.org/a.bam"));
  REQUIRE_FALSE(hasUriScheme("http://example.org/{a}.bam"));
}

TEST_CASE("pathOrUrl passes URLs through and expands paths",
          "[BatchCommand]") {
  REQUIRE(pathOrUrl("https://example.org/a.bam") ==
          "https://example.org/a.bam");
  REQUIRE(pathOrUrl("/data/./a.bam") == "/data/a.bam");
  REQUIRE(pathOrUrl("a.bam") == fs::current_path().string() + "/a.bam");
}

TEST_CASE("genomeArgument prefers existing files", "[BatchCommand]") {
  REQUIRE(genomeArgument("hg19") == "hg19");

  string dir = makeTempDirectory("igvclient_genome");
  string fasta = dir + "/ref.fa";
  {
    ofstream out(fasta);
    out << ">chr1\nACGT\n";
  }
  REQUIRE(genomeArgument(dir + "/./ref.fa") == fasta);
  fs::remove_all(dir);
}

TEST_CASE("validateSortOption accepts exactly the protocol names",
          "[BatchCommand]") {
  for (const auto& option : sortOptions()) {
    REQUIRE_NOTHROW(validateSortOption(option));
  }
  REQUIRE(sortOptions().size() == 6);

  for (const string& bad : {"", "Base", "readgroup", "foo", "position "}) {
    REQUIRE_THROWS_AS(validateSortOption(bad), InvalidOption);
  }
  try {
    validateSortOption("foo");
    FAIL("Expected InvalidOption");
  } catch (const InvalidOption& err) {
    REQUIRE_THAT(string(err.what()), Catch::Matchers::ContainsSubstring("foo"));
    REQUIRE_THAT(string(err.what()), Catch::Matchers::ContainsSubstring("readGroup"));
  }
}

TEST_CASE("validateStrand accepts plus or minus", "[BatchCommand]") {
  REQUIRE_NOTHROW(validateStrand("+"));
  REQUIRE_NOTHROW(validateStrand("-"));
  REQUIRE_THROWS_AS(validateStrand("forward"), InvalidOption);
  // InvalidOption is also an InvalidArgument
  REQUIRE_THROWS_AS(validateStrand(""), InvalidArgument);
}
