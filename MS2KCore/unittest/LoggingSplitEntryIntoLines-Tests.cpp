#include <catch2/catch_all.hpp>

#include "Logging/Logging.h"

#include <sstream>
#include <string>
#include <vector>

namespace MS2K {
namespace logging {

TEST_CASE("split entry into lines", "[Logging]")
{
   SECTION("empty result")
   {
      const char *testStr = GENERATE(
         "", "\r", "\n", "\r\r", "\r\n", "\n\n",
         "\r\r\r", "\r\r\n", "\r\n\r", "\r\n\n");
      CHECK(internal::SplitEntryIntoLines(testStr).empty());
   }

   SECTION("single-line result")
   {
      const char *testStr = GENERATE(
         "X", "X\r", "X\n", "X\r\r", "X\r\n", "X\n\n", "X\r\n\r\n");
      std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 1);
      CHECK(result[0] == "X");
   }

   SECTION("two-line result")
   {
      const char *testStr = GENERATE(
         "X\rY", "X\nY", "X\r\nY", "X\r\nY\r\n");
      std::vector<std::string> result = internal::SplitEntryIntoLines(testStr);
      REQUIRE(result.size() == 2);
      CHECK(result[0] == "X");
      CHECK(result[1] == "Y");
   }

   SECTION("interior blank lines kept")
   {
      std::vector<std::string> result =
         internal::SplitEntryIntoLines("X\n\nY");
      REQUIRE(result.size() == 3);
      CHECK(result[1].empty());
   }

   SECTION("build name reply")
   {
      // BU X answers several CR-separated lines
      std::vector<std::string> result = internal::SplitEntryIntoLines(
            "STD_XY\rMotor Axes: X Y\rAxis Addr: 1 2\r");
      REQUIRE(result.size() == 3);
      CHECK(result[1] == "Motor Axes: X Y");
   }
}


TEST_CASE("metadata formatter prefixes", "[Logging]")
{
   StampData stamp;
   stamp.Stamp();
   Metadata metadata(LoggerData("ASIMS2000"), EntryData(LogLevelWarning), stamp);

   internal::MetadataFormatter formatter;
   std::ostringstream first;
   formatter.FormatLinePrefix(first, metadata);
   const std::string prefix = first.str();
   CHECK(prefix.find("[WRN,ASIMS2000]") != std::string::npos);
   CHECK(prefix.find(" tid") == 26);

   std::ostringstream cont;
   formatter.FormatContinuationPrefix(cont);
   const std::string contPrefix = cont.str();
   REQUIRE(contPrefix.size() == prefix.size());
   CHECK(contPrefix[prefix.find('[')] == '[');
   CHECK(contPrefix[prefix.size() - 1] == ']');
   CHECK(contPrefix.find_first_not_of(" []") == std::string::npos);
}

} // namespace logging
} // namespace MS2K
