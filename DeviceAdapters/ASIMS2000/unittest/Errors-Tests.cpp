#include <catch2/catch_all.hpp>

#include "ASIMS2000.h"
#include "LeadScrew.h"

#include <string>
#include <vector>

TEST_CASE("Status codes fall into categories", "[Errors]")
{
   CHECK(MS2000ErrorCategory(MS2K_OK) == CategoryNone);
   CHECK(MS2000ErrorCategory(MS2K_NOT_CONNECTED) == ConnectionError);
   CHECK(MS2000ErrorCategory(ERR_NO_IDENTIFICATION) == ConnectionError);
   CHECK(MS2000ErrorCategory(MS2K_NOT_INITIALIZED) == ConnectionError);
   CHECK(MS2000ErrorCategory(MS2K_SERIAL_TIMEOUT) == TimeoutError);
   CHECK(MS2000ErrorCategory(ERR_UNRECOGNIZED_ANSWER) == ProtocolError);
   CHECK(MS2000ErrorCategory(ERR_COMMAND_PENDING) == ProtocolError);
   CHECK(MS2000ErrorCategory(MS2K_UNSUPPORTED_COMMAND) == ProtocolError);
   CHECK(MS2000ErrorCategory(ERR_OFFSET + 1) == ProtocolError);
   CHECK(MS2000ErrorCategory(ERR_OFFSET_END) == ConfigurationError);
   CHECK(MS2000ErrorCategory(ERR_OUT_OF_RANGE) == OutOfRangeError);
   CHECK(MS2000ErrorCategory(MS2K_INVALID_PROPERTY) == ConfigurationError);

   CHECK(std::string(ErrorCategoryName(TimeoutError)) == "TimeoutError");
   CHECK(std::string(ErrorCategoryName(CategoryNone)) == "None");
}

TEST_CASE("Controller error texts", "[Errors]")
{
   CHECK(MS2000ControllerErrorText(CONTROLLER_ERR_UNKNOWN_COMMAND) == "Unknown Command");
   CHECK(MS2000ControllerErrorText(CONTROLLER_ERR_UNRECOGNIZED_AXIS) == "Unrecognized Axis Parameter");
   CHECK(MS2000ControllerErrorText(99) == "Controller error 99");
}

TEST_CASE("Lead screw table", "[LeadScrew]")
{
   LeadScrew screw;
   REQUIRE(FindLeadScrew("S", screw));
   CHECK(screw.pitchMm == 6.35);
   CHECK(screw.maxVelocityMmps == 7.0);
   REQUIRE(FindLeadScrew("UC", screw));
   CHECK(screw.maxVelocityMmps == 28.0);
   CHECK_FALSE(FindLeadScrew("s", screw));
   CHECK_FALSE(FindLeadScrew("", screw));

   const std::vector<std::string> names = GetLeadScrewNames();
   REQUIRE(names.size() == 5);
   CHECK(names.front() == "UC");
   CHECK(names.back() == "XF");
   CHECK(std::string(g_DefaultLeadScrew) == "S");
}
