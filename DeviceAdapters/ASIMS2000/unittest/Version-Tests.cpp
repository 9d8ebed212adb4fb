#include <catch2/catch_all.hpp>

#include "MS2000Version.h"

TEST_CASE("Old style version", "[Version]")
{
   const Version v = Version::ParseString("USB-9.2k");
   CHECK(v.IsKnown());
   CHECK(v.GetMajor() == 9);
   CHECK(v.GetMinor() == 2);
   CHECK(v.GetRevision() == 'k');
   CHECK(v.ToString() == "9.2k");
}

TEST_CASE("New style version", "[Version]")
{
   const Version v = Version::ParseString("USB-9.50");
   CHECK(v.GetMinor() == 5);
   CHECK(v.GetRevision() == '0');
   CHECK(v.ToString() == "9.50");
}

TEST_CASE("Version comparison", "[Version]")
{
   const Version v(9, 2, 'k');
   CHECK(v.IsVersionAtLeast(9, 2, 'k'));
   CHECK(v.IsVersionAtLeast(9, 2, 'a'));
   CHECK(v.IsVersionAtLeast(8, 9, 'z'));
   CHECK_FALSE(v.IsVersionAtLeast(9, 2, 'p'));
   CHECK_FALSE(v.IsVersionAtLeast(9, 3, 'a'));
   CHECK(v >= Version(9, 1, 'z'));
   CHECK(v == Version(9, 2, 'k'));
}

TEST_CASE("Unparsable versions", "[Version]")
{
   CHECK_FALSE(Version::ParseString("").IsKnown());
   CHECK_FALSE(Version::ParseString("USB").IsKnown());
   CHECK_FALSE(Version::ParseString("USB-").IsKnown());
   CHECK_FALSE(Version::ParseString("USB-9").IsKnown());
   CHECK_FALSE(Version::ParseString("USB-x.2k").IsKnown());
}
