#include <catch2/catch_all.hpp>

#include "Property.h"

namespace MS2K {

TEST_CASE("Set value is truncated to 4 digits", "[FloatPropertyTruncation]")
{
   FloatProperty fp("TestProp");
   double v;

   CHECK(fp.Set(0.00004));
   CHECK(fp.Get(v));
   CHECK(v == 0.0);

   CHECK(fp.Set(0.00005));
   CHECK(fp.Get(v));
   CHECK(v == 0.0001);

   CHECK(fp.Set(-0.00005));
   CHECK(fp.Get(v));
   CHECK(v == -0.0001);
}

TEST_CASE("Float limits are truncated inwards", "[FloatPropertyTruncation]")
{
   FloatProperty fp("TestProp");

   CHECK(fp.SetLimits(0.00001, 1000.0));
   CHECK(fp.GetLowerLimit() == 0.0001);
   CHECK(fp.SetLimits(-1000.0, 0.00011));
   CHECK(fp.GetUpperLimit() == 0.0001);
   CHECK(fp.SetLimits(-1000.0, -0.00011));
   CHECK(fp.GetUpperLimit() == -0.0002);
}

TEST_CASE("Float value outside limits is refused", "[FloatPropertyTruncation]")
{
   FloatProperty fp("MaxTravel-X(mm)");
   REQUIRE(fp.SetLimits(-50.0, 50.0));
   CHECK(fp.Set(25.0));
   CHECK_FALSE(fp.Set(50.1));
   CHECK_FALSE(fp.Set("-75"));
   double v;
   fp.Get(v);
   CHECK(v == 25.0);
}

TEST_CASE("Float property rejects text", "[FloatPropertyTruncation]")
{
   FloatProperty fp("AnswerTimeout");
   CHECK(fp.Set("2000"));
   CHECK_FALSE(fp.Set("fast"));
   std::string s;
   fp.Get(s);
   CHECK(s == "2000.0000");
}

} // namespace MS2K
