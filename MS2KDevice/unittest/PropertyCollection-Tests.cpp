#include <catch2/catch_all.hpp>

#include "Property.h"

#include <string>
#include <vector>

namespace MS2K {

namespace {

// Records the action handler calls it receives.
class ActionRecorder
{
public:
   ActionRecorder() : gets(0), sets(0), failSet(false) {}

   int OnValue(PropertyBase* pProp, ActionType eAct)
   {
      if (eAct == BeforeGet)
      {
         ++gets;
         pProp->Set("from-device");
      }
      else if (eAct == AfterSet)
      {
         ++sets;
         pProp->Get(lastSet);
         if (failSet)
            return MS2K_ERR;
      }
      return MS2K_OK;
   }

   int gets;
   int sets;
   bool failSet;
   std::string lastSet;
};

} // anonymous namespace

TEST_CASE("Create and read back properties", "[PropertyCollection]")
{
   PropertyCollection props;
   CHECK(props.CreateProperty("Port", "Undefined", String, false, 0, true) == MS2K_OK);
   CHECK(props.CreateProperty("BaudRate", "9600", Integer, false) == MS2K_OK);
   CHECK(props.CreateProperty("AnswerTimeout", "2000", Float, false) == MS2K_OK);
   CHECK(props.GetSize() == 3);

   std::string value;
   CHECK(props.Get("BaudRate", value) == MS2K_OK);
   CHECK(value == "9600");
   CHECK(props.Find("Port")->GetInitStatus());
   CHECK_FALSE(props.Find("BaudRate")->GetInitStatus());

   CHECK(props.Get("Missing", value) == MS2K_INVALID_PROPERTY);
}

TEST_CASE("Duplicate and invalid properties are refused", "[PropertyCollection]")
{
   PropertyCollection props;
   CHECK(props.CreateProperty("Axes", "X,Y", String, false) == MS2K_OK);
   CHECK(props.CreateProperty("Axes", "Z", String, false) == MS2K_DUPLICATE_PROPERTY);
   CHECK(props.CreateProperty("Count", "many", Integer, false) == MS2K_INVALID_PROPERTY_VALUE);
   CHECK(props.CreateProperty("Bad", "", Undef, false) == MS2K_INVALID_PROPERTY_TYPE);
   CHECK(props.GetSize() == 1);
}

TEST_CASE("Allowed values restrict Set", "[PropertyCollection]")
{
   PropertyCollection props;
   REQUIRE(props.CreateProperty("LeadScrew-X", "S", String, false) == MS2K_OK);
   props.AddAllowedValue("LeadScrew-X", "UC");
   props.AddAllowedValue("LeadScrew-X", "S");
   props.AddAllowedValue("LeadScrew-X", "F");

   CHECK(props.Set("LeadScrew-X", "F") == MS2K_OK);
   CHECK(props.Set("LeadScrew-X", "XXL") == MS2K_INVALID_PROPERTY_VALUE);

   std::string value;
   props.Get("LeadScrew-X", value);
   CHECK(value == "F");

   const std::vector<std::string> allowed = props.Find("LeadScrew-X")->GetAllowedValues();
   CHECK(allowed.size() == 3);
}

TEST_CASE("Allowed values carry data", "[PropertyCollection]")
{
   PropertyCollection props;
   REQUIRE(props.CreateProperty("TTLOutMode", "low", String, false) == MS2K_OK);
   props.AddAllowedValue("TTLOutMode", "low", 0);
   props.AddAllowedValue("TTLOutMode", "high", 1);
   props.AddAllowedValue("TTLOutMode", "pwm", 9);

   long data = -1;
   CHECK(props.GetPropertyData("TTLOutMode", "pwm", data) == MS2K_OK);
   CHECK(data == 9);
   CHECK(props.GetCurrentPropertyData("TTLOutMode", data) == MS2K_OK);
   CHECK(data == 0);
   CHECK(props.GetPropertyData("TTLOutMode", "blink", data) == MS2K_NO_PROPERTY_DATA);
}

TEST_CASE("Integer limits restrict Set", "[PropertyCollection]")
{
   PropertyCollection props;
   REQUIRE(props.CreateProperty("EncoderCountsPerUm-X", "10", Integer, false) == MS2K_OK);
   REQUIRE(props.SetLimits("EncoderCountsPerUm-X", 1, 1000) == MS2K_OK);
   CHECK(props.Set("EncoderCountsPerUm-X", "20") == MS2K_OK);
   CHECK(props.Set("EncoderCountsPerUm-X", "0") == MS2K_INVALID_PROPERTY_VALUE);
   CHECK(props.SetLimits("Nope", 0, 1) == MS2K_INVALID_PROPERTY);
}

TEST_CASE("Read-only properties cannot be set", "[PropertyCollection]")
{
   PropertyCollection props;
   REQUIRE(props.CreateProperty("Version", "USB-9.2k", String, true) == MS2K_OK);
   CHECK(props.Set("Version", "USB-9.50") == MS2K_INVALID_PROPERTY_VALUE);
   std::string value;
   props.Get("Version", value);
   CHECK(value == "USB-9.2k");
}

TEST_CASE("Action handlers run on get and set", "[PropertyCollection]")
{
   ActionRecorder recorder;
   PropertyCollection props;
   REQUIRE(props.CreateProperty("Value", "", String, false,
      new Action<ActionRecorder>(&recorder, &ActionRecorder::OnValue)) == MS2K_OK);

   std::string value;
   CHECK(props.Get("Value", value) == MS2K_OK);
   CHECK(value == "from-device");
   CHECK(recorder.gets == 1);

   CHECK(props.Set("Value", "to-device") == MS2K_OK);
   CHECK(recorder.sets == 1);
   CHECK(recorder.lastSet == "to-device");

   recorder.failSet = true;
   CHECK(props.Set("Value", "again") == MS2K_ERR);
}

TEST_CASE("Cached properties skip the handler", "[PropertyCollection]")
{
   ActionRecorder recorder;
   PropertyCollection props;
   REQUIRE(props.CreateProperty("Value", "initial", String, false,
      new Action<ActionRecorder>(&recorder, &ActionRecorder::OnValue)) == MS2K_OK);
   props.Find("Value")->SetCached(true);

   std::string value;
   CHECK(props.Get("Value", value) == MS2K_OK);
   CHECK(value == "initial");
   CHECK(recorder.gets == 0);
}

TEST_CASE("Delete removes a property", "[PropertyCollection]")
{
   PropertyCollection props;
   REQUIRE(props.CreateProperty("A", "1", Integer, false) == MS2K_OK);
   CHECK(props.Delete("A") == MS2K_OK);
   CHECK(props.Delete("A") == MS2K_INVALID_PROPERTY);
   CHECK(props.GetNames().empty());
}

} // namespace MS2K
