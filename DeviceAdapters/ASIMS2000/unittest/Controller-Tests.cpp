#include <catch2/catch_all.hpp>

#include "FakeMS2000.h"
#include "MS2000Controller.h"

#include "Logging/Logging.h"

#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

// Controller wired to a simulated MS-2000; the controller owns the fake.
class ControllerFixture
{
public:
   explicit ControllerFixture(const std::string& axes = "XYZ") :
      core_(std::make_shared<MS2K::logging::LoggingCore>()),
      sink_(std::make_shared<MS2K::logging::PlainStreamLogSink>(log_))
   {
      core_->AddSink(sink_);
      std::unique_ptr<FakeMS2000> fake(new FakeMS2000(axes));
      fake_ = fake.get();
      controller_.reset(new MS2000Controller(std::move(fake), core_->NewLogger("MS2000")));
   }

   int Open() { return controller_->Open("COM3", 9600, 500.0); }

   MS2000Controller& Controller() { return *controller_; }
   FakeMS2000& Fake() { return *fake_; }
   std::string Log() const { return log_.str(); }

private:
   std::ostringstream log_;
   std::shared_ptr<MS2K::logging::LoggingCore> core_;
   std::shared_ptr<MS2K::logging::PlainStreamLogSink> sink_;
   FakeMS2000* fake_;
   std::unique_ptr<MS2000Controller> controller_;
};

bool Contains(const std::vector<std::string>& v, const std::string& s)
{
   for (size_t i = 0; i < v.size(); ++i)
      if (v[i] == s)
         return true;
   return false;
}

} // anonymous namespace

TEST_CASE("Open identifies the controller and its axes", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   CHECK(c.IsOpen());
   CHECK(c.GetAxes() == "XYZ");
   CHECK(c.GetMotorAxes() == "XYZ");
   CHECK(c.HasAxis('x'));
   CHECK(c.GetFirmwareVersion() == Version(9, 2, 'k'));
   CHECK(f.Fake().GetSettings().baudRate == 9600);
   CHECK(f.Fake().GetAnswerTimeoutMs() == 500.0);

   std::string value;
   CHECK(c.GetProperty(g_Keyword_Version, value) == MS2K_OK);
   CHECK(value == "USB-9.2k");
   CHECK(c.GetProperty(g_Keyword_BuildName, value) == MS2K_OK);
   CHECK(value == "STD_XYZ");
   CHECK(c.GetProperty(g_Keyword_MotorAxes, value) == MS2K_OK);
   CHECK(value == "XYZ");
   CHECK(c.IsPropertyReadOnly(g_Keyword_CompileDate));

   const std::vector<std::string>& writes = f.Fake().GetWrites();
   REQUIRE(writes.size() > 3);
   CHECK(writes[0] == "V");
   CHECK(Contains(writes, "BU X"));
   for (size_t i = 0; i < f.Fake().GetTerminators().size(); ++i)
      CHECK(f.Fake().GetTerminators()[i] == std::string("\r"));
}

TEST_CASE("Opening leaves the stage where it is", "[MS2000Controller]")
{
   ControllerFixture f;
   f.Fake().SetPosition('X', 12345);
   f.Fake().SetPosition('Z', -678);
   REQUIRE(f.Open() == MS2K_OK);
   CHECK(f.Fake().GetSettings().baudRate == 9600);

   const std::vector<std::string>& writes = f.Fake().GetWrites();
   for (size_t i = 0; i < writes.size(); ++i)
   {
      const std::string verb = writes[i].substr(0, writes[i].find(' '));
      INFO(writes[i]);
      CHECK(verb != "M");
      CHECK(verb != "R");
      CHECK(verb != "H");
      CHECK(verb != "!");
   }

   long position = 0;
   CHECK(f.Controller().GetPosition('X', position) == MS2K_OK);
   CHECK(position == 12345);
   CHECK(f.Controller().GetPosition('Z', position) == MS2K_OK);
   CHECK(position == -678);
}

TEST_CASE("Serial line settings reach the port", "[MS2000Controller]")
{
   ControllerFixture f;
   MS2000Controller& c = f.Controller();
   CHECK(c.SetProperty(MS2K::g_Keyword_Parity, MS2K::g_ParityEven) == MS2K_OK);
   CHECK(c.SetProperty(MS2K::g_Keyword_StopBits, "2") == MS2K_OK);
   CHECK(c.SetProperty(MS2K::g_Keyword_Handshaking, MS2K::g_Hardware) == MS2K_OK);
   CHECK(c.SetProperty(MS2K::g_Keyword_Parity, "Mark") != MS2K_OK);
   REQUIRE(f.Open() == MS2K_OK);

   const MS2K::SerialSettings& settings = f.Fake().GetSettings();
   CHECK(settings.parity == MS2K::ParityEven);
   CHECK(settings.stopBits == 2);
   CHECK(settings.hardwareHandshaking);
}

TEST_CASE("Open applies the motion defaults", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   const FakeMS2000& fake = f.Fake();

   // 0.67 of the 7 mm/s of the default lead screw
   CHECK(fake.HasWrite("S X=4.690000"));
   CHECK(fake.HasWrite("AC Y=25"));
   CHECK(fake.HasWrite("WT Z=0"));
   CHECK(fake.HasWrite("PC X=0.001000"));

   double speed = 0.0;
   CHECK(f.Controller().GetSpeed('X', speed) == MS2K_OK);
   CHECK(speed == Catch::Approx(4.69));
   double precision = 0.0;
   CHECK(f.Controller().GetPrecision('Z', precision) == MS2K_OK);
   CHECK(precision == 1.0);
}

TEST_CASE("Motion defaults can be left alone", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Controller().SetProperty(g_Keyword_ApplyMotionDefaults, MS2K::g_No) == MS2K_OK);
   REQUIRE(f.Open() == MS2K_OK);
   CHECK_FALSE(f.Fake().HasWrite("AC X=25"));
   CHECK(f.Fake().HasWrite("PC X?"));
}

TEST_CASE("Open fails cleanly", "[MS2000Controller]")
{
   SECTION("no port configured")
   {
      ControllerFixture f;
      CHECK(f.Controller().Initialize() == ERR_PORT_UNAVAILABLE);
      CHECK_FALSE(f.Controller().IsOpen());
   }

   SECTION("port cannot be opened")
   {
      ControllerFixture f;
      f.Fake().SetFailOpen(true);
      CHECK(f.Open() == ERR_PORT_UNAVAILABLE);
      CHECK(MS2000ErrorCategory(ERR_PORT_UNAVAILABLE) == ConnectionError);
   }

   SECTION("nothing answers")
   {
      ControllerFixture f;
      f.Fake().SetSilent(1000, false);
      CHECK(f.Open() == ERR_NO_IDENTIFICATION);
      CHECK_FALSE(f.Controller().IsOpen());
      CHECK_FALSE(f.Fake().IsOpen());
      CHECK_FALSE(f.Controller().HasProperty(g_Keyword_Version));
   }

   SECTION("garbage instead of an identification")
   {
      // a wrong baud rate gives a stream without line ends
      ControllerFixture f;
      f.Fake().InjectReply("V", std::string(3000, '~'));
      CHECK(f.Open() == ERR_NO_IDENTIFICATION);
      CHECK(MS2000ErrorCategory(ERR_NO_IDENTIFICATION) == ConnectionError);
      CHECK_FALSE(f.Controller().IsOpen());
      CHECK_FALSE(f.Fake().IsOpen());
   }

   SECTION("unsupported baud rate")
   {
      ControllerFixture f;
      CHECK(f.Controller().Open("COM3", 12345, 500.0) == MS2K_INVALID_PROPERTY_VALUE);
      CHECK_FALSE(f.Fake().IsOpen());
   }
}

TEST_CASE("Unqualified firmware only warns", "[MS2000Controller]")
{
   ControllerFixture f;
   f.Fake().SetVersion("USB-9.50");
   REQUIRE(f.Open() == MS2K_OK);
   CHECK(f.Controller().GetFirmwareVersion() == Version(9, 5, '0'));
   CHECK(f.Log().find("WRN MS2000: Firmware USB-9.50") != std::string::npos);
}

TEST_CASE("Configured axes must be present", "[MS2000Controller]")
{
   SECTION("subset")
   {
      ControllerFixture f;
      REQUIRE(f.Controller().SetProperty(g_Keyword_Axes, "x, Y") == MS2K_OK);
      REQUIRE(f.Open() == MS2K_OK);
      CHECK(f.Controller().GetAxes() == "XY");
      CHECK_FALSE(f.Controller().HasAxis('Z'));
      CHECK(f.Controller().HasProperty("Speed-Y(mm/s)"));
      CHECK_FALSE(f.Controller().HasProperty("Speed-Z(mm/s)"));
   }

   SECTION("missing axis")
   {
      ControllerFixture f("XY");
      REQUIRE(f.Controller().SetProperty(g_Keyword_Axes, "XYZ") == MS2K_OK);
      CHECK(f.Open() == ERR_INVALID_AXIS);
      CHECK_FALSE(f.Controller().IsOpen());
   }
}

TEST_CASE("Axes are probed when the build does not list them", "[MS2000Controller]")
{
   ControllerFixture f("XY");
   f.Fake().SetReportMotorAxes(false);
   REQUIRE(f.Open() == MS2K_OK);
   CHECK(f.Controller().GetAxes() == "XY");
   CHECK(f.Fake().HasWrite("W X"));
   CHECK(f.Fake().HasWrite("W Z"));
}

TEST_CASE("Moves to absent axes write nothing", "[MS2000Controller]")
{
   ControllerFixture f("XY");
   REQUIRE(f.Open() == MS2K_OK);
   f.Fake().ClearWrites();

   CHECK(f.Controller().MoveAxis('Z', 100, false) == ERR_INVALID_AXIS);
   std::vector<AxisTarget> targets;
   targets.push_back(AxisTarget('X', 10));
   targets.push_back(AxisTarget('Q', 10));
   CHECK(f.Controller().MoveAxes(targets, false) == ERR_INVALID_AXIS);
   CHECK(f.Fake().GetWrites().empty());
   CHECK(MS2000ErrorCategory(ERR_INVALID_AXIS) == InvalidAxisError);
}

TEST_CASE("Absolute and relative moves", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   std::vector<AxisTarget> targets;
   targets.push_back(AxisTarget('X', 1234));
   targets.push_back(AxisTarget('y', -5678));
   CHECK(c.MoveAxes(targets, false) == MS2K_OK);
   CHECK(f.Fake().HasWrite("M X=1234 Y=-5678"));

   std::vector<long> positions;
   CHECK(c.GetPositions("XY", positions) == MS2K_OK);
   REQUIRE(positions.size() == 2);
   CHECK(positions[0] == 1234);
   CHECK(positions[1] == -5678);

   CHECK(c.MoveAxis('X', 100, true) == MS2K_OK);
   CHECK(f.Fake().HasWrite("R X=100"));
   long position = 0;
   CHECK(c.GetPosition('X', position) == MS2K_OK);
   CHECK(position == 1334);

   CHECK(c.SetOrigin('X') == MS2K_OK);
   CHECK(f.Fake().HasWrite("H X=0"));
   CHECK(c.HomeAxis('Y') == MS2K_OK);
   CHECK(f.Fake().HasWrite("! Y"));
   CHECK(f.Fake().GetPosition('Y') == 0);
}

TEST_CASE("Targets outside the travel range are refused", "[MS2000Controller]")
{
   ControllerFixture f;
   MS2000Controller& c = f.Controller();
   REQUIRE(c.SetProperty("MinTravel-X(mm)", "-5") == MS2K_OK);
   REQUIRE(c.SetProperty("MaxTravel-X(mm)", "5") == MS2K_OK);
   REQUIRE(f.Open() == MS2K_OK);

   bool known = false;
   long minPosition = 0;
   long maxPosition = 0;
   CHECK(c.GetTravelLimits('X', known, minPosition, maxPosition) == MS2K_OK);
   CHECK(known);
   CHECK(minPosition == -50000);
   CHECK(maxPosition == 50000);

   f.Fake().ClearWrites();
   CHECK(c.MoveAxis('X', 50001, false) == ERR_OUT_OF_RANGE);
   CHECK(f.Fake().GetWrites().empty());
   CHECK(c.MoveAxis('X', 50000, false) == MS2K_OK);

   // relative moves are checked against the current position
   f.Fake().ClearWrites();
   CHECK(c.MoveAxis('X', 1, true) == ERR_OUT_OF_RANGE);
   REQUIRE(f.Fake().GetWrites().size() == 1);
   CHECK(f.Fake().GetWrites()[0] == "W X");

   // no limits on Y
   CHECK(c.MoveAxis('Y', 99999999, false) == MS2K_OK);
}

TEST_CASE("Inverted travel limits are a configuration error", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Controller().SetProperty("MinTravel-X(mm)", "5") == MS2K_OK);
   REQUIRE(f.Controller().SetProperty("MaxTravel-X(mm)", "-5") == MS2K_OK);
   CHECK(f.Open() == MS2K_INVALID_PROPERTY_VALUE);
}

TEST_CASE("Micron moves use the encoder resolution", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Controller().SetProperty("EncoderCountsPerUm-X", "20") == MS2K_OK);
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   CHECK(c.MoveAxisUm('X', 12.5, false, false) == MS2K_OK);
   CHECK(f.Fake().HasWrite("M X=250"));
   double um = 0.0;
   CHECK(c.GetPositionUm('X', um) == MS2K_OK);
   CHECK(um == 12.5);

   CHECK(c.MoveAxisUm('X', -2.5, true, false) == MS2K_OK);
   CHECK(f.Fake().GetPosition('X') == 200);
}

TEST_CASE("Blocking moves wait and check the final position", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   SECTION("reached")
   {
      f.Fake().SetBusyPolls(3);
      CHECK(c.MoveAxisUm('Y', 100.0, false, true) == MS2K_OK);
      CHECK(f.Fake().CountWrites("/") == 4);
      CHECK(f.Fake().GetPosition('Y') == 1000);
   }

   SECTION("within precision")
   {
      f.Fake().SetMoveOffset(5);
      CHECK(c.MoveAxisUm('Y', 100.0, false, true) == MS2K_OK);
   }

   SECTION("stopped short")
   {
      f.Fake().SetMoveOffset(50);
      CHECK(c.MoveAxisUm('Y', 100.0, false, true) == ERR_POSITION_NOT_REACHED);
   }
}

TEST_CASE("Move targets that cannot be represented are refused", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();
   f.Fake().ClearWrites();

   CHECK(c.MoveAxisUm('X', std::nan(""), false, false) == ERR_OUT_OF_RANGE);
   CHECK(c.MoveAxisUm('Y', std::numeric_limits<double>::infinity(), true, false) == ERR_OUT_OF_RANGE);
   CHECK(c.MoveAxisUm('Y', 1e30, false, false) == ERR_OUT_OF_RANGE);
   CHECK(c.MoveAxisUm('Y', -1e30, false, true) == ERR_OUT_OF_RANGE);
   CHECK(f.Fake().GetWrites().empty());
   CHECK_FALSE(c.IsMoving());

   // relative moves that would wrap around
   f.Fake().SetPosition('Z', 10);
   CHECK(c.MoveAxis('Z', std::numeric_limits<long>::max(), true) == ERR_OUT_OF_RANGE);
   f.Fake().SetPosition('Z', -10);
   CHECK(c.MoveAxis('Z', std::numeric_limits<long>::min(), true) == ERR_OUT_OF_RANGE);
   REQUIRE(f.Fake().GetWrites().size() == 2);
   CHECK(f.Fake().CountWrites("W Z") == 2);

   CHECK(c.MoveAxis('Z', -5, true) == MS2K_OK);
   CHECK(f.Fake().HasWrite("R Z=-5"));
   CHECK(f.Fake().GetPosition('Z') == -15);
}

TEST_CASE("Multi-axis micron moves", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();
   f.Fake().SetPosition('Z', 777);

   std::vector<AxisTargetUm> targets;
   targets.push_back(AxisTargetUm('X', 10.0));
   targets.push_back(AxisTargetUm('y', -20.5));
   CHECK(c.MoveAxesUm(targets, false, true) == MS2K_OK);
   CHECK(f.Fake().HasWrite("M X=100 Y=-205"));
   CHECK(f.Fake().GetPosition('Z') == 777);
   CHECK_FALSE(c.IsMoving());

   targets.clear();
   targets.push_back(AxisTargetUm('X', 1.0));
   targets.push_back(AxisTargetUm('Y', 0.5));
   CHECK(c.MoveAxesUm(targets, true, true) == MS2K_OK);
   CHECK(f.Fake().HasWrite("W X Y"));
   CHECK(f.Fake().HasWrite("M X=110 Y=-200"));
   CHECK(f.Fake().GetPosition('Z') == 777);

   targets.push_back(AxisTargetUm('x', 3.0));
   CHECK(c.MoveAxesUm(targets, false, false) == MS2K_INVALID_INPUT_PARAM);
   CHECK(c.MoveAxesUm(std::vector<AxisTargetUm>(), false, false) == MS2K_INVALID_INPUT_PARAM);
}

TEST_CASE("A move that does not block is finished by the next one", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   SECTION("target reached")
   {
      f.Fake().SetBusyPolls(2);
      CHECK(c.MoveAxisUm('X', 50.0, false, false) == MS2K_OK);
      CHECK(c.IsMoving());
      CHECK(f.Fake().CountWrites("/") == 0);

      f.Fake().ClearWrites();
      CHECK(c.MoveAxisUm('Y', 5.0, false, false) == MS2K_OK);
      const std::vector<std::string>& writes = f.Fake().GetWrites();
      REQUIRE(writes.size() == 5);
      CHECK(writes[0] == "/");
      CHECK(writes[2] == "/");
      CHECK(writes[3] == "W X");
      CHECK(writes[4] == "M Y=50");
      CHECK(c.IsMoving());

      CHECK(c.FinishMoving() == MS2K_OK);
      CHECK_FALSE(c.IsMoving());
      CHECK(c.FinishMoving() == MS2K_OK);
   }

   SECTION("target missed")
   {
      f.Fake().SetMoveOffset(50);
      CHECK(c.MoveAxisUm('X', 50.0, false, false) == MS2K_OK);
      f.Fake().ClearWrites();
      CHECK(c.MoveAxis('Y', 10, false) == ERR_POSITION_NOT_REACHED);
      CHECK_FALSE(f.Fake().HasWrite("M Y=10"));
      CHECK_FALSE(c.IsMoving());
      CHECK(c.MoveAxis('Y', 10, false) == MS2K_OK);
   }

   SECTION("absent axes are refused before waiting")
   {
      CHECK(c.MoveAxisUm('X', 50.0, false, false) == MS2K_OK);
      f.Fake().ClearWrites();
      CHECK(c.MoveAxis('Q', 10, false) == ERR_INVALID_AXIS);
      CHECK(c.MoveAxisUm('Q', 1.0, false, true) == ERR_INVALID_AXIS);
      CHECK(f.Fake().GetWrites().empty());
      CHECK(c.IsMoving());
   }

   SECTION("halt drops the target")
   {
      f.Fake().SetMoveOffset(50);
      CHECK(c.MoveAxisUm('X', 50.0, false, false) == MS2K_OK);
      CHECK(c.Halt() == MS2K_OK);
      CHECK_FALSE(c.IsMoving());
      CHECK(c.HomeAxis('X') == MS2K_OK);
   }
}

TEST_CASE("Busy status", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   bool busy = true;
   CHECK(c.IsBusy(busy) == MS2K_OK);
   CHECK_FALSE(busy);
   CHECK_FALSE(c.Busy());

   f.Fake().SetBusyPolls(2);
   CHECK(c.MoveAxis('X', 10, false) == MS2K_OK);
   CHECK(c.IsAxisBusy('X', busy) == MS2K_OK);
   CHECK(busy);
   CHECK(f.Fake().HasWrite("RS X"));
   CHECK(c.WaitUntilAxisIdle('X', 0, 1000) == MS2K_OK);

   f.Fake().SetBusyPolls(1000000);
   CHECK(c.MoveAxis('X', 20, false) == MS2K_OK);
   CHECK(c.Busy());
   CHECK(c.WaitUntilIdle(1, 20) == ERR_WAIT_TIMEOUT);
   CHECK(MS2000ErrorCategory(ERR_WAIT_TIMEOUT) == TimeoutError);

   CHECK(c.Halt() == MS2K_OK);
   CHECK(f.Fake().HasWrite("HALT"));
   CHECK(c.IsBusy(busy) == MS2K_OK);
   CHECK_FALSE(busy);

   CHECK(c.WaitUntilIdle(-1, 10) == MS2K_INVALID_INPUT_PARAM);
}

TEST_CASE("Controller errors are reported with their number", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   f.Fake().InjectReply("M X", ":N-4");
   const int ret = c.MoveAxis('X', 10, false);
   CHECK(ret == ERR_OFFSET + 4);
   CHECK(MS2000ErrorCategory(ret) == ProtocolError);

   char text[MS2K::MaxStrLength];
   CHECK(c.GetErrorText(ret, text));
   CHECK(std::string(text) == "Controller reported: Parameter Out of Range");
   CHECK(c.GetErrorText(ERR_INVALID_AXIS, text));
   CHECK(std::string(text) == "The axis is not present on this controller");
}

TEST_CASE("A reply with the wrong value count forces a resync", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();
   f.Fake().SetPosition('X', 7);
   f.Fake().SetPosition('Y', 8);

   f.Fake().InjectReply("W X Y", ":A 1234");
   std::vector<long> positions;
   CHECK(c.GetPositions("XY", positions) == ERR_UNEXPECTED_VALUE_COUNT);
   CHECK(positions.empty());
   CHECK(c.NeedsResync());

   const int purges = f.Fake().GetPurgeCount();
   CHECK(c.GetPositions("XY", positions) == MS2K_OK);
   CHECK(f.Fake().GetPurgeCount() == purges + 1);
   REQUIRE(positions.size() == 2);
   CHECK(positions[1] == 8);
}

TEST_CASE("A late reply is not taken for the next one", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();
   f.Fake().SetPosition('X', 111);

   f.Fake().SetSilent(1, true);
   long position = 0;
   CHECK(c.GetPosition('X', position) == MS2K_SERIAL_TIMEOUT);
   CHECK(c.NeedsResync());
   CHECK_FALSE(c.IsAwaitingReply());

   f.Fake().SetPosition('X', 222);
   CHECK(c.GetPosition('X', position) == MS2K_OK);
   CHECK(position == 222);
   CHECK_FALSE(c.NeedsResync());
}

TEST_CASE("Unparseable replies", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   f.Fake().InjectReply("/", "Q?");
   bool busy = false;
   CHECK(c.IsBusy(busy) == ERR_UNRECOGNIZED_ANSWER);
   CHECK(c.NeedsResync());

   f.Fake().InjectReply("W X", ":A X=abc");
   long position = 0;
   CHECK(c.GetPosition('X', position) == ERR_UNRECOGNIZED_ANSWER);
}

TEST_CASE("Only one command may await its reply", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   CHECK(c.SendCommand(MS2000Command("W").Axis('X')) == MS2K_OK);
   CHECK(c.IsAwaitingReply());
   CHECK(c.SendCommand(MS2000Command("W").Axis('Y')) == ERR_COMMAND_PENDING);
   long position = 0;
   CHECK(c.GetPosition('X', position) == ERR_COMMAND_PENDING);

   MS2000Reply reply;
   CHECK(c.ReadReply(reply) == MS2K_OK);
   CHECK_FALSE(c.IsAwaitingReply());
   CHECK(c.GetPosition('X', position) == MS2K_OK);

   CHECK(c.SendCommand(MS2000Command("ZZ")) == MS2K_UNSUPPORTED_COMMAND);
}

TEST_CASE("Speed is range checked and verified", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   f.Fake().ClearWrites();
   CHECK(c.SetSpeed('X', 7.5) == ERR_OUT_OF_RANGE);
   CHECK(c.SetSpeed('X', -0.1) == ERR_OUT_OF_RANGE);
   CHECK(f.Fake().GetWrites().empty());

   CHECK(c.SetSpeed('X', 1.25) == MS2K_OK);
   CHECK(f.Fake().HasWrite("S X=1.250000"));
   CHECK(f.Fake().HasWrite("S X?"));

   f.Fake().InjectReply("S X?", ":A X=1.000000");
   CHECK(c.SetSpeed('X', 2.0) == ERR_VERIFY_FAILED);

   LeadScrew screw;
   REQUIRE(c.GetLeadScrew('X', screw) == MS2K_OK);
   CHECK(c.SetSpeed('X', screw.maxVelocityMmps) == MS2K_OK);
}

TEST_CASE("Acceleration, settle time and precision", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   CHECK(c.SetAcceleration('Y', 24) == ERR_OUT_OF_RANGE);
   CHECK(c.SetAcceleration('Y', 1001) == ERR_OUT_OF_RANGE);
   CHECK(c.SetAcceleration('Y', 500) == MS2K_OK);
   long ms = 0;
   CHECK(c.GetAcceleration('Y', ms) == MS2K_OK);
   CHECK(ms == 500);

   CHECK(c.SetSettleTime('Z', 1001) == ERR_OUT_OF_RANGE);
   CHECK(c.SetSettleTime('Z', 10) == MS2K_OK);
   CHECK(c.GetSettleTime('Z', ms) == MS2K_OK);
   CHECK(ms == 10);
   f.Fake().InjectReply("WT Z?", ":Z=11");
   CHECK(c.SetSettleTime('Z', 10) == MS2K_OK);
   f.Fake().InjectReply("WT Z?", ":Z=12");
   CHECK(c.SetSettleTime('Z', 10) == ERR_VERIFY_FAILED);

   CHECK(c.SetPrecision('X', 0.4) == ERR_OUT_OF_RANGE);
   CHECK(c.SetPrecision('X', 1000001) == ERR_OUT_OF_RANGE);
   CHECK(c.SetPrecision('X', 5) == MS2K_OK);
   CHECK(f.Fake().HasWrite("PC X=0.005000"));
   double um = 0.0;
   CHECK(c.GetPrecision('X', um) == MS2K_OK);
   CHECK(um == 5.0);

   CHECK(c.SetAcceleration('Q', 100) == ERR_INVALID_AXIS);
}

TEST_CASE("Runtime properties reach the controller", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   CHECK(c.SetProperty("Speed-Y(mm/s)", "3.5") == MS2K_OK);
   CHECK(f.Fake().HasWrite("S Y=3.500000"));
   CHECK(c.SetProperty("Acceleration-X(ms)", "200") == MS2K_OK);
   CHECK(f.Fake().HasWrite("AC X=200"));

   double value = 0.0;
   CHECK(c.GetProperty("Speed-Y(mm/s)", value) == MS2K_OK);
   CHECK(value == Catch::Approx(3.5));

   double lower = 0.0;
   double upper = 0.0;
   CHECK(c.GetPropertyLimits("Acceleration-X(ms)", lower, upper) == MS2K_OK);
   CHECK(lower == 25.0);
   CHECK(upper == 1000.0);
   CHECK(c.SetProperty("Acceleration-X(ms)", "2000") == MS2K_INVALID_PROPERTY_VALUE);
}

TEST_CASE("Pre-init properties are fixed once open", "[MS2000Controller]")
{
   ControllerFixture f;
   MS2000Controller& c = f.Controller();
   CHECK(c.IsPropertyPreInit(g_Keyword_UsePWM));
   CHECK(c.IsPropertyPreInit(MS2K::g_Keyword_Port));
   REQUIRE(f.Open() == MS2K_OK);

   CHECK(c.SetProperty(g_Keyword_UsePWM, MS2K::g_Yes) == ERR_PRE_INIT_PROPERTY);
   CHECK(c.SetProperty("LeadScrew-X", "F") == ERR_PRE_INIT_PROPERTY);
   CHECK(c.SetProperty(MS2K::g_Keyword_Port, "COM9") == ERR_PORT_CHANGE_FORBIDDEN);
   std::string port;
   CHECK(c.GetProperty(MS2K::g_Keyword_Port, port) == MS2K_OK);
   CHECK(port == "COM3");

   CHECK(c.Open("COM3", 9600, 500.0) == MS2K_OK);
   CHECK(c.Open("COM9", 9600, 500.0) == ERR_PORT_CHANGE_FORBIDDEN);
   CHECK(MS2000ErrorCategory(ERR_PRE_INIT_PROPERTY) == ConfigurationError);
}

TEST_CASE("Lead screw selects the speed limit", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Controller().SetProperty("LeadScrew-X", "XF") == MS2K_OK);
   CHECK(f.Controller().SetProperty("LeadScrew-Y", "XXL") == MS2K_INVALID_PROPERTY_VALUE);
   REQUIRE(f.Open() == MS2K_OK);

   LeadScrew screw;
   CHECK(f.Controller().GetLeadScrew('X', screw) == MS2K_OK);
   CHECK(screw.name == "XF");
   CHECK(f.Fake().HasWrite("S X=0.469000"));
   CHECK(f.Controller().SetSpeed('X', 0.71) == ERR_OUT_OF_RANGE);
}

TEST_CASE("PWM output", "[MS2000Controller]")
{
   ControllerFixture f;
   MS2000Controller& c = f.Controller();
   REQUIRE(c.SetProperty(g_Keyword_UsePWM, MS2K::g_Yes) == MS2K_OK);
   REQUIRE(f.Open() == MS2K_OK);

   CHECK(f.Fake().HasWrite("TTL X=0"));
   CHECK(f.Fake().HasWrite("TTL Y=0"));
   CHECK(f.Fake().HasWrite("LED X=1"));
   CHECK(c.GetPWMState() == "off");

   CHECK(c.SetPWMState("external") == MS2K_OK);
   CHECK(f.Fake().GetTTLIn() == 10);
   CHECK(f.Fake().GetTTLOut() == 0);
   std::string mode;
   CHECK(c.GetTTLInMode(mode) == MS2K_OK);
   CHECK(mode == "toggle_ttl_out");

   CHECK(c.SetProperty(g_Keyword_PWMState, "pwm") == MS2K_OK);
   CHECK(f.Fake().GetTTLIn() == 0);
   CHECK(f.Fake().GetTTLOut() == 9);
   CHECK(c.SetPWMState("strobe") == MS2K_INVALID_INPUT_PARAM);
   CHECK(c.GetPWMState() == "pwm");

   CHECK(c.SetPWMIntensity(0) == ERR_OUT_OF_RANGE);
   CHECK(c.SetPWMIntensity(100) == ERR_OUT_OF_RANGE);
   CHECK(c.SetPWMIntensity(45) == MS2K_OK);
   long percent = 0;
   CHECK(c.GetPWMIntensity(percent) == MS2K_OK);
   CHECK(percent == 45);

   CHECK(c.SetPWMState("on") == MS2K_OK);
   CHECK(f.Fake().GetTTLOut() == 1);
   f.Fake().ClearWrites();
   CHECK(c.Close() == MS2K_OK);
   CHECK(f.Fake().HasWrite("TTL Y=0"));
   CHECK(f.Fake().GetTTLOut() == 0);
   CHECK_FALSE(c.HasProperty(g_Keyword_PWMState));
}

TEST_CASE("PWM properties only exist when enabled", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   CHECK_FALSE(f.Controller().HasProperty(g_Keyword_PWMState));
   CHECK_FALSE(f.Fake().HasWrite("LED X=1"));
}

TEST_CASE("Close is idempotent", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   CHECK(c.Close() == MS2K_OK);
   CHECK_FALSE(c.IsOpen());
   CHECK_FALSE(f.Fake().IsOpen());
   CHECK(c.Close() == MS2K_OK);
   CHECK(c.Shutdown() == MS2K_OK);

   long position = 0;
   CHECK(c.GetPosition('X', position) == MS2K_NOT_CONNECTED);
   CHECK(c.MoveAxis('X', 1, false) == MS2K_NOT_CONNECTED);

   // reopen after close
   CHECK(f.Open() == MS2K_OK);
   CHECK(c.IsOpen());
   CHECK(c.HasProperty("Speed-X(mm/s)"));
}

TEST_CASE("Close while a reply is pending", "[MS2000Controller]")
{
   ControllerFixture f;
   REQUIRE(f.Open() == MS2K_OK);
   MS2000Controller& c = f.Controller();

   CHECK(c.SendCommand(MS2000Command("W").Axis('X')) == MS2K_OK);
   CHECK(c.Close() == MS2K_OK);
   CHECK_FALSE(c.IsAwaitingReply());
   CHECK(f.Open() == MS2K_OK);
}

TEST_CASE("Axes are forgotten once the controller is closed", "[MS2000Controller]")
{
   SECTION("close")
   {
      ControllerFixture f;
      REQUIRE(f.Open() == MS2K_OK);
      REQUIRE(f.Controller().GetAxes() == "XYZ");
      CHECK(f.Controller().Close() == MS2K_OK);
      CHECK(f.Controller().GetAxes().empty());
      CHECK(f.Controller().GetMotorAxes().empty());
      CHECK_FALSE(f.Controller().HasAxis('X'));
   }

   SECTION("failed open")
   {
      ControllerFixture f;
      f.Fake().InjectReply("AC", ":N-5");
      CHECK(f.Open() == ERR_OFFSET + 5);
      CHECK_FALSE(f.Controller().IsOpen());
      CHECK(f.Controller().GetAxes().empty());
      CHECK_FALSE(f.Controller().HasAxis('X'));
   }
}
