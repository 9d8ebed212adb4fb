/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#ifndef MS2000CONTROLLER_H
#define MS2000CONTROLLER_H

#include "MS2000Base.h"
#include "LeadScrew.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

// Target of one axis in a multi-axis move, in controller units
struct AxisTarget {
	char axis;
	long position;

	AxisTarget(char a, long p) : axis(a), position(p) { }
};

// Target of one axis in a micron move
struct AxisTargetUm {
	char axis;
	double um;

	AxisTargetUm(char a, double u) : axis(a), um(u) { }
};

// ASI MS-2000 stage controller.
//
// Positions are in controller units (tenths of microns with the default
// encoder of 10 counts per micron) unless the function name says Um.
// Axes are the ones the controller reports when it is opened; an axis
// that is not present is refused before anything is written to the port.
//
// All functions return MS2K_OK or an error code, see ASIMS2000.h.
class MS2000Controller : public MS2000Base
{
public:
	typedef MS2K::Action<MS2000Controller> CPropertyAction;

	static constexpr long DefaultPollIntervalMs = 10;

	explicit MS2000Controller(std::unique_ptr<MS2K::Serial> serial,
		const MS2K::logging::Logger& logger = MS2K::logging::Logger());
	~MS2000Controller();

	void GetName(char* name) const;
	int Initialize();
	int Shutdown();
	bool Busy();

	// Set the port properties and initialize
	int Open(const char* port, long baudRate, double answerTimeoutMs);
	// Switches the PWM output off first if it was used; safe to call twice
	int Close();
	bool IsOpen() const { return initialized_; }

	// axes
	std::string GetAxes() const { return axisLetters_; }
	std::string GetMotorAxes() const { return motorAxes_; }
	bool HasAxis(char axis) const;
	int GetLeadScrew(char axis, LeadScrew& screw) const;
	int GetEncoderCountsPerUm(char axis, long& counts) const;
	int GetTravelLimits(char axis, bool& known, long& minPosition, long& maxPosition) const;
	Version GetFirmwareVersion() const { return version_; }

	// motion
	int MoveAxis(char axis, long target, bool relative);
	int MoveAxes(const std::vector<AxisTarget>& targets, bool relative);
	int MoveAxisUm(char axis, double um, bool relative, bool block);
	// Axes left out of targets stay where they are. A move that does not
	// block is finished, and its targets checked, by the next move.
	int MoveAxesUm(const std::vector<AxisTargetUm>& targets, bool relative, bool block);
	// Wait for the last non-blocking micron move and check its targets
	int FinishMoving();
	bool IsMoving() const { return !pendingTargets_.empty(); }
	int GetPosition(char axis, long& position);
	int GetPositions(const std::string& axes, std::vector<long>& positions);
	int GetPositionUm(char axis, double& um);
	int IsBusy(bool& busy);
	int IsAxisBusy(char axis, bool& busy);
	int WaitUntilIdle(long pollIntervalMs, long maxWaitMs);
	int WaitUntilAxisIdle(char axis, long pollIntervalMs, long maxWaitMs);
	int HomeAxis(char axis);
	int SetOrigin(char axis);
	int Halt();

	// motion parameters, verified by reading them back
	int SetSpeed(char axis, double mmPerSec);
	int GetSpeed(char axis, double& mmPerSec);
	int SetAcceleration(char axis, long ms);
	int GetAcceleration(char axis, long& ms);
	int SetSettleTime(char axis, long ms);
	int GetSettleTime(char axis, long& ms);
	int SetPrecision(char axis, double um);
	int GetPrecision(char axis, double& um);

	// TTL and LED output
	int SetTTLInMode(const std::string& mode);
	int GetTTLInMode(std::string& mode);
	int SetTTLOutMode(const std::string& mode);
	int GetTTLOutMode(std::string& mode);
	int SetPWMIntensity(long percent);
	int GetPWMIntensity(long& percent);
	int SetPWMState(const std::string& state);
	std::string GetPWMState() const { return pwmState_; }

	// action interface
	// ----------------
	int OnPort(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnMotorAxes(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnSpeed(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnAcceleration(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnSettleTime(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnPrecision(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnPWMState(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnPWMIntensity(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);

private:
	struct AxisInfo {
		char letter;
		LeadScrew screw;
		bool limitsKnown;
		double minTravelMm;
		double maxTravelMm;
		long countsPerUm;
		double precisionUm;

		AxisInfo() : letter(0), limitsKnown(false), minTravelMm(0.0), maxTravelMm(0.0),
			countsPerUm(10), precisionUm(1.0) { }
	};

	// motion parameter limits
	static constexpr long MinAccelerationMs = 25;
	static constexpr long MaxAccelerationMs = 1000;
	static constexpr long MaxSettleTimeMs = 1000;
	static constexpr long SettleTimeToleranceMs = 1;
	static constexpr long MinPrecisionUm = 1;
	static constexpr long MaxPrecisionUm = 1000000;

	void CreatePreInitProperties();
	void CreateAxisPreInitProperties(char axis);
	int CreatePostInitProperties();
	int AddPostInitProperty(const std::string& name, const char* value, MS2K::PropertyType eType,
		bool readOnly, MS2K::ActionFunctor* pAct);
	void RemovePostInitProperties();
	int OpenPort();
	int SetUpController();
	int IdentifyController();
	int ReadMotorAxes();
	int ProbeAxis(char axis, bool& present);
	int ConfigureAxes();
	int ApplyMotionDefaults();
	int ReadAxisParameter(const char* verb, char axis, double& value);
	int SendMove(const std::vector<AxisTarget>& targets, bool relative);
	int CheckTarget(const AxisInfo& info, long target) const;
	long UmToCounts(const AxisInfo& info, double um) const;
	int TargetUmToCounts(const AxisInfo& info, double um, long& counts) const;
	void ClearAxes();
	const AxisInfo* FindAxis(char axis) const;
	int CheckConnected() const;

	static char Normalize(char axis);
	static char AxisFromPropertyName(const char* name);

	std::map<char, AxisInfo> axes_;
	std::string axisLetters_;  // active axes, controller order
	std::string motorAxes_;    // as reported by the controller
	bool usePWM_;
	std::string pwmState_;
	std::vector<std::string> postInitProperties_;
	std::vector<AxisTargetUm> pendingTargets_;  // non-blocking micron move in progress
};

#endif // MS2000CONTROLLER_H
