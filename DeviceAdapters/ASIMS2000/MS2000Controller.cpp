/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#include "MS2000Controller.h"

#include "DeviceUtils.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <utility>

MS2000Controller::MS2000Controller(std::unique_ptr<MS2K::Serial> serial, const MS2K::logging::Logger& logger) :
	MS2000Base(std::move(serial), logger),
	usePWM_(false)
{
	CreatePreInitProperties();
}

MS2000Controller::~MS2000Controller()
{
	Shutdown();
}

void MS2000Controller::GetName(char* name) const
{
	CDeviceUtils::CopyLimitedString(name, g_MS2000DeviceName);
}

void MS2000Controller::CreatePreInitProperties()
{
	// Name
	CreateProperty(MS2K::g_Keyword_Name, g_MS2000DeviceName, MS2K::String, true);

	// Description
	CreateProperty(MS2K::g_Keyword_Description, g_MS2000DeviceDescription, MS2K::String, true);

	// Port
	CPropertyAction* pAct = new CPropertyAction(this, &MS2000Controller::OnPort);
	CreateProperty(MS2K::g_Keyword_Port, "Undefined", MS2K::String, false, pAct, true);

	// serial settings, fixed once the port is open
	CreateProperty(MS2K::g_Keyword_BaudRate, "9600", MS2K::String, false, 0, true);
	AddAllowedValue(MS2K::g_Keyword_BaudRate, "9600");
	AddAllowedValue(MS2K::g_Keyword_BaudRate, "19200");
	AddAllowedValue(MS2K::g_Keyword_BaudRate, "28800");
	AddAllowedValue(MS2K::g_Keyword_BaudRate, "115200");

	CreateProperty(MS2K::g_Keyword_AnswerTimeout, "2000.0", MS2K::Float, false, 0, true);
	SetPropertyLimits(MS2K::g_Keyword_AnswerTimeout, 1.0, 60000.0);

	CreateProperty(MS2K::g_Keyword_Parity, MS2K::g_ParityNone, MS2K::String, false, 0, true);
	properties_.AddAllowedValue(MS2K::g_Keyword_Parity, MS2K::g_ParityNone, MS2K::ParityNone);
	properties_.AddAllowedValue(MS2K::g_Keyword_Parity, MS2K::g_ParityEven, MS2K::ParityEven);
	properties_.AddAllowedValue(MS2K::g_Keyword_Parity, MS2K::g_ParityOdd, MS2K::ParityOdd);

	CreateProperty(MS2K::g_Keyword_StopBits, "1", MS2K::String, false, 0, true);
	properties_.AddAllowedValue(MS2K::g_Keyword_StopBits, "1", 1);
	properties_.AddAllowedValue(MS2K::g_Keyword_StopBits, "2", 2);

	CreateProperty(MS2K::g_Keyword_Handshaking, MS2K::g_Off, MS2K::String, false, 0, true);
	properties_.AddAllowedValue(MS2K::g_Keyword_Handshaking, MS2K::g_Off, 0);
	properties_.AddAllowedValue(MS2K::g_Keyword_Handshaking, MS2K::g_Hardware, 1);

	// empty means all axes the controller reports
	CreateProperty(g_Keyword_Axes, "", MS2K::String, false, 0, true);

	CreateProperty(g_Keyword_UsePWM, MS2K::g_No, MS2K::String, false, 0, true);
	AddAllowedValue(g_Keyword_UsePWM, MS2K::g_No);
	AddAllowedValue(g_Keyword_UsePWM, MS2K::g_Yes);

	CreateProperty(g_Keyword_ApplyMotionDefaults, MS2K::g_Yes, MS2K::String, false, 0, true);
	AddAllowedValue(g_Keyword_ApplyMotionDefaults, MS2K::g_No);
	AddAllowedValue(g_Keyword_ApplyMotionDefaults, MS2K::g_Yes);

	for (const char* p = g_ConfigurableAxes; *p != '\0'; p++)
	{
		CreateAxisPreInitProperties(*p);
	}

	CreateProperty(g_Keyword_BlockingMoveTimeout, "60000", MS2K::Integer, false);
	SetPropertyLimits(g_Keyword_BlockingMoveTimeout, 0, 3600000);
}

void MS2000Controller::CreateAxisPreInitProperties(char axis)
{
	const std::string letter(1, axis);

	const std::string screw = g_LeadScrewPrefix + letter;
	CreateProperty(screw.c_str(), g_DefaultLeadScrew, MS2K::String, false, 0, true);
	const std::vector<std::string> names = GetLeadScrewNames();
	for (size_t i = 0; i < names.size(); i++)
	{
		AddAllowedValue(screw.c_str(), names[i].c_str());
	}

	// equal limits mean the travel range is unknown
	const std::string minTravel = g_MinTravelPrefix + letter + g_TravelSuffix;
	CreateProperty(minTravel.c_str(), "0", MS2K::Float, false, 0, true);
	const std::string maxTravel = g_MaxTravelPrefix + letter + g_TravelSuffix;
	CreateProperty(maxTravel.c_str(), "0", MS2K::Float, false, 0, true);

	const std::string counts = g_EncoderCountsPrefix + letter;
	CreateProperty(counts.c_str(), "10", MS2K::Integer, false, 0, true);
	SetPropertyLimits(counts.c_str(), 1, 1000);
}

int MS2000Controller::Open(const char* port, long baudRate, double answerTimeoutMs)
{
	if (initialized_)
	{
		return (port_ == port) ? MS2K_OK : ERR_PORT_CHANGE_FORBIDDEN;
	}

	int ret = SetProperty(MS2K::g_Keyword_Port, port);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = SetProperty(MS2K::g_Keyword_BaudRate, CDeviceUtils::ConvertToString(baudRate));
	if (ret != MS2K_OK)
	{
		LOG_ERROR(logger_) << "Unsupported baud rate " << baudRate;
		return ret;
	}
	ret = SetProperty(MS2K::g_Keyword_AnswerTimeout, CDeviceUtils::ConvertToString(answerTimeoutMs));
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return Initialize();
}

int MS2000Controller::Initialize()
{
	if (initialized_)
	{
		return MS2K_OK;
	}

	LOG_INFO(logger_) << "Opening controller on " << port_;
	int ret = OpenPort();
	if (ret != MS2K_OK)
	{
		return ret;
	}

	ret = SetUpController();
	if (ret != MS2K_OK)
	{
		char text[MS2K::MaxStrLength];
		GetErrorText(ret, text);
		LOG_ERROR(logger_) << "Initialization failed: " << text;
		RemovePostInitProperties();
		ClearAxes();
		awaitingReply_ = false;
		needsResync_ = false;
		if (serial_->Close() != MS2K_OK)
		{
			LOG_WARNING(logger_) << "Could not close " << port_;
		}
		return ret;
	}

	initialized_ = true;
	LOG_INFO(logger_) << "Controller " << firmwareVersion_ << " ready, axes " <<
		(axisLetters_.empty() ? std::string("(none)") : axisLetters_);
	return MS2K_OK;
}

int MS2000Controller::OpenPort()
{
	if (port_.empty() || port_ == "Undefined")
	{
		LOG_ERROR(logger_) << "No serial port configured";
		return ERR_PORT_UNAVAILABLE;
	}

	MS2K::SerialSettings settings;
	std::string text;
	GetProperty(MS2K::g_Keyword_BaudRate, text);
	settings.baudRate = atol(text.c_str());
	GetProperty(MS2K::g_Keyword_AnswerTimeout, settings.answerTimeoutMs);
	long parity = 0;
	long stopBits = 1;
	long handshaking = 0;
	int ret = properties_.GetCurrentPropertyData(MS2K::g_Keyword_Parity, parity);
	if (ret == MS2K_OK)
	{
		ret = properties_.GetCurrentPropertyData(MS2K::g_Keyword_StopBits, stopBits);
	}
	if (ret == MS2K_OK)
	{
		ret = properties_.GetCurrentPropertyData(MS2K::g_Keyword_Handshaking, handshaking);
	}
	if (ret != MS2K_OK)
	{
		return ret;
	}
	settings.parity = static_cast<MS2K::Parity>(parity);
	settings.stopBits = static_cast<unsigned>(stopBits);
	settings.hardwareHandshaking = (handshaking != 0);

	ret = serial_->Open(port_.c_str(), settings);
	if (ret != MS2K_OK)
	{
		LOG_ERROR(logger_) << "Cannot open serial port " << port_;
		return ERR_PORT_UNAVAILABLE;
	}
	awaitingReply_ = false;
	needsResync_ = false;

	// empty the Rx serial buffer before sending the first command
	return ClearPort();
}

int MS2000Controller::SetUpController()
{
	int ret = IdentifyController();
	if (ret != MS2K_OK)
	{
		return ret;
	}

	ret = ReadMotorAxes();
	if (ret != MS2K_OK)
	{
		return ret;
	}

	ret = ConfigureAxes();
	if (ret != MS2K_OK)
	{
		return ret;
	}

	std::string value;
	GetProperty(g_Keyword_ApplyMotionDefaults, value);
	if (value == MS2K::g_Yes)
	{
		ret = ApplyMotionDefaults();
	}
	else
	{
		// cache the precision used to check blocking moves
		for (size_t i = 0; i < axisLetters_.size() && ret == MS2K_OK; i++)
		{
			double precisionUm = 0.0;
			ret = GetPrecision(axisLetters_[i], precisionUm);
		}
	}
	if (ret != MS2K_OK)
	{
		return ret;
	}

	GetProperty(g_Keyword_UsePWM, value);
	usePWM_ = (value == MS2K::g_Yes);
	pwmState_.clear();
	if (usePWM_)
	{
		ret = SetPWMState(g_PWM_Off);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		ret = SetPWMIntensity(1);
		if (ret != MS2K_OK)
		{
			return ret;
		}
	}

	return CreatePostInitProperties();
}

int MS2000Controller::IdentifyController()
{
	int ret = GetVersion(firmwareVersion_);
	if (ret == MS2K_SERIAL_TIMEOUT || ret == MS2K_SERIAL_BUFFER_OVERRUN || ret == ERR_UNRECOGNIZED_ANSWER)
	{
		LOG_ERROR(logger_) << "No MS-2000 identification on " << port_;
		return ERR_NO_IDENTIFICATION;
	}
	if (ret != MS2K_OK)
	{
		return ret;
	}

	version_ = Version::ParseString(firmwareVersion_);
	if (firmwareVersion_ != g_SupportedVersion)
	{
		LOG_WARNING(logger_) << "Firmware " << firmwareVersion_ <<
			" has not been qualified, expected " << g_SupportedVersion;
	}

	ret = GetCompileDate(firmwareDate_);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return GetBuildName(firmwareBuild_);
}

int MS2000Controller::ReadMotorAxes()
{
	motorAxes_.clear();

	// "BU X" lists the motor axes on one of its lines: "Motor Axes: X Y Z"
	std::string text;
	int ret = QueryInformation("BU X", text);
	if (ret == MS2K_OK)
	{
		const std::string label = "Motor Axes:";
		const size_t pos = text.find(label);
		if (pos != std::string::npos)
		{
			const size_t start = pos + label.size();
			const size_t end = text.find_first_of("\r\n", start);
			const std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
			std::vector<std::string> tokens;
			CDeviceUtils::Tokenize(line, tokens, " \t");
			for (size_t i = 0; i < tokens.size(); i++)
			{
				if (tokens[i].size() == 1 && std::isalpha(static_cast<unsigned char>(tokens[i][0])))
				{
					const char letter = Normalize(tokens[i][0]);
					if (motorAxes_.find(letter) == std::string::npos)
					{
						motorAxes_ += letter;
					}
				}
			}
		}
	}
	else if (ret < ERR_OFFSET || ret >= ERR_OFFSET_END)
	{
		return ret;
	}

	if (motorAxes_.empty())
	{
		LOG_DEBUG(logger_) << "No axis list from BU X, probing axes";
		for (const char* p = g_ConfigurableAxes; *p != '\0'; p++)
		{
			bool present = false;
			ret = ProbeAxis(*p, present);
			if (ret != MS2K_OK)
			{
				return ret;
			}
			if (present)
			{
				motorAxes_ += *p;
			}
		}
	}

	if (motorAxes_.empty())
	{
		LOG_WARNING(logger_) << "Controller reports no motor axes";
	}
	else
	{
		LOG_INFO(logger_) << "Motor axes: " << motorAxes_;
	}
	return MS2K_OK;
}

int MS2000Controller::ProbeAxis(char axis, bool& present)
{
	present = false;
	MS2000Reply reply;
	int ret = QueryCommand(MS2000Command("W").Axis(axis), reply);
	if (ret >= ERR_OFFSET && ret < ERR_OFFSET_END)
	{
		// ":N-2", the axis is not there
		return MS2K_OK;
	}
	if (ret != MS2K_OK)
	{
		return ret;
	}
	present = reply.GetValues().size() == 1 && reply.GetValues()[0].numeric;
	return MS2K_OK;
}

int MS2000Controller::ConfigureAxes()
{
	std::string configured;
	GetProperty(g_Keyword_Axes, configured);

	std::string wanted;
	for (size_t i = 0; i < configured.size(); i++)
	{
		const char c = configured[i];
		if (c == ',' || c == ' ' || c == '\t')
		{
			continue;
		}
		if (!std::isalpha(static_cast<unsigned char>(c)))
		{
			LOG_ERROR(logger_) << "Invalid axis list \"" << configured << "\"";
			return MS2K_INVALID_PROPERTY_VALUE;
		}
		const char letter = Normalize(c);
		if (motorAxes_.find(letter) == std::string::npos)
		{
			LOG_ERROR(logger_) << "Axis " << letter << " is not reported by the controller";
			return ERR_INVALID_AXIS;
		}
		if (wanted.find(letter) == std::string::npos)
		{
			wanted += letter;
		}
	}
	if (wanted.empty())
	{
		wanted = motorAxes_;
	}

	axes_.clear();
	axisLetters_.clear();
	for (size_t i = 0; i < wanted.size(); i++)
	{
		AxisInfo info;
		info.letter = wanted[i];
		std::string screwName = g_DefaultLeadScrew;

		if (strchr(g_ConfigurableAxes, info.letter) != 0)
		{
			const std::string letter(1, info.letter);
			GetProperty((g_LeadScrewPrefix + letter).c_str(), screwName);
			GetProperty((g_MinTravelPrefix + letter + g_TravelSuffix).c_str(), info.minTravelMm);
			GetProperty((g_MaxTravelPrefix + letter + g_TravelSuffix).c_str(), info.maxTravelMm);
			GetProperty((g_EncoderCountsPrefix + letter).c_str(), info.countsPerUm);
		}
		if (!FindLeadScrew(screwName, info.screw))
		{
			return MS2K_INVALID_PROPERTY_VALUE;
		}
		if (info.minTravelMm > info.maxTravelMm)
		{
			LOG_ERROR(logger_) << "Axis " << info.letter << ": minimum travel above maximum";
			return MS2K_INVALID_PROPERTY_VALUE;
		}
		info.limitsKnown = info.minTravelMm < info.maxTravelMm;

		axes_[info.letter] = info;
		axisLetters_ += info.letter;

		LOG_DEBUG(logger_) << "Axis " << info.letter << ": lead screw " << info.screw.name <<
			", " << info.countsPerUm << " counts/um, travel " <<
			(info.limitsKnown ? "" : "unknown ") << info.minTravelMm << " to " << info.maxTravelMm << " mm";
	}
	return MS2K_OK;
}

int MS2000Controller::ApplyMotionDefaults()
{
	for (size_t i = 0; i < axisLetters_.size(); i++)
	{
		const AxisInfo& info = axes_[axisLetters_[i]];
		int ret = SetSpeed(info.letter, 0.67 * info.screw.maxVelocityMmps);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		ret = SetAcceleration(info.letter, MinAccelerationMs);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		ret = SetSettleTime(info.letter, 0);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		ret = SetPrecision(info.letter, MinPrecisionUm);
		if (ret != MS2K_OK)
		{
			return ret;
		}
	}
	return MS2K_OK;
}

int MS2000Controller::AddPostInitProperty(const std::string& name, const char* value,
	MS2K::PropertyType eType, bool readOnly, MS2K::ActionFunctor* pAct)
{
	int ret = CreateProperty(name.c_str(), value, eType, readOnly, pAct);
	if (ret == MS2K_OK)
	{
		postInitProperties_.push_back(name);
	}
	return ret;
}

int MS2000Controller::CreatePostInitProperties()
{
	int ret = AddPostInitProperty(g_Keyword_Version, "", MS2K::String, true,
		new CPropertyAction(this, &MS2000Controller::OnVersion));
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = AddPostInitProperty(g_Keyword_BuildName, "", MS2K::String, true,
		new CPropertyAction(this, &MS2000Controller::OnBuildName));
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = AddPostInitProperty(g_Keyword_CompileDate, "", MS2K::String, true,
		new CPropertyAction(this, &MS2000Controller::OnCompileDate));
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = AddPostInitProperty(g_Keyword_MotorAxes, "", MS2K::String, true,
		new CPropertyAction(this, &MS2000Controller::OnMotorAxes));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	for (size_t i = 0; i < axisLetters_.size(); i++)
	{
		const AxisInfo& info = axes_[axisLetters_[i]];
		const std::string letter(1, info.letter);

		const std::string speed = g_SpeedPrefix + letter + g_SpeedSuffix;
		ret = AddPostInitProperty(speed, "0", MS2K::Float, false,
			new CPropertyAction(this, &MS2000Controller::OnSpeed));
		if (ret != MS2K_OK)
		{
			return ret;
		}
		SetPropertyLimits(speed.c_str(), 0.0, info.screw.maxVelocityMmps);

		const std::string acceleration = g_AccelerationPrefix + letter + g_MsSuffix;
		ret = AddPostInitProperty(acceleration, "25", MS2K::Integer, false,
			new CPropertyAction(this, &MS2000Controller::OnAcceleration));
		if (ret != MS2K_OK)
		{
			return ret;
		}
		SetPropertyLimits(acceleration.c_str(), MinAccelerationMs, MaxAccelerationMs);

		const std::string settle = g_SettleTimePrefix + letter + g_MsSuffix;
		ret = AddPostInitProperty(settle, "0", MS2K::Integer, false,
			new CPropertyAction(this, &MS2000Controller::OnSettleTime));
		if (ret != MS2K_OK)
		{
			return ret;
		}
		SetPropertyLimits(settle.c_str(), 0, MaxSettleTimeMs);

		const std::string precision = g_PrecisionPrefix + letter + g_UmSuffix;
		ret = AddPostInitProperty(precision, "1", MS2K::Float, false,
			new CPropertyAction(this, &MS2000Controller::OnPrecision));
		if (ret != MS2K_OK)
		{
			return ret;
		}
		SetPropertyLimits(precision.c_str(), MinPrecisionUm, MaxPrecisionUm);
	}

	if (usePWM_)
	{
		ret = AddPostInitProperty(g_Keyword_PWMState, g_PWM_Off, MS2K::String, false,
			new CPropertyAction(this, &MS2000Controller::OnPWMState));
		if (ret != MS2K_OK)
		{
			return ret;
		}
		AddAllowedValue(g_Keyword_PWMState, g_PWM_Off);
		AddAllowedValue(g_Keyword_PWMState, g_PWM_On);
		AddAllowedValue(g_Keyword_PWMState, g_PWM_PWM);
		AddAllowedValue(g_Keyword_PWMState, g_PWM_External);

		ret = AddPostInitProperty(g_Keyword_PWMIntensity, "1", MS2K::Integer, false,
			new CPropertyAction(this, &MS2000Controller::OnPWMIntensity));
		if (ret != MS2K_OK)
		{
			return ret;
		}
		SetPropertyLimits(g_Keyword_PWMIntensity, 1, 99);
	}
	return MS2K_OK;
}

void MS2000Controller::RemovePostInitProperties()
{
	for (size_t i = 0; i < postInitProperties_.size(); i++)
	{
		properties_.Delete(postInitProperties_[i].c_str());
	}
	postInitProperties_.clear();
}

int MS2000Controller::Shutdown()
{
	return Close();
}

int MS2000Controller::Close()
{
	if (!serial_->IsOpen())
	{
		initialized_ = false;
		return MS2K_OK;
	}

	if (awaitingReply_)
	{
		// the pending reply is of no use any more
		awaitingReply_ = false;
		needsResync_ = true;
	}

	int ret = MS2K_OK;
	if (initialized_ && usePWM_ && pwmState_ != g_PWM_Off)
	{
		LOG_INFO(logger_) << "Switching PWM output off";
		ret = SetPWMState(g_PWM_Off);
		if (ret != MS2K_OK)
		{
			LOG_ERROR(logger_) << "Could not switch PWM output off";
		}
	}

	int closeRet = serial_->Close();
	if (ret == MS2K_OK)
	{
		ret = closeRet;
	}
	needsResync_ = false;
	RemovePostInitProperties();
	ClearAxes();
	initialized_ = false;
	LOG_INFO(logger_) << "Closed controller on " << port_;
	return ret;
}

bool MS2000Controller::Busy()
{
	bool busy = false;
	return IsBusy(busy) == MS2K_OK && busy;
}

bool MS2000Controller::HasAxis(char axis) const
{
	return FindAxis(axis) != 0;
}

int MS2000Controller::GetLeadScrew(char axis, LeadScrew& screw) const
{
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	screw = info->screw;
	return MS2K_OK;
}

int MS2000Controller::GetEncoderCountsPerUm(char axis, long& counts) const
{
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	counts = info->countsPerUm;
	return MS2K_OK;
}

int MS2000Controller::GetTravelLimits(char axis, bool& known, long& minPosition, long& maxPosition) const
{
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	known = info->limitsKnown;
	minPosition = UmToCounts(*info, info->minTravelMm * 1000.0);
	maxPosition = UmToCounts(*info, info->maxTravelMm * 1000.0);
	return MS2K_OK;
}

/////////////////////////////////////////////////////////////////////////////
// Motion
/////////////////////////////////////////////////////////////////////////////

int MS2000Controller::MoveAxis(char axis, long target, bool relative)
{
	return MoveAxes(std::vector<AxisTarget>(1, AxisTarget(axis, target)), relative);
}

int MS2000Controller::MoveAxes(const std::vector<AxisTarget>& targets, bool relative)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	for (size_t i = 0; i < targets.size(); i++)
	{
		if (!FindAxis(targets[i].axis))
		{
			LOG_ERROR(logger_) << "Move refused, no axis " << targets[i].axis;
			return ERR_INVALID_AXIS;
		}
	}
	ret = FinishMoving();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return SendMove(targets, relative);
}

int MS2000Controller::SendMove(const std::vector<AxisTarget>& targets, bool relative)
{
	if (targets.empty())
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	// validate every axis before anything goes to the controller
	std::vector<const AxisInfo*> infos;
	std::string movedAxes;
	for (size_t i = 0; i < targets.size(); i++)
	{
		const AxisInfo* info = FindAxis(targets[i].axis);
		if (!info)
		{
			LOG_ERROR(logger_) << "Move refused, no axis " << targets[i].axis;
			return ERR_INVALID_AXIS;
		}
		if (std::find(infos.begin(), infos.end(), info) != infos.end())
		{
			return MS2K_INVALID_INPUT_PARAM;
		}
		infos.push_back(info);
		movedAxes += info->letter;
	}

	// relative targets are checked against the current position
	std::vector<long> current;
	if (relative)
	{
		int ret = GetPositions(movedAxes, current);
		if (ret != MS2K_OK)
		{
			return ret;
		}
	}

	MS2000Command command(relative ? "R" : "M");
	for (size_t i = 0; i < targets.size(); i++)
	{
		long absolute = targets[i].position;
		if (relative)
		{
			const long offset = targets[i].position;
			if ((offset > 0 && current[i] > std::numeric_limits<long>::max() - offset) ||
				(offset < 0 && current[i] < std::numeric_limits<long>::min() - offset))
			{
				LOG_ERROR(logger_) << "Relative move of " << offset << " from " << current[i] <<
					" on axis " << infos[i]->letter << " overflows";
				return ERR_OUT_OF_RANGE;
			}
			absolute = current[i] + offset;
		}
		int ret = CheckTarget(*infos[i], absolute);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		command.Set(infos[i]->letter, targets[i].position);
	}

	return QueryCommandACK(command);
}

int MS2000Controller::MoveAxisUm(char axis, double um, bool relative, bool block)
{
	return MoveAxesUm(std::vector<AxisTargetUm>(1, AxisTargetUm(axis, um)), relative, block);
}

int MS2000Controller::MoveAxesUm(const std::vector<AxisTargetUm>& targets, bool relative, bool block)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (targets.empty())
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	std::string axes;
	for (size_t i = 0; i < targets.size(); i++)
	{
		const AxisInfo* info = FindAxis(targets[i].axis);
		if (!info)
		{
			LOG_ERROR(logger_) << "Move refused, no axis " << targets[i].axis;
			return ERR_INVALID_AXIS;
		}
		if (axes.find(info->letter) != std::string::npos)
		{
			return MS2K_INVALID_INPUT_PARAM;
		}
		if (!std::isfinite(targets[i].um))
		{
			LOG_ERROR(logger_) << "Invalid target " << targets[i].um << " um for axis " << info->letter;
			return ERR_OUT_OF_RANGE;
		}
		axes += info->letter;
	}

	ret = FinishMoving();
	if (ret != MS2K_OK)
	{
		return ret;
	}

	std::vector<long> current;
	if (relative)
	{
		ret = GetPositions(axes, current);
		if (ret != MS2K_OK)
		{
			return ret;
		}
	}

	std::vector<AxisTargetUm> absolute;
	std::vector<AxisTarget> counts;
	for (size_t i = 0; i < targets.size(); i++)
	{
		const AxisInfo* info = FindAxis(axes[i]);
		double targetUm = targets[i].um;
		if (relative)
		{
			targetUm += static_cast<double>(current[i]) / info->countsPerUm;
		}
		targetUm = std::round(targetUm * 1000.0) / 1000.0; // nm

		long position = 0;
		ret = TargetUmToCounts(*info, targetUm, position);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		absolute.push_back(AxisTargetUm(info->letter, targetUm));
		counts.push_back(AxisTarget(info->letter, position));
	}

	ret = SendMove(counts, false);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	pendingTargets_ = absolute;
	return block ? FinishMoving() : MS2K_OK;
}

int MS2000Controller::FinishMoving()
{
	if (pendingTargets_.empty())
	{
		return MS2K_OK;
	}

	long timeoutMs = 0;
	GetProperty(g_Keyword_BlockingMoveTimeout, timeoutMs);
	int ret = WaitUntilIdle(DefaultPollIntervalMs, timeoutMs);
	if (ret != MS2K_OK)
	{
		return ret;
	}

	std::string axes;
	for (size_t i = 0; i < pendingTargets_.size(); i++)
	{
		axes += pendingTargets_[i].axis;
	}
	std::vector<long> positions;
	ret = GetPositions(axes, positions);
	if (ret != MS2K_OK)
	{
		return ret;
	}

	// the move is over whether or not it got there
	std::vector<AxisTargetUm> targets;
	targets.swap(pendingTargets_);
	for (size_t i = 0; i < targets.size(); i++)
	{
		const AxisInfo* info = FindAxis(targets[i].axis);
		const double reachedUm = static_cast<double>(positions[i]) / info->countsPerUm;
		if (std::fabs(reachedUm - targets[i].um) > info->precisionUm)
		{
			LOG_ERROR(logger_) << "Axis " << info->letter << " stopped at " << reachedUm <<
				" um, target " << targets[i].um << " um";
			return ERR_POSITION_NOT_REACHED;
		}
	}
	return MS2K_OK;
}

int MS2000Controller::GetPosition(char axis, long& position)
{
	std::vector<long> positions;
	int ret = GetPositions(std::string(1, axis), positions);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	position = positions[0];
	return MS2K_OK;
}

int MS2000Controller::GetPositions(const std::string& axes, std::vector<long>& positions)
{
	positions.clear();
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (axes.empty())
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	MS2000Command command("W");
	for (size_t i = 0; i < axes.size(); i++)
	{
		const AxisInfo* info = FindAxis(axes[i]);
		if (!info)
		{
			return ERR_INVALID_AXIS;
		}
		command.Axis(info->letter);
	}

	MS2000Reply reply;
	ret = QueryCommand(command, reply);
	if (ret != MS2K_OK)
	{
		return ret;
	}

	// ":A 1234 5678", one value per queried axis
	const std::vector<MS2000Reply::Value>& values = reply.GetValues();
	if (values.size() != axes.size())
	{
		LOG_ERROR(logger_) << "Expected " << axes.size() << " position(s) in reply: " << reply.GetRaw();
		needsResync_ = true;
		return ERR_UNEXPECTED_VALUE_COUNT;
	}
	for (size_t i = 0; i < values.size(); i++)
	{
		if (!values[i].numeric)
		{
			needsResync_ = true;
			return ERR_UNRECOGNIZED_ANSWER;
		}
		positions.push_back(std::lround(values[i].number));
	}
	return MS2K_OK;
}

int MS2000Controller::GetPositionUm(char axis, double& um)
{
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	long position = 0;
	int ret = GetPosition(info->letter, position);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	um = static_cast<double>(position) / info->countsPerUm;
	return MS2K_OK;
}

int MS2000Controller::IsBusy(bool& busy)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}

	MS2000Reply reply;
	ret = QueryCommand(MS2000Command("/"), reply);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	// "N" not busy, "B" busy
	const std::vector<MS2000Reply::Value>& values = reply.GetValues();
	if (values.size() != 1 || !values[0].key.empty() || (values[0].text != "N" && values[0].text != "B"))
	{
		return ERR_UNRECOGNIZED_ANSWER;
	}
	busy = (values[0].text == "B");
	return MS2K_OK;
}

int MS2000Controller::IsAxisBusy(char axis, bool& busy)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}

	MS2000Reply reply;
	ret = QueryCommand(MS2000Command("RS").Axis(info->letter), reply);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	// status byte, bit 0 is set while the motor is running
	const std::vector<MS2000Reply::Value>& values = reply.GetValues();
	if (values.empty() || !values[0].numeric)
	{
		return ERR_UNRECOGNIZED_ANSWER;
	}
	busy = (std::lround(values[0].number) & 1) != 0;
	return MS2K_OK;
}

int MS2000Controller::WaitUntilIdle(long pollIntervalMs, long maxWaitMs)
{
	if (pollIntervalMs < 0 || maxWaitMs < 0)
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	for (;;)
	{
		bool busy = true;
		int ret = IsBusy(busy);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		if (!busy)
		{
			return MS2K_OK;
		}
		const long elapsedMs = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start).count());
		if (elapsedMs >= maxWaitMs)
		{
			LOG_ERROR(logger_) << "Still busy after " << elapsedMs << " ms";
			return ERR_WAIT_TIMEOUT;
		}
		CDeviceUtils::SleepMs(pollIntervalMs);
	}
}

int MS2000Controller::WaitUntilAxisIdle(char axis, long pollIntervalMs, long maxWaitMs)
{
	if (pollIntervalMs < 0 || maxWaitMs < 0)
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
	for (;;)
	{
		bool busy = true;
		int ret = IsAxisBusy(axis, busy);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		if (!busy)
		{
			return MS2K_OK;
		}
		const long elapsedMs = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start).count());
		if (elapsedMs >= maxWaitMs)
		{
			LOG_ERROR(logger_) << "Axis " << axis << " still busy after " << elapsedMs << " ms";
			return ERR_WAIT_TIMEOUT;
		}
		CDeviceUtils::SleepMs(pollIntervalMs);
	}
}

int MS2000Controller::HomeAxis(char axis)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	ret = FinishMoving();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	LOG_INFO(logger_) << "Homing axis " << info->letter;
	return QueryCommandACK(MS2000Command("!").Axis(info->letter));
}

int MS2000Controller::SetOrigin(char axis)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	ret = FinishMoving();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return QueryCommandACK(MS2000Command("H").Set(info->letter, 0L));
}

int MS2000Controller::Halt()
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	MS2000Reply reply;
	ret = QueryCommand(MS2000Command("HALT"), reply);
	// the controller answers ":N-21" once motion has been stopped
	if (ret == ERR_OFFSET + CONTROLLER_ERR_HALTED)
	{
		ret = MS2K_OK;
	}
	if (ret == MS2K_OK)
	{
		// a halted move has no target left to reach
		pendingTargets_.clear();
		LOG_INFO(logger_) << "Halted";
	}
	return ret;
}

/////////////////////////////////////////////////////////////////////////////
// Motion parameters
/////////////////////////////////////////////////////////////////////////////

// Reads "VERB A?", accepting ":A A=v", ":A=v", "A=v :A" and ":A v"
int MS2000Controller::ReadAxisParameter(const char* verb, char axis, double& value)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	MS2000Reply reply;
	ret = QueryCommand(MS2000Command(verb).Query(axis), reply);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (reply.FindValue(axis, value))
	{
		return MS2K_OK;
	}
	const std::vector<MS2000Reply::Value>& values = reply.GetValues();
	if (values.size() == 1 && values[0].key.empty() && values[0].numeric)
	{
		value = values[0].number;
		return MS2K_OK;
	}
	return ERR_UNRECOGNIZED_ANSWER;
}

int MS2000Controller::SetSpeed(char axis, double mmPerSec)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	if (!(mmPerSec >= 0.0) || mmPerSec > info->screw.maxVelocityMmps)
	{
		LOG_ERROR(logger_) << "Speed " << mmPerSec << " mm/s outside 0 to " <<
			info->screw.maxVelocityMmps << " mm/s for axis " << info->letter;
		return ERR_OUT_OF_RANGE;
	}

	const double speed = std::round(mmPerSec * 1e6) / 1e6;
	ret = QueryCommandACK(MS2000Command("S").Set(info->letter, speed, 6));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	double readBack = 0.0;
	ret = GetSpeed(info->letter, readBack);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (std::fabs(readBack - speed) > 1e-6)
	{
		LOG_ERROR(logger_) << "Speed of axis " << info->letter << " reads back " << readBack << ", set " << speed;
		return ERR_VERIFY_FAILED;
	}
	return MS2K_OK;
}

int MS2000Controller::GetSpeed(char axis, double& mmPerSec)
{
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	return ReadAxisParameter("S", info->letter, mmPerSec);
}

int MS2000Controller::SetAcceleration(char axis, long ms)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	if (ms < MinAccelerationMs || ms > MaxAccelerationMs)
	{
		return ERR_OUT_OF_RANGE;
	}

	ret = QueryCommandACK(MS2000Command("AC").Set(info->letter, ms));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	long readBack = 0;
	ret = GetAcceleration(info->letter, readBack);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (readBack != ms)
	{
		LOG_ERROR(logger_) << "Acceleration of axis " << info->letter << " reads back " << readBack << ", set " << ms;
		return ERR_VERIFY_FAILED;
	}
	return MS2K_OK;
}

int MS2000Controller::GetAcceleration(char axis, long& ms)
{
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	double value = 0.0;
	int ret = ReadAxisParameter("AC", info->letter, value);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ms = std::lround(value);
	return MS2K_OK;
}

int MS2000Controller::SetSettleTime(char axis, long ms)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	if (ms < 0 || ms > MaxSettleTimeMs)
	{
		return ERR_OUT_OF_RANGE;
	}

	ret = QueryCommandACK(MS2000Command("WT").Set(info->letter, ms));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	// the controller stores the settle time in its own ticks
	long readBack = 0;
	ret = GetSettleTime(info->letter, readBack);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (std::labs(readBack - ms) > SettleTimeToleranceMs)
	{
		LOG_ERROR(logger_) << "Settle time of axis " << info->letter << " reads back " << readBack << ", set " << ms;
		return ERR_VERIFY_FAILED;
	}
	return MS2K_OK;
}

int MS2000Controller::GetSettleTime(char axis, long& ms)
{
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	double value = 0.0;
	int ret = ReadAxisParameter("WT", info->letter, value);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ms = std::lround(value);
	return MS2K_OK;
}

int MS2000Controller::SetPrecision(char axis, double um)
{
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	const AxisInfo* info = FindAxis(axis);
	if (!info)
	{
		return ERR_INVALID_AXIS;
	}
	if (!(um >= 0.0))
	{
		return ERR_OUT_OF_RANGE;
	}
	const long precisionUm = std::lround(um);
	if (precisionUm < MinPrecisionUm || precisionUm > MaxPrecisionUm)
	{
		return ERR_OUT_OF_RANGE;
	}

	// PC takes millimetres
	ret = QueryCommandACK(MS2000Command("PC").Set(info->letter, precisionUm * 1e-3, 6));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	double readBack = 0.0;
	ret = GetPrecision(info->letter, readBack);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (std::lround(readBack) != precisionUm)
	{
		LOG_ERROR(logger_) << "Precision of axis " << info->letter << " reads back " << readBack << " um, set " << precisionUm;
		return ERR_VERIFY_FAILED;
	}
	return MS2K_OK;
}

int MS2000Controller::GetPrecision(char axis, double& um)
{
	std::map<char, AxisInfo>::iterator it = axes_.find(Normalize(axis));
	if (it == axes_.end())
	{
		return ERR_INVALID_AXIS;
	}
	double mm = 0.0;
	int ret = ReadAxisParameter("PC", it->second.letter, mm);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	um = std::round(mm * 1e3);
	it->second.precisionUm = um;
	return MS2K_OK;
}

/////////////////////////////////////////////////////////////////////////////
// TTL and LED output
/////////////////////////////////////////////////////////////////////////////

// TTL X selects the input mode, TTL Y the output mode
int MS2000Controller::SetTTLInMode(const std::string& mode)
{
	long code = 0;
	if (mode == g_TTLIn_Disabled)
	{
		code = 0;
	}
	else if (mode == g_TTLIn_ToggleTTLOut)
	{
		code = 10;
	}
	else
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = QueryCommandACK(MS2000Command("TTL").Set('X', code));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	std::string readBack;
	ret = GetTTLInMode(readBack);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return (readBack == mode) ? MS2K_OK : ERR_VERIFY_FAILED;
}

int MS2000Controller::GetTTLInMode(std::string& mode)
{
	double value = 0.0;
	int ret = ReadAxisParameter("TTL", 'X', value);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	switch (std::lround(value))
	{
	case 0:
		mode = g_TTLIn_Disabled;
		return MS2K_OK;
	case 10:
		mode = g_TTLIn_ToggleTTLOut;
		return MS2K_OK;
	}
	LOG_ERROR(logger_) << "Unexpected TTL input mode " << value;
	return ERR_UNRECOGNIZED_ANSWER;
}

int MS2000Controller::SetTTLOutMode(const std::string& mode)
{
	long code = 0;
	if (mode == g_TTLOut_Low)
	{
		code = 0;
	}
	else if (mode == g_TTLOut_High)
	{
		code = 1;
	}
	else if (mode == g_TTLOut_PWM)
	{
		code = 9;
	}
	else
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = QueryCommandACK(MS2000Command("TTL").Set('Y', code));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	std::string readBack;
	ret = GetTTLOutMode(readBack);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return (readBack == mode) ? MS2K_OK : ERR_VERIFY_FAILED;
}

int MS2000Controller::GetTTLOutMode(std::string& mode)
{
	double value = 0.0;
	int ret = ReadAxisParameter("TTL", 'Y', value);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	switch (std::lround(value))
	{
	case 0:
		mode = g_TTLOut_Low;
		return MS2K_OK;
	case 1:
		mode = g_TTLOut_High;
		return MS2K_OK;
	case 9:
		mode = g_TTLOut_PWM;
		return MS2K_OK;
	}
	LOG_ERROR(logger_) << "Unexpected TTL output mode " << value;
	return ERR_UNRECOGNIZED_ANSWER;
}

int MS2000Controller::SetPWMIntensity(long percent)
{
	if (percent < 1 || percent > 99)
	{
		return ERR_OUT_OF_RANGE;
	}
	int ret = CheckConnected();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = QueryCommandACK(MS2000Command("LED").Set('X', percent));
	if (ret != MS2K_OK)
	{
		return ret;
	}

	long readBack = 0;
	ret = GetPWMIntensity(readBack);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return (readBack == percent) ? MS2K_OK : ERR_VERIFY_FAILED;
}

// LED X? answers "X=45 :A"
int MS2000Controller::GetPWMIntensity(long& percent)
{
	double value = 0.0;
	int ret = ReadAxisParameter("LED", 'X', value);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	percent = std::lround(value);
	return MS2K_OK;
}

int MS2000Controller::SetPWMState(const std::string& state)
{
	const char* inMode = 0;
	const char* outMode = 0;
	if (state == g_PWM_Off)
	{
		inMode = g_TTLIn_Disabled;
		outMode = g_TTLOut_Low;
	}
	else if (state == g_PWM_On)
	{
		inMode = g_TTLIn_Disabled;
		outMode = g_TTLOut_High;
	}
	else if (state == g_PWM_PWM)
	{
		inMode = g_TTLIn_Disabled;
		outMode = g_TTLOut_PWM;
	}
	else if (state == g_PWM_External)
	{
		// an external signal on TTL in toggles the output
		inMode = g_TTLIn_ToggleTTLOut;
		outMode = g_TTLOut_Low;
	}
	else
	{
		return MS2K_INVALID_INPUT_PARAM;
	}

	int ret = SetTTLInMode(inMode);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = SetTTLOutMode(outMode);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	pwmState_ = state;
	LOG_DEBUG(logger_) << "PWM state " << state;
	return MS2K_OK;
}

/////////////////////////////////////////////////////////////////////////////
// Helpers
/////////////////////////////////////////////////////////////////////////////

int MS2000Controller::CheckConnected() const
{
	return serial_->IsOpen() ? MS2K_OK : MS2K_NOT_CONNECTED;
}

int MS2000Controller::CheckTarget(const AxisInfo& info, long target) const
{
	if (!info.limitsKnown)
	{
		return MS2K_OK;
	}
	const long minPosition = UmToCounts(info, info.minTravelMm * 1000.0);
	const long maxPosition = UmToCounts(info, info.maxTravelMm * 1000.0);
	if (target < minPosition || target > maxPosition)
	{
		LOG_ERROR(logger_) << "Target " << target << " of axis " << info.letter <<
			" outside travel " << minPosition << " to " << maxPosition;
		return ERR_OUT_OF_RANGE;
	}
	return MS2K_OK;
}

long MS2000Controller::UmToCounts(const AxisInfo& info, double um) const
{
	return std::lround(um * info.countsPerUm);
}

// Move target in counts; ERR_OUT_OF_RANGE unless it fits in a long
int MS2000Controller::TargetUmToCounts(const AxisInfo& info, double um, long& counts) const
{
	const double value = std::round(um * info.countsPerUm);
	// -LONG_MIN is exact as a double, LONG_MAX is not
	const double limit = -static_cast<double>(std::numeric_limits<long>::min());
	if (!std::isfinite(value) || value < -limit || value >= limit)
	{
		LOG_ERROR(logger_) << "Target " << um << " um of axis " << info.letter << " cannot be reached";
		return ERR_OUT_OF_RANGE;
	}
	counts = static_cast<long>(value);
	return MS2K_OK;
}

const MS2000Controller::AxisInfo* MS2000Controller::FindAxis(char axis) const
{
	std::map<char, AxisInfo>::const_iterator it = axes_.find(Normalize(axis));
	if (it == axes_.end())
	{
		return 0;
	}
	return &it->second;
}

void MS2000Controller::ClearAxes()
{
	axes_.clear();
	axisLetters_.clear();
	motorAxes_.clear();
	pendingTargets_.clear();
}

char MS2000Controller::Normalize(char axis)
{
	return static_cast<char>(std::toupper(static_cast<unsigned char>(axis)));
}

// "Speed-X(mm/s)" => 'X'
char MS2000Controller::AxisFromPropertyName(const char* name)
{
	const char* dash = strchr(name, '-');
	return (dash != 0) ? dash[1] : '\0';
}

/////////////////////////////////////////////////////////////////////////////
// Action handlers
/////////////////////////////////////////////////////////////////////////////

int MS2000Controller::OnPort(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	if (eAct == MS2K::BeforeGet)
	{
		pProp->Set(port_.c_str());
	}
	else if (eAct == MS2K::AfterSet)
	{
		if (initialized_)
		{
			// revert
			pProp->Set(port_.c_str());
			return ERR_PORT_CHANGE_FORBIDDEN;
		}
		pProp->Get(port_);
	}
	return MS2K_OK;
}

int MS2000Controller::OnMotorAxes(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	if (eAct == MS2K::BeforeGet)
	{
		pProp->Set(motorAxes_.c_str());
	}
	return MS2K_OK;
}

int MS2000Controller::OnSpeed(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	const char axis = AxisFromPropertyName(pProp->GetName());
	if (eAct == MS2K::BeforeGet)
	{
		double speed = 0.0;
		int ret = GetSpeed(axis, speed);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		pProp->Set(speed);
	}
	else if (eAct == MS2K::AfterSet)
	{
		double speed = 0.0;
		pProp->Get(speed);
		return SetSpeed(axis, speed);
	}
	return MS2K_OK;
}

int MS2000Controller::OnAcceleration(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	const char axis = AxisFromPropertyName(pProp->GetName());
	if (eAct == MS2K::BeforeGet)
	{
		long ms = 0;
		int ret = GetAcceleration(axis, ms);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		pProp->Set(ms);
	}
	else if (eAct == MS2K::AfterSet)
	{
		long ms = 0;
		pProp->Get(ms);
		return SetAcceleration(axis, ms);
	}
	return MS2K_OK;
}

int MS2000Controller::OnSettleTime(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	const char axis = AxisFromPropertyName(pProp->GetName());
	if (eAct == MS2K::BeforeGet)
	{
		long ms = 0;
		int ret = GetSettleTime(axis, ms);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		pProp->Set(ms);
	}
	else if (eAct == MS2K::AfterSet)
	{
		long ms = 0;
		pProp->Get(ms);
		return SetSettleTime(axis, ms);
	}
	return MS2K_OK;
}

int MS2000Controller::OnPrecision(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	const char axis = AxisFromPropertyName(pProp->GetName());
	if (eAct == MS2K::BeforeGet)
	{
		double um = 0.0;
		int ret = GetPrecision(axis, um);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		pProp->Set(um);
	}
	else if (eAct == MS2K::AfterSet)
	{
		double um = 0.0;
		pProp->Get(um);
		return SetPrecision(axis, um);
	}
	return MS2K_OK;
}

int MS2000Controller::OnPWMState(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	if (eAct == MS2K::BeforeGet)
	{
		pProp->Set(pwmState_.c_str());
	}
	else if (eAct == MS2K::AfterSet)
	{
		std::string state;
		pProp->Get(state);
		return SetPWMState(state);
	}
	return MS2K_OK;
}

int MS2000Controller::OnPWMIntensity(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	if (eAct == MS2K::BeforeGet)
	{
		long percent = 0;
		int ret = GetPWMIntensity(percent);
		if (ret != MS2K_OK)
		{
			return ret;
		}
		pProp->Set(percent);
	}
	else if (eAct == MS2K::AfterSet)
	{
		long percent = 0;
		pProp->Get(percent);
		return SetPWMIntensity(percent);
	}
	return MS2K_OK;
}
