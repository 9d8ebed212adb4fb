/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#ifndef _ASIMS2000_H_
#define _ASIMS2000_H_

#include "MS2KDeviceConstants.h"

#include <string>

// MS2000-specific error codes and messages
#define ERR_PORT_CHANGE_FORBIDDEN    10004
#define ERR_UNRECOGNIZED_ANSWER      10009
#define ERR_INVALID_AXIS             10013
#define ERR_OUT_OF_RANGE             10014
#define ERR_COMMAND_PENDING          10015
#define ERR_NO_IDENTIFICATION        10016
#define ERR_WAIT_TIMEOUT             10017
#define ERR_VERIFY_FAILED            10018
#define ERR_POSITION_NOT_REACHED     10019
#define ERR_UNEXPECTED_VALUE_COUNT   10020
#define ERR_PORT_UNAVAILABLE         10021
#define ERR_PRE_INIT_PROPERTY        10022

#define ERR_OFFSET 10100 // offset when reporting error number from controller
#define ERR_OFFSET_END 11100 // controller error numbers have at most three digits

// error numbers reported by the controller as ":N-<n>"
#define CONTROLLER_ERR_UNKNOWN_COMMAND       1
#define CONTROLLER_ERR_UNRECOGNIZED_AXIS     2
#define CONTROLLER_ERR_MISSING_PARAMETERS    3
#define CONTROLLER_ERR_PARAMETER_OUT_OF_RANGE 4
#define CONTROLLER_ERR_OPERATION_FAILED      5
#define CONTROLLER_ERR_UNDEFINED             6
#define CONTROLLER_ERR_INVALID_CARD_ADDRESS  7
#define CONTROLLER_ERR_HALTED                21

// external device name and description
const char* const g_MS2000DeviceName = "MS2000";
const char* const g_MS2000DeviceDescription = "ASI MS-2000 multi-axis stage controller";

// serial framing
const char* const g_SerialCommandTerm = "\r";
const char* const g_SerialAnswerTerm = "\r\n";

// the only firmware the adapter has been qualified against
const char* const g_SupportedVersion = "USB-9.2k";

// axis letters that carry per-axis pre-initialization properties
const char* const g_ConfigurableAxes = "XYZ";

// pre-initialization properties
const char* const g_Keyword_Axes = "Axes";
const char* const g_Keyword_UsePWM = "UsePWM";
const char* const g_Keyword_ApplyMotionDefaults = "ApplyMotionDefaults";
const char* const g_LeadScrewPrefix = "LeadScrew-";
const char* const g_MinTravelPrefix = "MinTravel-";
const char* const g_MaxTravelPrefix = "MaxTravel-";
const char* const g_TravelSuffix = "(mm)";
const char* const g_EncoderCountsPrefix = "EncoderCountsPerUm-";
const char* const g_Keyword_BlockingMoveTimeout = "BlockingMoveTimeout(ms)";

// read-only information properties
const char* const g_Keyword_Version = "Version";
const char* const g_Keyword_BuildName = "BuildName";
const char* const g_Keyword_CompileDate = "CompileDate";
const char* const g_Keyword_MotorAxes = "MotorAxes";

// per-axis runtime properties
const char* const g_SpeedPrefix = "Speed-";
const char* const g_SpeedSuffix = "(mm/s)";
const char* const g_AccelerationPrefix = "Acceleration-";
const char* const g_SettleTimePrefix = "SettleTime-";
const char* const g_MsSuffix = "(ms)";
const char* const g_PrecisionPrefix = "Precision-";
const char* const g_UmSuffix = "(um)";
const char* const g_Keyword_PWMState = "PWMState";
const char* const g_Keyword_PWMIntensity = "PWMIntensity(%)";

// TTL input modes
const char* const g_TTLIn_Disabled = "disabled";
const char* const g_TTLIn_ToggleTTLOut = "toggle_ttl_out";

// TTL output modes
const char* const g_TTLOut_Low = "low";
const char* const g_TTLOut_High = "high";
const char* const g_TTLOut_PWM = "pwm";

// PWM output states
const char* const g_PWM_Off = "off";
const char* const g_PWM_On = "on";
const char* const g_PWM_PWM = "pwm";
const char* const g_PWM_External = "external";

enum ErrorCategory {
	CategoryNone,          // MS2K_OK
	ConnectionError,
	TimeoutError,
	ProtocolError,
	InvalidAxisError,
	OutOfRangeError,
	ConfigurationError
};

// Classify a status code returned by the adapter.
ErrorCategory MS2000ErrorCategory(int code);
const char* ErrorCategoryName(ErrorCategory category);

// Message for a controller error number n (reported as ERR_OFFSET + n).
std::string MS2000ControllerErrorText(int n);

#endif // _ASIMS2000_H_
