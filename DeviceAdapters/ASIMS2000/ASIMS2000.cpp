/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#include "ASIMS2000.h"

#include <sstream>

ErrorCategory MS2000ErrorCategory(int code)
{
	if (code >= ERR_OFFSET && code < ERR_OFFSET_END)
	{
		return ProtocolError;
	}

	switch (code)
	{
	case MS2K_OK:
		return CategoryNone;

	case MS2K_NOT_CONNECTED:
	case MS2K_SERIAL_COMMAND_FAILED:
	case MS2K_NOT_INITIALIZED:
	case ERR_PORT_UNAVAILABLE:
	case ERR_NO_IDENTIFICATION:
	case ERR_PORT_CHANGE_FORBIDDEN:
		return ConnectionError;

	case MS2K_SERIAL_TIMEOUT:
	case ERR_WAIT_TIMEOUT:
		return TimeoutError;

	case ERR_UNRECOGNIZED_ANSWER:
	case ERR_UNEXPECTED_VALUE_COUNT:
	case ERR_COMMAND_PENDING:
	case ERR_VERIFY_FAILED:
	case ERR_POSITION_NOT_REACHED:
	case MS2K_SERIAL_BUFFER_OVERRUN:
	case MS2K_SERIAL_INVALID_RESPONSE:
	case MS2K_UNSUPPORTED_COMMAND:
		return ProtocolError;

	case ERR_INVALID_AXIS:
		return InvalidAxisError;

	case ERR_OUT_OF_RANGE:
	case MS2K_INVALID_PROPERTY_VALUE:
	case MS2K_INVALID_INPUT_PARAM:
		return OutOfRangeError;

	default:
		// MS2K_ERR, unknown/duplicate properties, pre-init changes
		return ConfigurationError;
	}
}

const char* ErrorCategoryName(ErrorCategory category)
{
	switch (category)
	{
	case CategoryNone: return "None";
	case ConnectionError: return "ConnectionError";
	case TimeoutError: return "TimeoutError";
	case ProtocolError: return "ProtocolError";
	case InvalidAxisError: return "InvalidAxisError";
	case OutOfRangeError: return "OutOfRangeError";
	case ConfigurationError: return "ConfigurationError";
	}
	return "Unknown";
}

std::string MS2000ControllerErrorText(int n)
{
	switch (n)
	{
	case CONTROLLER_ERR_UNKNOWN_COMMAND: return "Unknown Command";
	case CONTROLLER_ERR_UNRECOGNIZED_AXIS: return "Unrecognized Axis Parameter";
	case CONTROLLER_ERR_MISSING_PARAMETERS: return "Missing Parameters";
	case CONTROLLER_ERR_PARAMETER_OUT_OF_RANGE: return "Parameter Out of Range";
	case CONTROLLER_ERR_OPERATION_FAILED: return "Operation Failed";
	case CONTROLLER_ERR_UNDEFINED: return "Undefined Error";
	case CONTROLLER_ERR_INVALID_CARD_ADDRESS: return "Invalid Card Address";
	case CONTROLLER_ERR_HALTED: return "Halted by HALT command";
	}
	std::ostringstream os;
	os << "Controller error " << n;
	return os.str();
}
