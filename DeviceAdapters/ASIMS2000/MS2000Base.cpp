/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#include "MS2000Base.h"

#include "DeviceUtils.h"

#include <cstring>
#include <utility>

MS2000Base::MS2000Base(std::unique_ptr<MS2K::Serial> serial, const MS2K::logging::Logger& logger) :
	serial_(std::move(serial)),
	logger_(logger),
	port_("Undefined"),
	initialized_(false),
	awaitingReply_(false),
	needsResync_(false),
	firmwareVersion_("Undefined"),
	firmwareBuild_("Undefined"),
	firmwareDate_("Undefined")
{
	InitializeDefaultErrorMessages();
}

MS2000Base::~MS2000Base()
{
}

// Clear contents of serial port
int MS2000Base::ClearPort()
{
	if (!serial_->IsOpen())
	{
		return MS2K_NOT_CONNECTED;
	}
	int ret = serial_->Purge();
	if (ret != MS2K_OK)
	{
		return ret;
	}
	needsResync_ = false;
	return MS2K_OK;
}

int MS2000Base::SendCommand(const MS2000Command& command)
{
	if (!command.HasKnownVerb())
	{
		LOG_ERROR(logger_) << "Refusing command with unknown verb: " << command.Format();
		return MS2K_UNSUPPORTED_COMMAND;
	}
	return SendCommand(command.Format());
}

// Communication "send" utility function:
int MS2000Base::SendCommand(const std::string& command)
{
	if (awaitingReply_)
	{
		LOG_ERROR(logger_) << "Cannot send " << command << " while a reply is pending";
		return ERR_COMMAND_PENDING;
	}
	if (!serial_->IsOpen())
	{
		return MS2K_NOT_CONNECTED;
	}
	if (needsResync_)
	{
		LOG_DEBUG(logger_) << "Purging receive buffer before " << command;
		int ret = ClearPort();
		if (ret != MS2K_OK)
		{
			return ret;
		}
	}

	LOG_DEBUG(logger_) << "Sending command: " << command;
	int ret = serial_->SetCommand(command.c_str(), g_SerialCommandTerm);
	if (ret != MS2K_OK)
	{
		needsResync_ = true;
		return ret;
	}
	awaitingReply_ = true;
	return MS2K_OK;
}

int MS2000Base::ReadRawAnswer(std::string& answer)
{
	answer.clear();
	if (!awaitingReply_)
	{
		LOG_WARNING(logger_) << "Reading a reply without a command";
	}
	awaitingReply_ = false;

	// block/wait for the answer (or until we time out)
	char buf[SERIAL_RXBUFFER_SIZE] = { '\0' };
	int ret = serial_->GetAnswer(buf, SERIAL_RXBUFFER_SIZE, g_SerialAnswerTerm);
	if (ret != MS2K_OK)
	{
		needsResync_ = true;
		if (ret == MS2K_SERIAL_TIMEOUT)
		{
			LOG_ERROR(logger_) << "No reply within " << serial_->GetAnswerTimeoutMs() << " ms";
		}
		return ret;
	}
	answer = buf;
	LOG_DEBUG(logger_) << "Received reply: " << CDeviceUtils::EscapeControlCharacters(answer);
	return MS2K_OK;
}

int MS2000Base::ReadReply(MS2000Reply& reply)
{
	std::string answer;
	int ret = ReadRawAnswer(answer);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = MS2000Reply::Parse(answer, reply);
	if (ret != MS2K_OK)
	{
		needsResync_ = true;
		LOG_ERROR(logger_) << "Unrecognized reply: " << CDeviceUtils::EscapeControlCharacters(answer);
		return ret;
	}
	if (reply.GetIgnoredCount() > 0)
	{
		LOG_WARNING(logger_) << "Ignored " << reply.GetIgnoredCount() << " token(s) in reply: " << answer;
	}
	return MS2K_OK;
}

// Communication "send & receive" utility function:
int MS2000Base::QueryCommand(const MS2000Command& command, MS2000Reply& reply)
{
	int ret = SendCommand(command);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	ret = ReadReply(reply);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	if (reply.GetType() == MS2000Reply::Error)
	{
		LOG_DEBUG(logger_) << command.Format() << " failed: " <<
			MS2000ControllerErrorText(reply.GetErrorNumber());
	}
	return reply.ToStatus();
}

// Communication "send, receive, and look for acknowledgement" utility function:
int MS2000Base::QueryCommandACK(const MS2000Command& command)
{
	MS2000Reply reply;
	int ret = QueryCommand(command, reply);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	// the controller only acknowledges receipt of the command
	if (!reply.IsAcknowledged())
	{
		return ERR_UNRECOGNIZED_ANSWER;
	}
	return MS2K_OK;
}

int MS2000Base::QueryCommand(const std::string& command, std::string& answer)
{
	int ret = SendCommand(command);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	return ReadRawAnswer(answer);
}

int MS2000Base::QueryInformation(const char* command, std::string& text)
{
	std::string answer;
	int ret = QueryCommand(command, answer);
	if (ret != MS2K_OK)
	{
		return ret;
	}

	MS2000Reply reply;
	if (MS2000Reply::Parse(answer, reply) == MS2K_OK && reply.GetType() == MS2000Reply::Error)
	{
		return reply.ToStatus();
	}

	// strip the acknowledgement and surrounding blanks
	size_t start = 0;
	if (answer.compare(0, 2, ":A") == 0)
	{
		start = 2;
	}
	start = answer.find_first_not_of(" \t", start);
	if (start == std::string::npos)
	{
		text.clear();
		return MS2K_OK;
	}
	const size_t end = answer.find_last_not_of(" \t\r\n");
	text = answer.substr(start, end - start + 1);
	return MS2K_OK;
}

int MS2000Base::GetVersion(std::string& version)
{
	std::string text;
	int ret = QueryInformation("V", text);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	// "Version: USB-9.2k"
	const std::string label = "Version:";
	if (text.compare(0, label.size(), label) != 0)
	{
		return ERR_UNRECOGNIZED_ANSWER;
	}
	const size_t start = text.find_first_not_of(' ', label.size());
	version = (start == std::string::npos) ? std::string() : text.substr(start);
	return MS2K_OK;
}

int MS2000Base::GetBuildName(std::string& buildName)
{
	return QueryInformation("BU", buildName);
}

int MS2000Base::GetCompileDate(std::string& compileDate)
{
	return QueryInformation("CD", compileDate);
}

// Get the version of this controller
int MS2000Base::OnVersion(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	if (eAct == MS2K::BeforeGet)
	{
		pProp->Set(firmwareVersion_.c_str());
	}
	return MS2K_OK;
}

// Get the build name of this controller
int MS2000Base::OnBuildName(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	if (eAct == MS2K::BeforeGet)
	{
		pProp->Set(firmwareBuild_.c_str());
	}
	return MS2K_OK;
}

// Get the compile date of this controller
int MS2000Base::OnCompileDate(MS2K::PropertyBase* pProp, MS2K::ActionType eAct)
{
	if (eAct == MS2K::BeforeGet)
	{
		pProp->Set(firmwareDate_.c_str());
	}
	return MS2K_OK;
}

int MS2000Base::SetProperty(const char* name, const char* value)
{
	MS2K::Property* pProp = properties_.Find(name);
	if (!pProp)
	{
		return MS2K_INVALID_PROPERTY;
	}
	// the port handler reports its own error
	if (initialized_ && pProp->GetInitStatus() && strcmp(name, MS2K::g_Keyword_Port) != 0)
	{
		return ERR_PRE_INIT_PROPERTY;
	}
	return properties_.Set(name, value);
}

int MS2000Base::GetProperty(const char* name, std::string& value) const
{
	return properties_.Get(name, value);
}

int MS2000Base::GetProperty(const char* name, double& value) const
{
	std::string text;
	int ret = properties_.Get(name, text);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	MS2K::Property* pProp = properties_.Find(name);
	if (!pProp->Get(value))
	{
		return MS2K_INVALID_PROPERTY_TYPE;
	}
	return MS2K_OK;
}

int MS2000Base::GetProperty(const char* name, long& value) const
{
	std::string text;
	int ret = properties_.Get(name, text);
	if (ret != MS2K_OK)
	{
		return ret;
	}
	MS2K::Property* pProp = properties_.Find(name);
	if (!pProp->Get(value))
	{
		return MS2K_INVALID_PROPERTY_TYPE;
	}
	return MS2K_OK;
}

bool MS2000Base::HasProperty(const char* name) const
{
	return properties_.Find(name) != 0;
}

std::vector<std::string> MS2000Base::GetPropertyNames() const
{
	return properties_.GetNames();
}

int MS2000Base::GetPropertyLimits(const char* name, double& lower, double& upper) const
{
	MS2K::Property* pProp = properties_.Find(name);
	if (!pProp)
	{
		return MS2K_INVALID_PROPERTY;
	}
	if (!pProp->HasLimits())
	{
		return MS2K_NO_PROPERTY_DATA;
	}
	lower = pProp->GetLowerLimit();
	upper = pProp->GetUpperLimit();
	return MS2K_OK;
}

bool MS2000Base::IsPropertyPreInit(const char* name) const
{
	MS2K::Property* pProp = properties_.Find(name);
	return pProp != 0 && pProp->GetInitStatus();
}

bool MS2000Base::IsPropertyReadOnly(const char* name) const
{
	MS2K::Property* pProp = properties_.Find(name);
	return pProp != 0 && pProp->GetReadOnly();
}

int MS2000Base::CreateProperty(const char* name, const char* value, MS2K::PropertyType eType,
	bool readOnly, MS2K::ActionFunctor* pAct, bool isPreInitProperty)
{
	return properties_.CreateProperty(name, value, eType, readOnly, pAct, isPreInitProperty);
}

int MS2000Base::AddAllowedValue(const char* name, const char* value)
{
	return properties_.AddAllowedValue(name, value);
}

int MS2000Base::SetPropertyLimits(const char* name, double low, double high)
{
	return properties_.SetLimits(name, low, high);
}

void MS2000Base::SetErrorText(int errorCode, const char* text)
{
	messages_[errorCode] = text;
}

bool MS2000Base::GetErrorText(int errorCode, char* text) const
{
	std::map<int, std::string>::const_iterator it = messages_.find(errorCode);
	if (it != messages_.end())
	{
		CDeviceUtils::CopyLimitedString(text, it->second.c_str());
		return true;
	}
	if (errorCode >= ERR_OFFSET && errorCode < ERR_OFFSET_END)
	{
		const std::string msg = "Controller reported: " + MS2000ControllerErrorText(errorCode - ERR_OFFSET);
		CDeviceUtils::CopyLimitedString(text, msg.c_str());
		return true;
	}
	CDeviceUtils::CopyLimitedString(text, "Unknown error");
	return false;
}

void MS2000Base::InitializeDefaultErrorMessages()
{
	SetErrorText(MS2K_ERR, "Unknown error in the device");
	SetErrorText(MS2K_INVALID_PROPERTY, "Invalid property name encountered");
	SetErrorText(MS2K_INVALID_PROPERTY_VALUE, "Invalid property value");
	SetErrorText(MS2K_DUPLICATE_PROPERTY, "Duplicate property names are not allowed");
	SetErrorText(MS2K_INVALID_PROPERTY_TYPE, "Invalid property type");
	SetErrorText(MS2K_NO_PROPERTY_DATA, "No data associated with this property");
	SetErrorText(MS2K_NOT_CONNECTED, "Serial port is not open");
	SetErrorText(MS2K_SERIAL_TIMEOUT, "No answer from the controller within the answer timeout");
	SetErrorText(MS2K_SERIAL_BUFFER_OVERRUN, "Reply does not fit the receive buffer");
	SetErrorText(MS2K_SERIAL_COMMAND_FAILED, "Serial command failed");
	SetErrorText(MS2K_SERIAL_INVALID_RESPONSE, "Invalid response from the serial port");
	SetErrorText(MS2K_INVALID_INPUT_PARAM, "Invalid input parameter");
	SetErrorText(MS2K_UNSUPPORTED_COMMAND, "Command not supported by the controller");
	SetErrorText(MS2K_NOT_INITIALIZED, "Controller is not initialized");

	SetErrorText(ERR_PORT_CHANGE_FORBIDDEN, "You can't change the port after device has been initialized");
	SetErrorText(ERR_UNRECOGNIZED_ANSWER, "The controller replied with an answer that does not match the protocol");
	SetErrorText(ERR_INVALID_AXIS, "The axis is not present on this controller");
	SetErrorText(ERR_OUT_OF_RANGE, "Value outside the allowed range");
	SetErrorText(ERR_COMMAND_PENDING, "A command is already awaiting its reply");
	SetErrorText(ERR_NO_IDENTIFICATION, "The controller did not identify itself");
	SetErrorText(ERR_WAIT_TIMEOUT, "The stage did not become idle within the allowed time");
	SetErrorText(ERR_VERIFY_FAILED, "The value read back differs from the value set");
	SetErrorText(ERR_POSITION_NOT_REACHED, "The stage stopped outside the requested precision");
	SetErrorText(ERR_UNEXPECTED_VALUE_COUNT, "The reply carries an unexpected number of values");
	SetErrorText(ERR_PORT_UNAVAILABLE, "Cannot open the serial port");
	SetErrorText(ERR_PRE_INIT_PROPERTY, "This property can only be changed before initialization");
}
