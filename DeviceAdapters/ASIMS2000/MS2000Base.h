/*
 * Project: ASIMS2000 Device Adapter
 * License/Copyright: BSD 3-clause, see license.txt
 */

#ifndef MS2000BASE_H
#define MS2000BASE_H

#include "MS2KDevice.h"
#include "Property.h"
#include "Logging/Logging.h"

#include "ASIMS2000.h"
#include "MS2000Protocol.h"
#include "MS2000Version.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

// Communication and property plumbing shared by MS-2000 devices.
//
// Every command is answered by exactly one reply line, so the channel is
// either idle or awaiting a reply. A command sent while a reply is pending
// is refused. A reply that times out or cannot be parsed leaves unknown
// bytes on the line; the receive buffer is purged before the next command.
class MS2000Base {
public:
	MS2000Base(std::unique_ptr<MS2K::Serial> serial, const MS2K::logging::Logger& logger);
	virtual ~MS2000Base();

	int ClearPort();
	int SendCommand(const MS2000Command& command);
	int SendCommand(const std::string& command);
	int ReadReply(MS2000Reply& reply);
	int ReadRawAnswer(std::string& answer);

	// Send and parse the reply; ":N-n" is returned as ERR_OFFSET + n
	int QueryCommand(const MS2000Command& command, MS2000Reply& reply);
	// Send and require an acknowledgement
	int QueryCommandACK(const MS2000Command& command);
	// Raw exchange for diagnostics, answer is returned unparsed
	int QueryCommand(const std::string& command, std::string& answer);

	bool IsAwaitingReply() const { return awaitingReply_; }
	bool NeedsResync() const { return needsResync_; }

	// property access
	int SetProperty(const char* name, const char* value);
	int GetProperty(const char* name, std::string& value) const;
	int GetProperty(const char* name, double& value) const;
	int GetProperty(const char* name, long& value) const;
	bool HasProperty(const char* name) const;
	std::vector<std::string> GetPropertyNames() const;
	int GetPropertyLimits(const char* name, double& lower, double& upper) const;
	bool IsPropertyPreInit(const char* name) const;
	bool IsPropertyReadOnly(const char* name) const;

	bool GetErrorText(int errorCode, char* text) const;

protected:
	int CreateProperty(const char* name, const char* value, MS2K::PropertyType eType,
		bool readOnly, MS2K::ActionFunctor* pAct = 0, bool isPreInitProperty = false);
	int AddAllowedValue(const char* name, const char* value);
	int SetPropertyLimits(const char* name, double low, double high);
	void SetErrorText(int errorCode, const char* text);
	void InitializeDefaultErrorMessages();

	int OnVersion(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnBuildName(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	int OnCompileDate(MS2K::PropertyBase* pProp, MS2K::ActionType eAct);
	// Free text answers ("V", "BU", "BU X", "CD") that do not follow the reply grammar
	int QueryInformation(const char* command, std::string& text);
	int GetVersion(std::string& version);
	int GetBuildName(std::string& buildName);
	int GetCompileDate(std::string& compileDate);

	static constexpr unsigned SERIAL_RXBUFFER_SIZE = 2048;

	std::unique_ptr<MS2K::Serial> serial_;
	MS2K::logging::Logger logger_;
	MS2K::PropertyCollection properties_;

	std::string port_;
	bool initialized_;
	bool awaitingReply_;
	bool needsResync_;

	Version version_;
	std::string firmwareVersion_;
	std::string firmwareBuild_;
	std::string firmwareDate_;

private:
	std::map<int, std::string> messages_;

	MS2000Base(const MS2000Base&);
	MS2000Base& operator=(const MS2000Base&);
};

#endif // MS2000BASE_H
