// LICENSE:       This file is distributed under the BSD license.
//                License text is included with the source distribution.
//
//                This file is distributed in the hope that it will be useful,
//                but WITHOUT ANY WARRANTY; without even the implied warranty
//                of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//
//                IN NO EVENT SHALL THE COPYRIGHT OWNER OR
//                CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT,
//                INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES.

#pragma once

#include "Logging/Logging.h"

#include <memory>
#include <mutex>
#include <string>

namespace MS2K
{

/**
 * Facade to the logging subsystem.
 */
class LogManager
{
   std::shared_ptr<logging::LoggingCore> loggingCore_;
   logging::Logger internalLogger_;

   mutable std::mutex mutex_;

   logging::LogLevel primaryLogLevel_;

   bool usingStdErr_;
   std::shared_ptr<logging::LogSink> stdErrSink_;

   std::string primaryFilename_;
   std::shared_ptr<logging::LogSink> primaryFileSink_;

public:
   LogManager();

   void SetUseStdErr(bool flag);

   // Throws logging::CannotOpenFileException; the previous file (if any)
   // is closed either way.
   void SetPrimaryLogFilename(const std::string& filename, bool truncate);
   bool IsUsingPrimaryLogFile() const;

   void SetPrimaryLogLevel(logging::LogLevel level);
   logging::LogLevel GetPrimaryLogLevel() const;

   // Adds a caller-owned sink (e.g. a PlainStreamLogSink in tests)
   void AddSink(std::shared_ptr<logging::LogSink> sink);
   void RemoveSink(std::shared_ptr<logging::LogSink> sink);

   logging::Logger NewLogger(const std::string& label);
};

// Parse "trace", "debug", "info", "warning", "error" or "fatal"
bool LogLevelFromString(const std::string& name, logging::LogLevel& level);
const char* StringForLogLevel(logging::LogLevel level);

} // namespace MS2K
