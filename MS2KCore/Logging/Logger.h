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

#include "LogSink.h"
#include "Metadata.h"

#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>


namespace MS2K
{
namespace logging
{


/**
 * Distributes entries to the registered sinks. Thread-safe.
 */
class LoggingCore : public std::enable_shared_from_this<LoggingCore>
{
   mutable std::mutex mutex_;
   std::vector< std::shared_ptr<LogSink> > sinks_;

public:
   void AddSink(std::shared_ptr<LogSink> sink);
   void RemoveSink(std::shared_ptr<LogSink> sink);
   size_t GetSinkCount() const;

   void SendEntry(const Metadata& metadata, const std::string& text);

   // Create a logger bound to this core and a component label
   class Logger NewLogger(const std::string& componentLabel);
};


/**
 * Lightweight, copyable handle used by components to emit entries. A
 * default-constructed logger discards everything.
 */
class Logger
{
   std::shared_ptr<LoggingCore> core_;
   LoggerData loggerData_;

public:
   Logger() : loggerData_("") {}
   Logger(std::shared_ptr<LoggingCore> core, const std::string& label) :
      core_(core),
      loggerData_(label)
   {}

   void operator()(LogLevel level, const std::string& text) const
   {
      if (!core_)
         return;
      StampData stamp;
      stamp.Stamp();
      core_->SendEntry(Metadata(loggerData_, EntryData(level), stamp), text);
   }

   const char* GetLabel() const { return loggerData_.GetComponentLabel(); }
   bool IsEnabled() const { return static_cast<bool>(core_); }
};


inline Logger
LoggingCore::NewLogger(const std::string& componentLabel)
{
   return Logger(shared_from_this(), componentLabel);
}


/**
 * Collects streamed text and emits it as a single entry on destruction.
 */
class LogStream
{
   const Logger& logger_;
   LogLevel level_;
   std::ostringstream stream_;

public:
   LogStream(const Logger& logger, LogLevel level) :
      logger_(logger), level_(level)
   {}

   ~LogStream() { logger_(level_, stream_.str()); }

   template <typename T>
   LogStream& operator<<(const T& value)
   {
      stream_ << value;
      return *this;
   }

private:
   LogStream(const LogStream&);
   LogStream& operator=(const LogStream&);
};


} // namespace logging
} // namespace MS2K


#define LOG_WITH_LEVEL(logger, level) \
   ::MS2K::logging::LogStream((logger), (level))

#define LOG_TRACE(logger) LOG_WITH_LEVEL((logger), ::MS2K::logging::LogLevelTrace)
#define LOG_DEBUG(logger) LOG_WITH_LEVEL((logger), ::MS2K::logging::LogLevelDebug)
#define LOG_INFO(logger) LOG_WITH_LEVEL((logger), ::MS2K::logging::LogLevelInfo)
#define LOG_WARNING(logger) LOG_WITH_LEVEL((logger), ::MS2K::logging::LogLevelWarning)
#define LOG_ERROR(logger) LOG_WITH_LEVEL((logger), ::MS2K::logging::LogLevelError)
#define LOG_FATAL(logger) LOG_WITH_LEVEL((logger), ::MS2K::logging::LogLevelFatal)
