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

#include "LogManager.h"

#include <memory>
#include <mutex>

namespace MS2K
{

const char* StringForLogLevel(logging::LogLevel level)
{
   switch (level)
   {
      case logging::LogLevelTrace: return "trace";
      case logging::LogLevelDebug: return "debug";
      case logging::LogLevelInfo: return "info";
      case logging::LogLevelWarning: return "warning";
      case logging::LogLevelError: return "error";
      case logging::LogLevelFatal: return "fatal";
      default: return "(unknown)";
   }
}


bool LogLevelFromString(const std::string& name, logging::LogLevel& level)
{
   static const logging::LogLevel levels[] = {
      logging::LogLevelTrace, logging::LogLevelDebug, logging::LogLevelInfo,
      logging::LogLevelWarning, logging::LogLevelError, logging::LogLevelFatal,
   };
   for (size_t i = 0; i < sizeof(levels) / sizeof(levels[0]); ++i)
   {
      if (name == StringForLogLevel(levels[i]))
      {
         level = levels[i];
         return true;
      }
   }
   return false;
}


LogManager::LogManager() :
   loggingCore_(std::make_shared<logging::LoggingCore>()),
   internalLogger_(loggingCore_->NewLogger("LogManager")),
   primaryLogLevel_(logging::LogLevelInfo),
   usingStdErr_(false)
{}


void
LogManager::SetUseStdErr(bool flag)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (flag == usingStdErr_)
      return;

   usingStdErr_ = flag;
   if (flag)
   {
      if (!stdErrSink_)
         stdErrSink_ = std::make_shared<logging::StdErrLogSink>();
      stdErrSink_->SetLevel(primaryLogLevel_);
      loggingCore_->AddSink(stdErrSink_);

      LOG_INFO(internalLogger_) << "Enabled logging to stderr";
   }
   else
   {
      LOG_INFO(internalLogger_) << "Disabling logging to stderr";
      loggingCore_->RemoveSink(stdErrSink_);
   }
}


void
LogManager::SetPrimaryLogFilename(const std::string& filename, bool truncate)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (filename == primaryFilename_)
      return;

   if (primaryFileSink_)
   {
      LOG_INFO(internalLogger_) << "Closing primary log file " <<
         primaryFilename_;
      loggingCore_->RemoveSink(primaryFileSink_);
      primaryFileSink_.reset();
   }
   primaryFilename_.clear();

   if (filename.empty())
      return;

   std::shared_ptr<logging::LogSink> newSink;
   try
   {
      newSink = std::make_shared<logging::FileLogSink>(filename, !truncate);
   }
   catch (const logging::CannotOpenFileException&)
   {
      LOG_ERROR(internalLogger_) << "Failed to open file " <<
         filename << " as primary log file";
      throw;
   }

   newSink->SetLevel(primaryLogLevel_);
   loggingCore_->AddSink(newSink);
   primaryFileSink_ = newSink;
   primaryFilename_ = filename;
   LOG_INFO(internalLogger_) << "Enabled primary log file " <<
      primaryFilename_;
}


bool
LogManager::IsUsingPrimaryLogFile() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return !primaryFilename_.empty();
}


void
LogManager::SetPrimaryLogLevel(logging::LogLevel level)
{
   std::lock_guard<std::mutex> lock(mutex_);

   if (level == primaryLogLevel_)
      return;

   logging::LogLevel oldLevel = primaryLogLevel_;
   primaryLogLevel_ = level;

   LOG_INFO(internalLogger_) << "Switching primary log level from " <<
      StringForLogLevel(oldLevel) << " to " << StringForLogLevel(level);

   if (stdErrSink_)
      stdErrSink_->SetLevel(level);
   if (primaryFileSink_)
      primaryFileSink_->SetLevel(level);
}


logging::LogLevel
LogManager::GetPrimaryLogLevel() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return primaryLogLevel_;
}


void
LogManager::AddSink(std::shared_ptr<logging::LogSink> sink)
{
   loggingCore_->AddSink(sink);
}


void
LogManager::RemoveSink(std::shared_ptr<logging::LogSink> sink)
{
   loggingCore_->RemoveSink(sink);
}


logging::Logger
LogManager::NewLogger(const std::string& label)
{
   return loggingCore_->NewLogger(label);
}

} // namespace MS2K
