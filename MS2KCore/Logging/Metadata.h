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

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <Windows.h>
#else
#include <pthread.h>
#endif

#include <chrono>
#include <string>


namespace MS2K
{
namespace logging
{

namespace internal
{

inline std::chrono::time_point<std::chrono::system_clock>
Now()
{ return std::chrono::system_clock::now(); }


#ifdef _WIN32
typedef DWORD ThreadIdType;

inline ThreadIdType
GetTid() { return ::GetCurrentThreadId(); }
#else
typedef pthread_t ThreadIdType;

inline ThreadIdType
GetTid() { return ::pthread_self(); }
#endif


} // namespace internal


enum LogLevel
{
   LogLevelTrace,
   LogLevelDebug,
   LogLevelInfo,
   LogLevelWarning,
   LogLevelError,
   LogLevelFatal,
};


class EntryData
{
   LogLevel level_;

public:
   // Implicitly construct from LogLevel
   EntryData(LogLevel level) : level_(level) {}

   LogLevel GetLevel() const { return level_; }
};


class StampData
{
   std::chrono::time_point<std::chrono::system_clock> time_;
   internal::ThreadIdType tid_;

public:
   StampData() : tid_() {}

   void Stamp()
   {
      time_ = internal::Now();
      tid_ = internal::GetTid();
   }

   std::chrono::time_point<std::chrono::system_clock> GetTimestamp() const
   { return time_; }

   internal::ThreadIdType GetThreadId() const { return tid_; }
};


class LoggerData
{
   std::string component_;

public:
   // Construct implicitly from strings
   LoggerData(const char* componentLabel) :
      component_(componentLabel ? componentLabel : "")
   {}
   LoggerData(const std::string& componentLabel) :
      component_(componentLabel)
   {}

   const char* GetComponentLabel() const { return component_.c_str(); }
};


/**
 * Everything known about a log entry apart from its text.
 */
class Metadata
{
   LoggerData loggerData_;
   EntryData entryData_;
   StampData stampData_;

public:
   Metadata(const LoggerData& loggerData, const EntryData& entryData,
         const StampData& stampData) :
      loggerData_(loggerData),
      entryData_(entryData),
      stampData_(stampData)
   {}

   const LoggerData& GetLoggerData() const { return loggerData_; }
   const EntryData& GetEntryData() const { return entryData_; }
   const StampData& GetStampData() const { return stampData_; }
};


} // namespace logging
} // namespace MS2K
