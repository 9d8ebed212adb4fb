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

#include "Metadata.h"
#include "MetadataFormatter.h"

#include <fstream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>


namespace MS2K
{
namespace logging
{


class CannotOpenFileException : public std::runtime_error
{
public:
   explicit CannotOpenFileException(const std::string& filename) :
      std::runtime_error("Cannot open log file " + filename)
   {}
};


/**
 * Destination of log entries. Entries below the sink's level are dropped.
 * Consume() is called with the core's lock held, so implementations need
 * no locking of their own.
 */
class LogSink
{
   LogLevel level_;

public:
   LogSink() : level_(LogLevelTrace) {}
   virtual ~LogSink() {}

   void SetLevel(LogLevel level) { level_ = level; }
   LogLevel GetLevel() const { return level_; }
   bool Accepts(LogLevel level) const { return level >= level_; }

   virtual void Consume(const Metadata& metadata, const std::string& text) = 0;
};


/**
 * Writes formatted entries to a stream: one line per line of entry text,
 * continuation lines aligned under the bracketed prefix.
 */
class StreamLogSink : public LogSink
{
   internal::MetadataFormatter formatter_;

protected:
   void WriteEntry(std::ostream& stream, const Metadata& metadata,
         const std::string& text);
};


class StdErrLogSink : public StreamLogSink
{
public:
   void Consume(const Metadata& metadata, const std::string& text);
};


class FileLogSink : public StreamLogSink
{
   std::string filename_;
   std::ofstream fileStream_;

public:
   // Throws CannotOpenFileException
   FileLogSink(const std::string& filename, bool append = false);
   ~FileLogSink();

   const std::string& GetFilename() const { return filename_; }

   void Consume(const Metadata& metadata, const std::string& text);
};


/**
 * Writes unformatted entry text to an arbitrary stream; used by tests and
 * by callers that want to capture adapter traffic.
 */
class PlainStreamLogSink : public LogSink
{
   std::ostream& stream_;

public:
   explicit PlainStreamLogSink(std::ostream& stream) : stream_(stream) {}

   void Consume(const Metadata& metadata, const std::string& text);
};


} // namespace logging
} // namespace MS2K
