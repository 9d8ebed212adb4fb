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

#include "Logging.h"

#include <algorithm>
#include <iostream>


namespace MS2K
{
namespace logging
{


void
StreamLogSink::WriteEntry(std::ostream& stream, const Metadata& metadata,
      const std::string& text)
{
   const std::vector<std::string> lines = internal::SplitEntryIntoLines(text);

   formatter_.FormatLinePrefix(stream, metadata);
   if (lines.empty())
   {
      stream << '\n';
      return;
   }

   for (std::vector<std::string>::const_iterator it = lines.begin();
         it != lines.end(); ++it)
   {
      if (it != lines.begin())
         formatter_.FormatContinuationPrefix(stream);
      stream << ' ' << *it << '\n';
   }
}


void
StdErrLogSink::Consume(const Metadata& metadata, const std::string& text)
{
   WriteEntry(std::clog, metadata, text);
   std::clog.flush();
}


FileLogSink::FileLogSink(const std::string& filename, bool append) :
   filename_(filename)
{
   std::ios_base::openmode mode = std::ios_base::out;
   mode |= (append ? std::ios_base::app : std::ios_base::trunc);

   fileStream_.open(filename_.c_str(), mode);
   if (!fileStream_)
      throw CannotOpenFileException(filename_);
}


FileLogSink::~FileLogSink()
{
   if (fileStream_.is_open())
      fileStream_.close();
}


void
FileLogSink::Consume(const Metadata& metadata, const std::string& text)
{
   WriteEntry(fileStream_, metadata, text);
   fileStream_.flush();
}


void
PlainStreamLogSink::Consume(const Metadata& metadata, const std::string& text)
{
   stream_ << internal::LevelString(metadata.GetEntryData().GetLevel())
      << ' ' << metadata.GetLoggerData().GetComponentLabel()
      << ": " << text << '\n';
}


void
LoggingCore::AddSink(std::shared_ptr<LogSink> sink)
{
   std::lock_guard<std::mutex> lock(mutex_);
   sinks_.push_back(sink);
}


void
LoggingCore::RemoveSink(std::shared_ptr<LogSink> sink)
{
   std::lock_guard<std::mutex> lock(mutex_);
   sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}


size_t
LoggingCore::GetSinkCount() const
{
   std::lock_guard<std::mutex> lock(mutex_);
   return sinks_.size();
}


void
LoggingCore::SendEntry(const Metadata& metadata, const std::string& text)
{
   std::lock_guard<std::mutex> lock(mutex_);
   const LogLevel level = metadata.GetEntryData().GetLevel();
   for (std::vector< std::shared_ptr<LogSink> >::const_iterator it =
         sinks_.begin(); it != sinks_.end(); ++it)
   {
      if ((*it)->Accepts(level))
         (*it)->Consume(metadata, text);
   }
}


} // namespace logging
} // namespace MS2K
