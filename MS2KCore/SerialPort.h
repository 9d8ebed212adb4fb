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

#include "../MS2KDevice/MS2KDevice.h"

#include <boost/asio.hpp>

#include <memory>
#include <string>

namespace MS2K
{

/**
 * Serial channel backed by a Boost.Asio serial_port. Reads are bounded by
 * the answer timeout; bytes received past a terminator are kept for the
 * next GetAnswer() call.
 */
class SerialPort : public Serial
{
   boost::asio::io_context io_;
   std::unique_ptr<boost::asio::serial_port> port_;
   std::string portName_;
   SerialSettings settings_;
   std::string pending_;
   logging::Logger logger_;

public:
   explicit SerialPort(logging::Logger logger = logging::Logger());
   ~SerialPort();

   int Open(const char* portName, const SerialSettings& settings);
   int Close();
   bool IsOpen() const;
   std::string GetPortName() const { return portName_; }

   int SetCommand(const char* command, const char* term);
   int GetAnswer(char* txt, unsigned maxChars, const char* term);
   int Write(const unsigned char* buf, unsigned long bufLen);
   int Read(unsigned char* buf, unsigned long bufLen, unsigned long& charsRead);
   int Purge();

   void SetAnswerTimeoutMs(double timeoutMs) { settings_.answerTimeoutMs = timeoutMs; }
   double GetAnswerTimeoutMs() const { return settings_.answerTimeoutMs; }

private:
   // Waits at most timeoutMs for some bytes and appends them to pending_.
   // Returns MS2K_SERIAL_TIMEOUT if nothing arrived.
   int ReadSomeWithTimeout(double timeoutMs);

   SerialPort(const SerialPort&);
   SerialPort& operator=(const SerialPort&);
};

} // namespace MS2K
