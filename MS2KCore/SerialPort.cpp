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

#include "SerialPort.h"

#include "DeviceUtils.h"

#include <algorithm>
#include <chrono>
#include <cstring>

#ifndef _WIN32
#include <termios.h>
#endif

namespace MS2K
{

namespace
{

const size_t ReadChunkSize = 256;

} // anonymous namespace


SerialPort::SerialPort(logging::Logger logger) :
   logger_(logger)
{}


SerialPort::~SerialPort()
{
   Close();
}


int
SerialPort::Open(const char* portName, const SerialSettings& settings)
{
   namespace asio = boost::asio;

   if (IsOpen())
      Close();

   portName_ = portName ? portName : "";
   settings_ = settings;
   pending_.clear();

   boost::system::error_code ec;
   port_.reset(new asio::serial_port(io_));
   port_->open(portName_, ec);
   if (ec)
   {
      LOG_ERROR(logger_) << "Cannot open " << portName_ << ": " << ec.message();
      port_.reset();
      return MS2K_NOT_CONNECTED;
   }

   asio::serial_port_base::parity::type parity =
      asio::serial_port_base::parity::none;
   if (settings.parity == ParityEven)
      parity = asio::serial_port_base::parity::even;
   else if (settings.parity == ParityOdd)
      parity = asio::serial_port_base::parity::odd;

   port_->set_option(asio::serial_port_base::baud_rate(
            static_cast<unsigned>(settings.baudRate)), ec);
   if (!ec)
      port_->set_option(asio::serial_port_base::character_size(8), ec);
   if (!ec)
      port_->set_option(asio::serial_port_base::parity(parity), ec);
   if (!ec)
      port_->set_option(asio::serial_port_base::stop_bits(
               settings.stopBits == 2 ?
               asio::serial_port_base::stop_bits::two :
               asio::serial_port_base::stop_bits::one), ec);
   if (!ec)
      port_->set_option(asio::serial_port_base::flow_control(
               settings.hardwareHandshaking ?
               asio::serial_port_base::flow_control::hardware :
               asio::serial_port_base::flow_control::none), ec);
   if (ec)
   {
      LOG_ERROR(logger_) << "Cannot configure " << portName_ << ": " <<
         ec.message();
      port_->close(ec);
      port_.reset();
      return MS2K_NOT_CONNECTED;
   }

   LOG_INFO(logger_) << "Opened " << portName_ << " at " <<
      settings.baudRate << " baud";
   return MS2K_OK;
}


int
SerialPort::Close()
{
   if (!port_)
      return MS2K_OK;

   boost::system::error_code ec;
   port_->cancel(ec);
   port_->close(ec);
   port_.reset();
   pending_.clear();
   if (ec)
   {
      LOG_WARNING(logger_) << "Error while closing " << portName_ << ": " <<
         ec.message();
   }
   else
   {
      LOG_INFO(logger_) << "Closed " << portName_;
   }
   return MS2K_OK;
}


bool
SerialPort::IsOpen() const
{
   return port_ && port_->is_open();
}


int
SerialPort::Write(const unsigned char* buf, unsigned long bufLen)
{
   if (!IsOpen())
      return MS2K_NOT_CONNECTED;

   boost::system::error_code ec;
   boost::asio::write(*port_, boost::asio::buffer(buf, bufLen), ec);
   if (ec)
   {
      LOG_ERROR(logger_) << "Write to " << portName_ << " failed: " <<
         ec.message();
      return MS2K_SERIAL_COMMAND_FAILED;
   }
   return MS2K_OK;
}


int
SerialPort::SetCommand(const char* command, const char* term)
{
   std::string sendText(command);
   if (term != 0)
      sendText += term;

   LOG_TRACE(logger_) << "TX " <<
      CDeviceUtils::EscapeControlCharacters(sendText);
   return Write(reinterpret_cast<const unsigned char*>(sendText.data()),
         static_cast<unsigned long>(sendText.size()));
}


int
SerialPort::ReadSomeWithTimeout(double timeoutMs)
{
   char chunk[ReadChunkSize];
   size_t received = 0;
   boost::system::error_code readError;
   bool done = false;

   port_->async_read_some(boost::asio::buffer(chunk, sizeof(chunk)),
         [&](const boost::system::error_code& ec, size_t n)
         {
            readError = ec;
            received = n;
            done = true;
         });

   io_.restart();
   io_.run_for(std::chrono::microseconds(
            static_cast<long long>(timeoutMs * 1000.0)));
   if (!done)
   {
      boost::system::error_code ignored;
      port_->cancel(ignored);
      io_.restart();
      io_.run();
   }

   if (received > 0)
      pending_.append(chunk, received);

   if (readError && readError != boost::asio::error::operation_aborted)
   {
      LOG_ERROR(logger_) << "Read from " << portName_ << " failed: " <<
         readError.message();
      return MS2K_SERIAL_COMMAND_FAILED;
   }
   return received > 0 ? MS2K_OK : MS2K_SERIAL_TIMEOUT;
}


int
SerialPort::GetAnswer(char* txt, unsigned maxChars, const char* term)
{
   if (!IsOpen())
      return MS2K_NOT_CONNECTED;
   if (txt == 0 || maxChars == 0)
      return MS2K_INVALID_INPUT_PARAM;

   const std::string terminator(term ? term : "");
   typedef std::chrono::steady_clock Clock;
   const Clock::time_point deadline = Clock::now() +
      std::chrono::microseconds(
            static_cast<long long>(settings_.answerTimeoutMs * 1000.0));

   for (;;)
   {
      const size_t pos = terminator.empty() ?
         std::string::npos : pending_.find(terminator);
      if (pos != std::string::npos)
      {
         if (pos >= maxChars)
         {
            pending_.erase(0, pos + terminator.size());
            return MS2K_SERIAL_BUFFER_OVERRUN;
         }
         std::memcpy(txt, pending_.data(), pos);
         txt[pos] = '\0';
         pending_.erase(0, pos + terminator.size());
         LOG_TRACE(logger_) << "RX " <<
            CDeviceUtils::EscapeControlCharacters(std::string(txt));
         return MS2K_OK;
      }
      if (pending_.size() >= maxChars)
      {
         pending_.clear();
         return MS2K_SERIAL_BUFFER_OVERRUN;
      }

      const Clock::time_point now = Clock::now();
      if (now >= deadline)
         return MS2K_SERIAL_TIMEOUT;

      const double remainingMs = std::chrono::duration<double, std::milli>(
            deadline - now).count();
      int ret = ReadSomeWithTimeout(remainingMs);
      if (ret == MS2K_SERIAL_TIMEOUT)
      {
         LOG_DEBUG(logger_) << "No answer on " << portName_ << " within " <<
            settings_.answerTimeoutMs << " ms";
         return ret;
      }
      if (ret != MS2K_OK)
         return ret;
   }
}


int
SerialPort::Read(unsigned char* buf, unsigned long bufLen,
      unsigned long& charsRead)
{
   charsRead = 0;
   if (!IsOpen())
      return MS2K_NOT_CONNECTED;

   if (pending_.empty())
   {
      // Collect whatever is already waiting without blocking noticeably
      int ret = ReadSomeWithTimeout(1.0);
      if (ret != MS2K_OK && ret != MS2K_SERIAL_TIMEOUT)
         return ret;
   }

   const size_t n = std::min<size_t>(bufLen, pending_.size());
   std::memcpy(buf, pending_.data(), n);
   pending_.erase(0, n);
   charsRead = static_cast<unsigned long>(n);
   return MS2K_OK;
}


int
SerialPort::Purge()
{
   if (!IsOpen())
      return MS2K_NOT_CONNECTED;

   if (!pending_.empty())
   {
      LOG_DEBUG(logger_) << "Discarding " << pending_.size() <<
         " buffered bytes: " << CDeviceUtils::EscapeControlCharacters(pending_);
      pending_.clear();
   }

#ifdef _WIN32
   if (!::PurgeComm(port_->native_handle(), PURGE_RXCLEAR | PURGE_TXCLEAR))
      return MS2K_SERIAL_COMMAND_FAILED;
#else
   if (::tcflush(port_->native_handle(), TCIOFLUSH) != 0)
      return MS2K_SERIAL_COMMAND_FAILED;
#endif
   return MS2K_OK;
}

} // namespace MS2K
