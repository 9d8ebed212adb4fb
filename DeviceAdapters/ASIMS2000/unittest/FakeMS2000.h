#pragma once

#include "MS2KDevice.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

// In-memory MS-2000 speaking the serial protocol. Every command written
// with SetCommand() queues its reply; GetAnswer() hands it out line by
// line and reports a timeout when nothing is queued.
class FakeMS2000 : public MS2K::Serial
{
public:
   explicit FakeMS2000(const std::string& axes = "XYZ") :
      open_(false),
      failOpen_(false),
      timeoutMs_(2000.0),
      axes_(axes),
      version_("USB-9.2k"),
      reportMotorAxes_(true),
      busyPolls_(0),
      busyRemaining_(0),
      moveOffset_(0),
      silentCount_(0),
      lateReply_(false),
      purgeCount_(0),
      ttlIn_(0),
      ttlOut_(0),
      led_(50)
   {
      for (size_t i = 0; i < axes_.size(); ++i)
      {
         const char a = axes_[i];
         position_[a] = 0;
         speed_[a] = 1.0;
         acceleration_[a] = 100;
         settle_[a] = 0;
         precisionMm_[a] = 0.004;
      }
   }

   // MS2K::Serial
   int Open(const char* portName, const MS2K::SerialSettings& settings)
   {
      if (failOpen_)
         return MS2K_NOT_CONNECTED;
      port_ = portName;
      settings_ = settings;
      timeoutMs_ = settings.answerTimeoutMs;
      open_ = true;
      return MS2K_OK;
   }

   int Close()
   {
      open_ = false;
      return MS2K_OK;
   }

   bool IsOpen() const { return open_; }
   std::string GetPortName() const { return port_; }

   int SetCommand(const char* command, const char* term)
   {
      if (!open_)
         return MS2K_NOT_CONNECTED;
      terms_.push_back(term);
      writes_.push_back(command);
      Respond(command);
      return MS2K_OK;
   }

   int GetAnswer(char* txt, unsigned maxChars, const char* term)
   {
      if (!open_)
         return MS2K_NOT_CONNECTED;
      const size_t end = rx_.find(term);
      if (end == std::string::npos)
      {
         if (lateReply_)
         {
            // the reply shows up after the caller gave up
            rx_ += late_;
            late_.clear();
         }
         return MS2K_SERIAL_TIMEOUT;
      }
      if (end + 1 > maxChars)
         return MS2K_SERIAL_BUFFER_OVERRUN;
      std::strncpy(txt, rx_.c_str(), end);
      txt[end] = '\0';
      rx_.erase(0, end + std::strlen(term));
      return MS2K_OK;
   }

   int Write(const unsigned char* buf, unsigned long bufLen)
   {
      return SetCommand(std::string(reinterpret_cast<const char*>(buf), bufLen).c_str(), "");
   }

   int Read(unsigned char* buf, unsigned long bufLen, unsigned long& charsRead)
   {
      charsRead = 0;
      while (charsRead < bufLen && !rx_.empty())
      {
         buf[charsRead++] = static_cast<unsigned char>(rx_[0]);
         rx_.erase(0, 1);
      }
      return MS2K_OK;
   }

   int Purge()
   {
      ++purgeCount_;
      rx_.clear();
      late_.clear();
      return MS2K_OK;
   }

   void SetAnswerTimeoutMs(double timeoutMs) { timeoutMs_ = timeoutMs; }
   double GetAnswerTimeoutMs() const { return timeoutMs_; }

   // Simulation controls
   void SetFailOpen(bool fail) { failOpen_ = fail; }
   void SetVersion(const std::string& version) { version_ = version; }
   void SetReportMotorAxes(bool report) { reportMotorAxes_ = report; }
   // Number of "/" or "RS" polls answered busy after each move
   void SetBusyPolls(int polls) { busyPolls_ = polls; }
   // Counts added to every move target
   void SetMoveOffset(long counts) { moveOffset_ = counts; }
   // The next count commands get no reply; with lateReply the reply arrives
   // after GetAnswer() has timed out.
   void SetSilent(int count, bool lateReply)
   {
      silentCount_ = count;
      lateReply_ = lateReply;
   }
   // Answer the next command starting with prefix with reply instead
   void InjectReply(const std::string& prefix, const std::string& reply)
   {
      injected_.push_back(std::make_pair(prefix, reply));
   }
   // Queue bytes without any command
   void QueueRaw(const std::string& bytes) { rx_ += bytes; }

   long GetPosition(char axis) const
   {
      std::map<char, long>::const_iterator it = position_.find(axis);
      return it == position_.end() ? 0 : it->second;
   }
   void SetPosition(char axis, long counts) { position_[axis] = counts; }
   double GetSpeed(char axis) { return speed_[axis]; }
   long GetTTLIn() const { return ttlIn_; }
   long GetTTLOut() const { return ttlOut_; }
   long GetLED() const { return led_; }

   const std::vector<std::string>& GetWrites() const { return writes_; }
   const std::vector<std::string>& GetTerminators() const { return terms_; }
   void ClearWrites() { writes_.clear(); terms_.clear(); }
   int GetPurgeCount() const { return purgeCount_; }
   const MS2K::SerialSettings& GetSettings() const { return settings_; }

   size_t CountWrites(const std::string& command) const
   {
      size_t n = 0;
      for (size_t i = 0; i < writes_.size(); ++i)
         if (writes_[i] == command)
            ++n;
      return n;
   }

   bool HasWrite(const std::string& command) const { return CountWrites(command) > 0; }

private:
   struct Arg
   {
      char axis;
      std::string op;    // "", "?" or "="
      std::string value;
   };

   void Respond(const std::string& command)
   {
      std::string reply = Evaluate(command);
      for (std::deque<std::pair<std::string, std::string> >::iterator it = injected_.begin();
            it != injected_.end(); ++it)
      {
         if (command.compare(0, it->first.size(), it->first) == 0)
         {
            reply = it->second;
            injected_.erase(it);
            break;
         }
      }

      if (silentCount_ > 0)
      {
         --silentCount_;
         if (lateReply_)
            late_ += reply + "\r\n";
         return;
      }
      rx_ += reply + "\r\n";
   }

   bool HasAxis(char axis) const { return axes_.find(axis) != std::string::npos; }

   static std::string Float(char axis, double value)
   {
      char buf[64];
      std::snprintf(buf, sizeof(buf), "%c=%.6f", axis, value);
      return buf;
   }

   static std::string Integer(char axis, long value)
   {
      std::ostringstream os;
      os << axis << '=' << value;
      return os.str();
   }

   std::string Evaluate(const std::string& command)
   {
      std::istringstream in(command);
      std::string verb;
      in >> verb;
      for (size_t i = 0; i < verb.size(); ++i)
         verb[i] = static_cast<char>(std::toupper(static_cast<unsigned char>(verb[i])));

      std::vector<Arg> args;
      std::string token;
      while (in >> token)
      {
         Arg arg;
         arg.axis = static_cast<char>(std::toupper(static_cast<unsigned char>(token[0])));
         if (token.size() > 1)
         {
            arg.op = token.substr(1, 1);
            arg.value = token.substr(2);
         }
         args.push_back(arg);
      }

      if (verb == "V")
         return ":A Version: " + version_;
      if (verb == "CD")
         return ":A Oct 17 2026:09:30:00";
      if (verb == "BU")
      {
         if (args.empty())
            return ":A STD_XYZ";
         if (!reportMotorAxes_)
            return ":N-1";
         std::string list;
         for (size_t i = 0; i < axes_.size(); ++i)
            list += std::string(i ? " " : "") + axes_[i];
         return ":A STD_XYZ\rMotor Axes: " + list + "\rAxis Types: x x x";
      }
      if (verb == "HALT")
      {
         busyRemaining_ = 0;
         return ":N-21";
      }
      if (verb == "/")
      {
         if (busyRemaining_ > 0)
         {
            --busyRemaining_;
            return "B";
         }
         return "N";
      }
      if (verb == "TTL" || verb == "LED")
         return EvaluateOutput(verb, args);

      for (size_t i = 0; i < args.size(); ++i)
      {
         if (!HasAxis(args[i].axis))
            return ":N-2";
      }
      if (args.empty())
         return ":N-3";

      if (verb == "W")
      {
         std::ostringstream os;
         os << ":A";
         for (size_t i = 0; i < args.size(); ++i)
            os << ' ' << position_[args[i].axis];
         return os.str();
      }
      if (verb == "M" || verb == "R")
      {
         for (size_t i = 0; i < args.size(); ++i)
         {
            const long value = std::atol(args[i].value.c_str());
            long& pos = position_[args[i].axis];
            pos = (verb == "M" ? value : pos + value) + moveOffset_;
         }
         busyRemaining_ = busyPolls_;
         return ":A";
      }
      if (verb == "RS")
      {
         if (busyRemaining_ > 0)
         {
            --busyRemaining_;
            return ":A 11";
         }
         return ":A 10";
      }
      if (verb == "!" || verb == "H")
      {
         for (size_t i = 0; i < args.size(); ++i)
            position_[args[i].axis] = 0;
         return ":A";
      }
      if (verb == "S")
         return Parameter(args[0], speed_, true, ":A ");
      if (verb == "PC")
         return Parameter(args[0], precisionMm_, true, ":A ");
      if (verb == "AC")
         return Parameter(args[0], acceleration_, false, ":A ");
      if (verb == "WT")
         return Parameter(args[0], settle_, false, ":");
      return ":N-1";
   }

   template <typename T>
   std::string Parameter(const Arg& arg, std::map<char, T>& store, bool isFloat,
         const std::string& prefix)
   {
      if (arg.op == "?")
      {
         if (isFloat)
            return prefix + Float(arg.axis, static_cast<double>(store[arg.axis]));
         return prefix + Integer(arg.axis, static_cast<long>(store[arg.axis]));
      }
      if (arg.op == "=")
      {
         store[arg.axis] = static_cast<T>(std::atof(arg.value.c_str()));
         return ":A";
      }
      return ":N-3";
   }

   std::string EvaluateOutput(const std::string& verb, const std::vector<Arg>& args)
   {
      if (args.size() != 1)
         return ":N-3";
      const Arg& arg = args[0];
      if (verb == "LED")
      {
         if (arg.axis != 'X')
            return ":N-2";
         if (arg.op == "?")
            return Integer('X', led_) + " :A";
         led_ = std::atol(arg.value.c_str());
         return ":A";
      }

      long& code = (arg.axis == 'X') ? ttlIn_ : ttlOut_;
      if (arg.axis != 'X' && arg.axis != 'Y')
         return ":N-2";
      if (arg.op == "?")
         return ":A " + Integer(arg.axis, code);
      code = std::atol(arg.value.c_str());
      return ":A";
   }

   bool open_;
   bool failOpen_;
   std::string port_;
   MS2K::SerialSettings settings_;
   double timeoutMs_;

   std::string axes_;
   std::string version_;
   bool reportMotorAxes_;
   int busyPolls_;
   int busyRemaining_;
   long moveOffset_;
   int silentCount_;
   bool lateReply_;
   int purgeCount_;

   std::map<char, long> position_;
   std::map<char, double> speed_;
   std::map<char, long> acceleration_;
   std::map<char, long> settle_;
   std::map<char, double> precisionMm_;
   long ttlIn_;
   long ttlOut_;
   long led_;

   std::string rx_;
   std::string late_;
   std::deque<std::pair<std::string, std::string> > injected_;
   std::vector<std::string> writes_;
   std::vector<std::string> terms_;
};
