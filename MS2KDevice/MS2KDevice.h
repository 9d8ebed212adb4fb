///////////////////////////////////////////////////////////////////////////////
// FILE:          MS2KDevice.h
// PROJECT:       MS2000 Adapter
// SUBSYSTEM:     MS2KDevice - Device adapter kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Interfaces the device adapters are written against. The
//                serial channel is abstract so that adapters can be driven
//                by a real port or by an in-memory simulation.
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

#include "MS2KDeviceConstants.h"

#include <string>

namespace MS2K {

   enum Parity {
      ParityNone,
      ParityEven,
      ParityOdd
   };

   /**
    * Line settings of a serial channel. Fixed for the lifetime of an open
    * channel; changing them requires closing and reopening.
    */
   struct SerialSettings
   {
      long baudRate;
      Parity parity;
      unsigned stopBits;
      bool hardwareHandshaking;
      double answerTimeoutMs;

      SerialSettings() :
         baudRate(9600),
         parity(ParityNone),
         stopBits(1),
         hardwareHandshaking(false),
         answerTimeoutMs(2000.0)
      {}
   };

   /**
    * Serial channel API.
    *
    * All functions return MS2K_OK or an error code. GetAnswer() blocks until
    * the terminator is seen or the answer timeout expires (returning
    * MS2K_SERIAL_TIMEOUT); the terminator is not copied into txt.
    */
   class Serial
   {
   public:
      Serial() {}
      virtual ~Serial() {}

      virtual int Open(const char* portName, const SerialSettings& settings) = 0;
      virtual int Close() = 0;
      virtual bool IsOpen() const = 0;
      virtual std::string GetPortName() const = 0;

      virtual int SetCommand(const char* command, const char* term) = 0;
      virtual int GetAnswer(char* txt, unsigned maxChars, const char* term) = 0;
      virtual int Write(const unsigned char* buf, unsigned long bufLen) = 0;
      virtual int Read(unsigned char* buf, unsigned long bufLen, unsigned long& charsRead) = 0;
      virtual int Purge() = 0;

      virtual void SetAnswerTimeoutMs(double timeoutMs) = 0;
      virtual double GetAnswerTimeoutMs() const = 0;
   };

} // namespace MS2K
