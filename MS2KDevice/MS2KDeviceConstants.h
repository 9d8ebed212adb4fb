///////////////////////////////////////////////////////////////////////////////
// FILE:          MS2KDeviceConstants.h
// PROJECT:       MS2000 Adapter
// SUBSYSTEM:     MS2KDevice - Device adapter kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Global constants: status codes, property keywords and
//                limits shared by the kit, the core services and the
//                device adapters.
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

///////////////////////////////////////////////////////////////////////////////
// Global error codes
//
#define MS2K_OK                              0
#define MS2K_ERR                             1 // generic, undefined error
#define MS2K_INVALID_PROPERTY                2
#define MS2K_INVALID_PROPERTY_VALUE          3
#define MS2K_DUPLICATE_PROPERTY              4
#define MS2K_INVALID_PROPERTY_TYPE           5
#define MS2K_NO_PROPERTY_DATA                6
#define MS2K_NOT_CONNECTED                   7
#define MS2K_SERIAL_TIMEOUT                  8
#define MS2K_SERIAL_BUFFER_OVERRUN           9
#define MS2K_SERIAL_COMMAND_FAILED           10
#define MS2K_SERIAL_INVALID_RESPONSE         11
#define MS2K_INVALID_INPUT_PARAM             12
#define MS2K_UNSUPPORTED_COMMAND             13
#define MS2K_NOT_INITIALIZED                 14

namespace MS2K {

   const int MaxStrLength = 1024;

   // common property names
   const char* const g_Keyword_Name = "Name";
   const char* const g_Keyword_Description = "Description";
   const char* const g_Keyword_Port = "Port";
   const char* const g_Keyword_BaudRate = "BaudRate";
   const char* const g_Keyword_Parity = "Parity";
   const char* const g_Keyword_StopBits = "StopBits";
   const char* const g_Keyword_Handshaking = "Handshaking";
   const char* const g_Keyword_AnswerTimeout = "AnswerTimeout";

   // common property values
   const char* const g_Yes = "Yes";
   const char* const g_No = "No";
   const char* const g_Off = "Off";
   const char* const g_Hardware = "Hardware";
   const char* const g_ParityNone = "None";
   const char* const g_ParityEven = "Even";
   const char* const g_ParityOdd = "Odd";

   enum PropertyType {
      Undef,
      String,
      Float,
      Integer
   };

   enum ActionType {
      NoAction,
      BeforeGet,
      AfterSet
   };

} // namespace MS2K
