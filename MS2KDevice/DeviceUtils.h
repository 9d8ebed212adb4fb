///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.h
// PROJECT:       MS2000 Adapter
// SUBSYSTEM:     MS2KDevice - Device adapter kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Class with utility methods for building device adapters
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
//

#pragma once

#include "MS2KDeviceConstants.h"
#include <vector>
#include <string>

class CDeviceUtils
{
public:
   static bool CopyLimitedString(char* pszTarget, const char* pszSource);
   static const char* ConvertToString(long lnVal);
   static const char* ConvertToString(double dVal);
   static const char* ConvertToString(int val);
   static void Tokenize(const std::string& str, std::vector<std::string>& tokens, const std::string& delimiters = ",");
   static void SleepMs(long ms);
   static std::string EscapeControlCharacters(const std::string& text);
private:
   static char m_pszBuffer[MS2K::MaxStrLength];
};
