///////////////////////////////////////////////////////////////////////////////
// FILE:          DeviceUtils.cpp
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

#include "DeviceUtils.h"

#include <chrono>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <thread>

char CDeviceUtils::m_pszBuffer[MS2K::MaxStrLength] = {""};

/**
 * Copies strings with predefined size limit.
 * Returns false if the source had to be truncated.
 */
bool CDeviceUtils::CopyLimitedString(char* target, const char* source)
{
   const size_t len = std::strlen(source);
   const size_t maxLen = static_cast<size_t>(MS2K::MaxStrLength) - 1;
   if (len > maxLen)
   {
      std::memcpy(target, source, maxLen);
      target[maxLen] = '\0';
      return false;
   }
   std::memcpy(target, source, len + 1);
   return true;
}

/**
 * Convert long value to string.
 *
 * This function is not thread-safe, and the return value is only valid
 * until the next call to ConvertToString().
 */
const char* CDeviceUtils::ConvertToString(long lnVal)
{
   std::snprintf(m_pszBuffer, MS2K::MaxStrLength, "%ld", lnVal);
   return m_pszBuffer;
}

/**
 * Convert int value to string.
 *
 * This function is not thread-safe, and the return value is only valid
 * until the next call to ConvertToString().
 */
const char* CDeviceUtils::ConvertToString(int intVal)
{
   return ConvertToString((long)intVal);
}

/**
 * Convert double value to string.
 *
 * This function is not thread-safe, and the return value is only valid
 * until the next call to ConvertToString().
 */
const char* CDeviceUtils::ConvertToString(double dVal)
{
   std::snprintf(m_pszBuffer, MS2K::MaxStrLength, "%.2f", dVal);
   return m_pszBuffer;
}

/**
 * Parses the string into a set of tokens.
 * Empty tokens (consecutive delimiters) are skipped.
 */
void CDeviceUtils::Tokenize(const std::string& str, std::vector<std::string>& tokens, const std::string& delimiters)
{
   // Skip delimiters at beginning.
   std::string::size_type lastPos = str.find_first_not_of(delimiters, 0);
   // Find first "non-delimiter".
   std::string::size_type pos = str.find_first_of(delimiters, lastPos);

   while (std::string::npos != pos || std::string::npos != lastPos)
   {
      tokens.push_back(str.substr(lastPos, pos - lastPos));
      lastPos = str.find_first_not_of(delimiters, pos);
      pos = str.find_first_of(delimiters, lastPos);
   }
}

void CDeviceUtils::SleepMs(long periodMs)
{
   if (periodMs <= 0)
      return;
   std::this_thread::sleep_for(std::chrono::milliseconds(periodMs));
}

// Makes \r, \n, \t and other control characters visible, for log output.
std::string CDeviceUtils::EscapeControlCharacters(const std::string& text)
{
   std::ostringstream out;
   for (char c : text)
   {
      switch (c)
      {
         case '\r': out << "\\r"; break;
         case '\n': out << "\\n"; break;
         case '\t': out << "\\t"; break;
         default:
            if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
            {
               out << "\\x" << std::setfill('0') << std::setw(2) << std::hex
                  << static_cast<unsigned int>(static_cast<unsigned char>(c));
            }
            else
            {
               out << c;
            }
      }
   }
   return out.str();
}
