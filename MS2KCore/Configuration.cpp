///////////////////////////////////////////////////////////////////////////////
// FILE:          Configuration.cpp
// PROJECT:       MS2000 Adapter
// SUBSYSTEM:     MS2KCore
//-----------------------------------------------------------------------------
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

#include "Configuration.h"

#include "../MS2KDevice/MS2KDeviceConstants.h"

#include <fstream>
#include <sstream>

namespace MS2K
{

namespace
{

const char* const g_CFGCommand_Property = "Property";
const char g_FieldSeparator = ',';

std::string Trim(const std::string& s)
{
   const char* ws = " \t\r\n";
   const size_t first = s.find_first_not_of(ws);
   if (first == std::string::npos)
      return std::string();
   const size_t last = s.find_last_not_of(ws);
   return s.substr(first, last - first + 1);
}

// Unlike CDeviceUtils::Tokenize, keeps empty fields so that an empty value
// can be configured
std::vector<std::string> SplitFields(const std::string& line)
{
   std::vector<std::string> fields;
   std::string::size_type start = 0;
   for (;;)
   {
      const std::string::size_type sep = line.find(g_FieldSeparator, start);
      if (sep == std::string::npos)
      {
         fields.push_back(line.substr(start));
         break;
      }
      fields.push_back(line.substr(start, sep - start));
      start = sep + 1;
   }
   return fields;
}

} // anonymous namespace


std::string PropertySetting::generateKey(const char* device, const char* prop)
{
   std::string key(device);
   key += "-";
   key += prop;
   return key;
}

std::string PropertySetting::getVerbose() const
{
   std::ostringstream txt;
   txt << deviceLabel_ << ":" << propertyName_ << "=" << value_;
   return txt.str();
}


void Configuration::addSetting(const PropertySetting& setting)
{
   std::map<std::string, size_t>::const_iterator it = index_.find(setting.getKey());
   if (it != index_.end())
   {
      settings_[it->second] = setting;
      return;
   }
   settings_.push_back(setting);
   index_[setting.getKey()] = settings_.size() - 1;
}

void Configuration::deleteSetting(const char* device, const char* prop)
{
   std::map<std::string, size_t>::iterator it =
      index_.find(PropertySetting::generateKey(device, prop));
   if (it == index_.end())
      return;

   settings_.erase(settings_.begin() + it->second);
   rebuildIndex();
}

bool Configuration::isPropertyIncluded(const char* device, const char* prop) const
{
   return index_.find(PropertySetting::generateKey(device, prop)) != index_.end();
}

bool Configuration::getSetting(size_t index, PropertySetting& setting) const
{
   if (index >= settings_.size())
      return false;
   setting = settings_[index];
   return true;
}

bool Configuration::getSetting(const char* device, const char* prop,
      PropertySetting& setting) const
{
   std::map<std::string, size_t>::const_iterator it =
      index_.find(PropertySetting::generateKey(device, prop));
   if (it == index_.end())
      return false;
   setting = settings_[it->second];
   return true;
}

std::vector<PropertySetting> Configuration::getSettingsForDevice(const char* device) const
{
   std::vector<PropertySetting> result;
   for (size_t i = 0; i < settings_.size(); ++i)
   {
      if (settings_[i].getDeviceLabel() == device)
         result.push_back(settings_[i]);
   }
   return result;
}

std::string Configuration::getVerbose() const
{
   std::ostringstream txt;
   for (size_t i = 0; i < settings_.size(); ++i)
      txt << settings_[i].getVerbose() << "\n";
   return txt.str();
}

void Configuration::rebuildIndex()
{
   index_.clear();
   for (size_t i = 0; i < settings_.size(); ++i)
      index_[settings_[i].getKey()] = i;
}


int LoadConfiguration(std::istream& input, Configuration& config, int& errorLine)
{
   errorLine = 0;
   std::string line;
   int lineNumber = 0;
   while (std::getline(input, line))
   {
      ++lineNumber;
      const std::string trimmed = Trim(line);
      if (trimmed.empty() || trimmed[0] == '#')
         continue;

      std::vector<std::string> fields = SplitFields(trimmed);
      // the value may itself contain commas (e.g. an axis list)
      if (fields.size() < 4 || Trim(fields[0]) != g_CFGCommand_Property)
      {
         errorLine = lineNumber;
         return MS2K_INVALID_INPUT_PARAM;
      }
      const std::string device = Trim(fields[1]);
      const std::string prop = Trim(fields[2]);
      if (device.empty() || prop.empty())
      {
         errorLine = lineNumber;
         return MS2K_INVALID_INPUT_PARAM;
      }
      std::string value = fields[3];
      for (size_t i = 4; i < fields.size(); ++i)
         value += g_FieldSeparator + fields[i];

      config.addSetting(PropertySetting(device.c_str(), prop.c_str(),
               Trim(value).c_str()));
   }
   return MS2K_OK;
}

int LoadConfigurationFile(const std::string& path, Configuration& config, int& errorLine)
{
   errorLine = 0;
   std::ifstream file(path.c_str());
   if (!file)
      return MS2K_ERR;
   return LoadConfiguration(file, config, errorLine);
}

} // namespace MS2K
