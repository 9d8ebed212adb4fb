///////////////////////////////////////////////////////////////////////////////
// FILE:          Configuration.h
// PROJECT:       MS2000 Adapter
// SUBSYSTEM:     MS2KCore
//-----------------------------------------------------------------------------
// DESCRIPTION:   Property settings read from a configuration file and applied
//                to devices before initialization
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

#include <istream>
#include <map>
#include <string>
#include <vector>

namespace MS2K
{

/**
 * Property setting defined as triplet:
 * device - property - value.
 */
struct PropertySetting
{
   PropertySetting(const char* deviceLabel, const char* prop, const char* value) :
      deviceLabel_(deviceLabel), propertyName_(prop), value_(value)
   {
      key_ = generateKey(deviceLabel, prop);
   }

   PropertySetting() {}

   std::string getDeviceLabel() const { return deviceLabel_; }
   std::string getPropertyName() const { return propertyName_; }
   std::string getPropertyValue() const { return value_; }
   std::string getKey() const { return key_; }

   static std::string generateKey(const char* device, const char* prop);

   std::string getVerbose() const;

private:
   std::string deviceLabel_;
   std::string propertyName_;
   std::string value_;
   std::string key_;
};

/**
 * Ordered collection of property settings. A later setting of the same
 * device property replaces the earlier one in place.
 */
class Configuration
{
public:
   void addSetting(const PropertySetting& setting);
   void deleteSetting(const char* device, const char* prop);

   bool isPropertyIncluded(const char* device, const char* prop) const;

   // Returns false if index is out of range
   bool getSetting(size_t index, PropertySetting& setting) const;
   bool getSetting(const char* device, const char* prop, PropertySetting& setting) const;

   // Settings for one device, in file order
   std::vector<PropertySetting> getSettingsForDevice(const char* device) const;

   size_t size() const { return settings_.size(); }
   std::string getVerbose() const;

private:
   void rebuildIndex();

   std::vector<PropertySetting> settings_;
   std::map<std::string, size_t> index_;
};

/**
 * Reads "Property,<device>,<property>,<value>" lines. Blank lines and lines
 * starting with '#' are skipped. Any other line is a syntax error;
 * errorLine receives its 1-based number.
 *
 * Returns MS2K_OK, MS2K_ERR (file cannot be opened) or
 * MS2K_INVALID_INPUT_PARAM (syntax error).
 */
int LoadConfiguration(std::istream& input, Configuration& config, int& errorLine);
int LoadConfigurationFile(const std::string& path, Configuration& config, int& errorLine);

} // namespace MS2K
