///////////////////////////////////////////////////////////////////////////////
// FILE:          Property.cpp
// PROJECT:       MS2000 Adapter
// SUBSYSTEM:     MS2KDevice - Device adapter kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   This class implements the basic property mechanism used to
//                configure devices.
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

#include "Property.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static const int BUFSIZE = 60; // For number-to-string conversion


std::vector<std::string> MS2K::Property::GetAllowedValues() const
{
   std::vector<std::string> vals;
   std::map<std::string, long>::const_iterator it;
   for (it = values_.begin(); it != values_.end(); it++)
      vals.push_back(it->first);
   return vals;
}

void MS2K::Property::AddAllowedValue(const char* value)
{
   values_.insert(std::make_pair(value, 0L));
   limits_ = false;
}

void MS2K::Property::AddAllowedValue(const char* value, long data)
{
   values_.insert(std::make_pair(value, data));
   hasData_ = true;
   limits_ = false;
}

bool MS2K::Property::IsAllowed(const char* value) const
{
   if (values_.empty())
      return true; // any value is allowed

   return values_.find(value) != values_.end();
}

bool MS2K::Property::GetData(const char* value, long& data) const
{
   if (!hasData_)
      return false;

   std::map<std::string, long>::const_iterator it = values_.find(value);
   if (it == values_.end())
      return false;

   data = it->second;
   return true;
}


///////////////////////////////////////////////////////////////////////////////
// MS2K::StringProperty
// ~~~~~~~~~~~~~~~~~~~~
//
bool MS2K::StringProperty::Set(double val)
{
   char buf[BUFSIZE];
   std::snprintf(buf, BUFSIZE, "%.2g", val);
   value_ = buf;
   return true;
}

bool MS2K::StringProperty::Set(long val)
{
   char buf[BUFSIZE];
   std::snprintf(buf, BUFSIZE, "%ld", val);
   value_ = buf;
   return true;
}

bool MS2K::StringProperty::Set(const char* val)
{
   value_ = val;
   return true;
}

bool MS2K::StringProperty::Get(double& val) const
{
   val = std::atof(value_.c_str());
   return true;
}

bool MS2K::StringProperty::Get(long& val) const
{
   val = std::atol(value_.c_str());
   return true;
}

bool MS2K::StringProperty::Get(std::string& strVal) const
{
   strVal = value_;
   return true;
}

///////////////////////////////////////////////////////////////////////////////
// MS2K::FloatProperty
// ~~~~~~~~~~~~~~~~~~~
//

double MS2K::FloatProperty::Truncate(double dVal)
{
   if (dVal >= 0)
      return std::floor(dVal * reciprocalMinimalStep_ + 0.5) / reciprocalMinimalStep_;
   else
      return std::ceil(dVal * reciprocalMinimalStep_ - 0.5) / reciprocalMinimalStep_;
}

double MS2K::FloatProperty::TruncateDown(double dVal)
{
   return std::floor(dVal * reciprocalMinimalStep_) / reciprocalMinimalStep_;
}

double MS2K::FloatProperty::TruncateUp(double dVal)
{
   return std::ceil(dVal * reciprocalMinimalStep_) / reciprocalMinimalStep_;
}

bool MS2K::FloatProperty::Set(double dVal)
{
   double val = Truncate(dVal);
   if (limits_)
   {
      if (val < lowerLimit_ || val > upperLimit_)
         return false;
   }
   value_ = val;
   return true;
}

bool MS2K::FloatProperty::Set(long lVal)
{
   return Set((double)lVal);
}

bool MS2K::FloatProperty::Set(const char* pszVal)
{
   char* end = 0;
   const double val = std::strtod(pszVal, &end);
   if (end == pszVal && *pszVal != '\0')
      return false; // not a number
   return Set(val);
}

bool MS2K::FloatProperty::Get(double& dVal) const
{
   dVal = value_;
   return true;
}

bool MS2K::FloatProperty::Get(long& lVal) const
{
   lVal = (long)value_;
   return true;
}

bool MS2K::FloatProperty::Get(std::string& strVal) const
{
   char fmtStr[20];
   char buf[BUFSIZE];
   std::snprintf(fmtStr, sizeof(fmtStr), "%%.%df", decimalPlaces_);
   std::snprintf(buf, BUFSIZE, fmtStr, value_);
   strVal = buf;
   return true;
}

bool MS2K::FloatProperty::SetLimits(double lowerLimit, double upperLimit)
{
   return MS2K::Property::SetLimits(TruncateUp(lowerLimit), TruncateDown(upperLimit));
}

///////////////////////////////////////////////////////////////////////////////
// MS2K::IntegerProperty
// ~~~~~~~~~~~~~~~~~~~~~
//

bool MS2K::IntegerProperty::Set(double dVal)
{
   return Set((long)dVal);
}

bool MS2K::IntegerProperty::Set(long lVal)
{
   if (limits_)
   {
      if (lVal < lowerLimit_ || lVal > upperLimit_)
         return false;
   }
   value_ = lVal;
   return true;
}

bool MS2K::IntegerProperty::Set(const char* pszVal)
{
   char* end = 0;
   const long val = std::strtol(pszVal, &end, 10);
   if (end == pszVal && *pszVal != '\0')
      return false; // not a number
   return Set(val);
}

bool MS2K::IntegerProperty::Get(double& dVal) const
{
   dVal = (double)value_;
   return true;
}

bool MS2K::IntegerProperty::Get(long& lVal) const
{
   lVal = value_;
   return true;
}

bool MS2K::IntegerProperty::Get(std::string& strVal) const
{
   char pszBuf[BUFSIZE];
   std::snprintf(pszBuf, BUFSIZE, "%ld", value_);
   strVal = pszBuf;
   return true;
}

///////////////////////////////////////////////////////////////////////////////
// MS2K::PropertyCollection
// ~~~~~~~~~~~~~~~~~~~~~~~~
//
MS2K::PropertyCollection::PropertyCollection()
{
}

MS2K::PropertyCollection::~PropertyCollection()
{
   CPropArray::const_iterator it;
   for (it = properties_.begin(); it != properties_.end(); it++)
      delete it->second;
}

int MS2K::PropertyCollection::Set(const char* pszPropName, const char* pszValue)
{
   MS2K::Property* pProp = Find(pszPropName);
   if (!pProp)
      return MS2K_INVALID_PROPERTY; // name not found

   if (pProp->GetReadOnly())
      return MS2K_INVALID_PROPERTY_VALUE;

   if (!pProp->IsAllowed(pszValue))
      return MS2K_INVALID_PROPERTY_VALUE;

   // check property limits
   if (!pProp->Set(pszValue))
      return MS2K_INVALID_PROPERTY_VALUE;

   return pProp->Apply();
}

int MS2K::PropertyCollection::Get(const char* pszPropName, std::string& strValue) const
{
   MS2K::Property* pProp = Find(pszPropName);
   if (!pProp)
      return MS2K_INVALID_PROPERTY; // name not found

   if (!pProp->GetCached())
   {
      int nRet = pProp->Update();
      if (nRet != MS2K_OK)
         return nRet;
   }
   pProp->Get(strValue);
   return MS2K_OK;
}

MS2K::Property* MS2K::PropertyCollection::Find(const char* pszName) const
{
   CPropArray::const_iterator it = properties_.find(pszName);
   if (it == properties_.end())
      return 0; // not found
   return it->second;
}

std::vector<std::string> MS2K::PropertyCollection::GetNames() const
{
   std::vector<std::string> nameList;

   CPropArray::const_iterator it;
   for (it = properties_.begin(); it != properties_.end(); it++)
      nameList.push_back(it->first);

   return nameList;
}

unsigned MS2K::PropertyCollection::GetSize() const
{
   return (unsigned) properties_.size();
}

int MS2K::PropertyCollection::CreateProperty(const char* pszName, const char* pszValue, MS2K::PropertyType eType,
   bool bReadOnly, MS2K::ActionFunctor* pAct, bool isPreInitProperty)
{
   // check if the name already exists
   if (Find(pszName))
   {
      delete pAct;
      return MS2K_DUPLICATE_PROPERTY;
   }

   MS2K::Property* pProp = 0;

   switch (eType)
   {
      case MS2K::String:
         pProp = new MS2K::StringProperty(pszName);
         break;

      case MS2K::Integer:
         pProp = new MS2K::IntegerProperty(pszName);
         break;

      case MS2K::Float:
         pProp = new MS2K::FloatProperty(pszName);
         break;

      default:
         delete pAct;
         return MS2K_INVALID_PROPERTY_TYPE;
   }

   if (!pProp->Set(pszValue))
   {
      delete pProp;
      delete pAct;
      return MS2K_INVALID_PROPERTY_VALUE;
   }
   pProp->SetReadOnly(bReadOnly);
   pProp->SetInitStatus(isPreInitProperty);
   properties_[pszName] = pProp;

   // assign action functor
   pProp->RegisterAction(pAct);
   return MS2K_OK;
}

int MS2K::PropertyCollection::AddAllowedValue(const char* pszName, const char* value, long data)
{
   MS2K::Property* pProp = Find(pszName);
   if (!pProp)
      return MS2K_INVALID_PROPERTY; // name not found

   pProp->AddAllowedValue(value, data);
   return MS2K_OK;
}

int MS2K::PropertyCollection::AddAllowedValue(const char* pszName, const char* value)
{
   MS2K::Property* pProp = Find(pszName);
   if (!pProp)
      return MS2K_INVALID_PROPERTY; // name not found

   pProp->AddAllowedValue(value);
   return MS2K_OK;
}

int MS2K::PropertyCollection::SetLimits(const char* pszName, double lowerLimit, double upperLimit)
{
   MS2K::Property* pProp = Find(pszName);
   if (!pProp)
      return MS2K_INVALID_PROPERTY; // name not found

   if (!pProp->SetLimits(lowerLimit, upperLimit))
      return MS2K_INVALID_PROPERTY_VALUE;
   return MS2K_OK;
}

int MS2K::PropertyCollection::GetPropertyData(const char* name, const char* value, long& data)
{
   MS2K::Property* pProp = Find(name);
   if (!pProp)
      return MS2K_INVALID_PROPERTY; // name not found

   if (!pProp->GetData(value, data))
      return MS2K_NO_PROPERTY_DATA;

   return MS2K_OK;
}

int MS2K::PropertyCollection::GetCurrentPropertyData(const char* name, long& data)
{
   MS2K::Property* pProp = Find(name);
   if (!pProp)
      return MS2K_INVALID_PROPERTY; // name not found

   std::string value;
   pProp->Get(value);
   if (!pProp->GetData(value.c_str(), data))
      return MS2K_NO_PROPERTY_DATA;

   return MS2K_OK;
}

int MS2K::PropertyCollection::Delete(const char* pszName)
{
   MS2K::Property* pProp = Find(pszName);
   if (!pProp)
      return MS2K_INVALID_PROPERTY;

   // remove it from the map
   properties_.erase(pszName);

   delete pProp;

   return MS2K_OK;
}
