///////////////////////////////////////////////////////////////////////////////
// FILE:          Property.h
// PROJECT:       MS2000 Adapter
// SUBSYSTEM:     MS2KDevice - Device adapter kit
//-----------------------------------------------------------------------------
// DESCRIPTION:   Property mechanism used to configure devices. Pre-init
//                properties carry the connection and axis configuration,
//                the rest mirror controller state through action handlers.
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

#include <map>
#include <string>
#include <vector>

namespace MS2K {

/**
 * Value access shared by all property types. Action handlers receive a
 * pointer to this interface.
 */
class PropertyBase
{
public:
   virtual ~PropertyBase() {}

   virtual bool Set(double dVal) = 0;
   virtual bool Set(long lVal) = 0;
   virtual bool Set(const char* Val) = 0;

   virtual bool Get(double& dVal) const = 0;
   virtual bool Get(long& lVal) const = 0;
   virtual bool Get(std::string& strVal) const = 0;

   virtual PropertyType GetType() const = 0;
   virtual const char* GetName() const = 0;
};

/**
 * Action handler invoked before a property is read (BeforeGet) and after
 * it is written (AfterSet).
 */
class ActionFunctor
{
public:
   virtual ~ActionFunctor() {}
   virtual int Execute(PropertyBase* pProp, ActionType eAct) = 0;
};

/**
 * Binds an action handler to a member function of the owning object.
 */
template <class T>
class Action : public ActionFunctor
{
private:
   T* pObj_;
   int (T::*fpt_)(PropertyBase* pProp, ActionType eAct);

public:
   Action(T* pObj, int (T::*fpt)(PropertyBase* pProp, ActionType eAct)) :
      pObj_(pObj), fpt_(fpt) {}
   ~Action() {}

   int Execute(PropertyBase* pProp, ActionType eAct)
      { return (*pObj_.*fpt_)(pProp, eAct); }
};

/**
 * Base class of the typed properties: allowed values, limits, read-only
 * and pre-init flags, action handler.
 */
class Property : public PropertyBase
{
public:
   Property(const char* name) :
      name_(name),
      readOnly_(false),
      fpAction_(0),
      cached_(false),
      hasData_(false),
      initStatus_(false),
      limits_(false),
      lowerLimit_(0.0),
      upperLimit_(0.0)
   {}

   virtual ~Property()
   {
      delete fpAction_;
   }

   const char* GetName() const { return name_.c_str(); }

   bool GetReadOnly() const { return readOnly_; }
   void SetReadOnly(bool bReadOnly) { readOnly_ = bReadOnly; }

   bool GetCached() const { return cached_; }
   void SetCached(bool bCached = true) { cached_ = bCached; }

   bool GetInitStatus() const { return initStatus_; }
   void SetInitStatus(bool init) { initStatus_ = init; }

   // takes ownership of the functor
   void RegisterAction(ActionFunctor* fpAct)
   {
      delete fpAction_;
      fpAction_ = fpAct;
   }

   int Update()
   {
      if (fpAction_)
         return fpAction_->Execute(this, BeforeGet);
      return MS2K_OK;
   }

   int Apply()
   {
      if (fpAction_)
         return fpAction_->Execute(this, AfterSet);
      return MS2K_OK;
   }

   std::vector<std::string> GetAllowedValues() const;
   void AddAllowedValue(const char* value);
   void AddAllowedValue(const char* value, long data);
   bool IsAllowed(const char* value) const;
   bool GetData(const char* value, long& data) const;

   bool HasLimits() const { return limits_; }
   double GetLowerLimit() const { return lowerLimit_; }
   double GetUpperLimit() const { return upperLimit_; }
   virtual bool SetLimits(double lowerLimit, double upperLimit)
   {
      // limits and a list of allowed values are mutually exclusive
      if (!values_.empty())
         return false;
      lowerLimit_ = lowerLimit;
      upperLimit_ = upperLimit;
      limits_ = true;
      return true;
   }

protected:
   std::string name_;
   bool readOnly_;
   ActionFunctor* fpAction_;
   bool cached_;
   bool hasData_;
   bool initStatus_;
   bool limits_;
   double lowerLimit_;
   double upperLimit_;
   std::map<std::string, long> values_; // allowed values

private:
   Property(const Property&);
   Property& operator=(const Property&);
};

class StringProperty : public Property
{
public:
   StringProperty(const char* name) : Property(name) {}

   PropertyType GetType() const { return String; }

   bool Set(double val);
   bool Set(long val);
   bool Set(const char* val);

   bool Get(double& val) const;
   bool Get(long& val) const;
   bool Get(std::string& strVal) const;

   bool SetLimits(double /*lowerLimit*/, double /*upperLimit*/) { return false; }

private:
   std::string value_;
};

/**
 * Floating point property; values are rounded to decimalPlaces_ digits
 * after the decimal point before limits are checked.
 */
class FloatProperty : public Property
{
public:
   FloatProperty(const char* name) :
      Property(name),
      value_(0.0),
      decimalPlaces_(4),
      reciprocalMinimalStep_(10000.0)
   {}

   PropertyType GetType() const { return Float; }

   bool Set(double val);
   bool Set(long val);
   bool Set(const char* val);

   bool Get(double& val) const;
   bool Get(long& val) const;
   bool Get(std::string& strVal) const;

   bool SetLimits(double lowerLimit, double upperLimit);

private:
   double Truncate(double dVal);
   double TruncateDown(double dVal);
   double TruncateUp(double dVal);

   double value_;
   int decimalPlaces_;
   double reciprocalMinimalStep_;
};

class IntegerProperty : public Property
{
public:
   IntegerProperty(const char* name) : Property(name), value_(0) {}

   PropertyType GetType() const { return Integer; }

   bool Set(double val);
   bool Set(long val);
   bool Set(const char* val);

   bool Get(double& val) const;
   bool Get(long& val) const;
   bool Get(std::string& strVal) const;

private:
   long value_;
};

/**
 * Named set of properties owned by one device.
 */
class PropertyCollection
{
public:
   PropertyCollection();
   ~PropertyCollection();

   int Set(const char* name, const char* value);
   int Get(const char* name, std::string& val) const;
   Property* Find(const char* name) const;
   std::vector<std::string> GetNames() const;
   unsigned GetSize() const;
   int CreateProperty(const char* name, const char* value, PropertyType eType, bool bReadOnly, ActionFunctor* pAct = 0, bool isPreInitProperty = false);
   int AddAllowedValue(const char* name, const char* value, long data);
   int AddAllowedValue(const char* name, const char* value);
   int SetLimits(const char* name, double lowerLimit, double upperLimit);
   int GetPropertyData(const char* name, const char* value, long& data);
   int GetCurrentPropertyData(const char* name, long& data);
   int Delete(const char* pszName);

private:
   typedef std::map<std::string, Property*> CPropArray;
   CPropArray properties_;

   PropertyCollection(const PropertyCollection&);
   PropertyCollection& operator=(const PropertyCollection&);
};

} // namespace MS2K
