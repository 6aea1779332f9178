//
// xerces_support.h -- transcoding helpers and platform guard for Xerces-c
//
// Published with DCI-CTP v1.1, Copyright 2007,2009, Digital Cinema Initiatives, LLC
//
#ifndef XMLVALIDATE_XERCES_SUPPORT_H
#define XMLVALIDATE_XERCES_SUPPORT_H

#include <ostream>
#include <string>
#include <xercesc/util/PlatformUtils.hpp>
#include <xercesc/util/XMLString.hpp>

namespace xmlvalidate {

// XMLCh -> local code page, released on destruction
class StrX
{
   char*   fLocalForm;
   StrX(const StrX&);
   StrX& operator=(const StrX&);
public :
   explicit StrX(const XMLCh* const toTranscode)
     : fLocalForm(toTranscode ? xercesc::XMLString::transcode(toTranscode) : 0) {}
   ~StrX() { if ( fLocalForm ) xercesc::XMLString::release(&fLocalForm); }
   const char* localForm() const { return fLocalForm ? fLocalForm : ""; }
   std::string str() const { return std::string(localForm()); }
};

std::ostream& operator<<(std::ostream& target, const StrX& toDump);

// local code page -> XMLCh, released on destruction
class XStr
{
   XMLCh*   fUnicodeForm;
   XStr(const XStr&);
   XStr& operator=(const XStr&);
public :
   explicit XStr(const char* const toTranscode)
     : fUnicodeForm(xercesc::XMLString::transcode(toTranscode)) {}
   ~XStr() { xercesc::XMLString::release(&fUnicodeForm); }
   const XMLCh* unicodeForm() const { return fUnicodeForm; }
};

// Initializes the Xerces platform for the lifetime of the object.
// Construction throws xercesc::XMLException on failure.
class XercesPlatform
{
   XercesPlatform(const XercesPlatform&);
   XercesPlatform& operator=(const XercesPlatform&);
public :
   XercesPlatform() { xercesc::XMLPlatformUtils::Initialize(); }
   ~XercesPlatform() { xercesc::XMLPlatformUtils::Terminate(); }
};

} // namespace xmlvalidate

#endif
