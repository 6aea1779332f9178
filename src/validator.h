//
// validator.h -- validate a resolved XML document against a resolved XSD
//
// Published with DCI-CTP v1.1, Copyright 2007,2009, Digital Cinema Initiatives, LLC
//
#ifndef XMLVALIDATE_VALIDATOR_H
#define XMLVALIDATE_VALIDATOR_H

#include <string>

namespace xmlvalidate {

struct Resource;

struct Outcome
{
   enum Kind
   {
      Valid,
      Invalid,      // well-formed, does not conform to the schema
      Malformed,    // XML or XSD is not well-formed
      Unexpected    // anything else the engine reports, e.g. an invalid schema
   };

   Kind kind;
   std::string detail;

   explicit Outcome(Kind k = Valid, const std::string& d = std::string()) : kind(k), detail(d) {}
};

// Display name of a resource: the URL for remote ones, the file name otherwise.
std::string displayName(const Resource& resource);

// Xerces-c schema validation. The Xerces platform must be initialized
// (see XercesPlatform) while validate() runs.
class SchemaValidator
{
public :
   Outcome validate(const Resource& xml, const Resource& schema) const;
};

} // namespace xmlvalidate

#endif
