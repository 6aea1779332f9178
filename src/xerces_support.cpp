//
// xerces_support.cpp -- transcoding helpers for Xerces-c
//
// Published with DCI-CTP v1.1, Copyright 2007,2009, Digital Cinema Initiatives, LLC
//
#include "xerces_support.h"

namespace xmlvalidate {

std::ostream&
operator<<(std::ostream& target, const StrX& toDump)
{
   target << toDump.localForm();
   return target;
}

} // namespace xmlvalidate
