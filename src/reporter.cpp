//
// reporter.cpp -- terminal text for a validation outcome
//
#include "reporter.h"
#include "resolver.h"
#include "validator.h"

namespace xmlvalidate {

std::string
ConsoleStyle::wrap(const char* code, const std::string& text) const
{
   if ( !fEnabled )
     return text;
   return std::string("\x1b[") + code + "m" + text + "\x1b[0m";
}

void
Reporter::heading(const Resource& xml) const
{
   if ( xml.isRemote() )
     fOut << "The XML from the URL:\n" << xml.argument << "\n";
   else
     fOut << "The XML file: " << displayName(xml) << "\n";
}

// Scripts parse this text; every line below is part of the interface.
void
Reporter::report(const Outcome& outcome, const Resource& xml) const
{
   switch ( outcome.kind )
     {
     case Outcome::Valid:
       heading(xml);
       fOut << fStyle.green("is valid.\n") << "\n";
       break;

     case Outcome::Invalid:
       heading(xml);
       fOut << fStyle.red("is invalid.\n") << "\n";
       if ( fVerbose )
         fOut << fStyle.bold("Error:") << "\n" << outcome.detail << "\n";
       break;

     case Outcome::Malformed:
       fOut << "Faulty XML or XSD file was given.\n\n";
       if ( fVerbose )
         fOut << "Error: " << outcome.detail << "\n";
       break;

     case Outcome::Unexpected:
       if ( fVerbose )
         fOut << "Error: " << outcome.detail << "\n";
       else
         fOut << "\nValidation ran into an unexpected error."
              << " Run command with --verbose option for more details\n\n";
       break;
     }
   fOut.flush();
}

} // namespace xmlvalidate
