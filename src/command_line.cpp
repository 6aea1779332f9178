//
// command_line.cpp -- argument parsing, usage and help text
//
#include "command_line.h"

#include <clocale>

namespace xmlvalidate {

const char* const programName = "xml-validate";

namespace {

const char* const positionalNames[] = { "XML_FILE", "SCHEMA_FILE" };
const size_t positionalCount = 2;

void
takeShortFlags(const std::string& arg, Options& options)
{
   for ( size_t i = 1; i < arg.size(); i++ )
     {
       if ( arg[i] != 'v' )
         throw UsageError(std::string("No such option: -") + arg[i]);
       options.verbose = true;
     }
}

void
takeLongOption(const std::string& arg, Options& options)
{
   std::string name = arg.substr(0, arg.find('='));
   if ( name == "--verbose" || name == "--help" )
     {
       if ( name.size() != arg.size() )
         throw UsageError("Option '" + name + "' does not take a value.");
       if ( name == "--verbose" )
         options.verbose = true;
       else
         options.help = true;
       return;
     }
   throw UsageError("No such option: " + name);
}

} // namespace

Options
parseCommandLine(const std::vector<std::string>& args)
{
   Options options;
   std::vector<std::string> positional;
   bool optionsEnded = false;

   for ( size_t i = 0; i < args.size(); i++ )
     {
       const std::string& arg = args[i];
       if ( optionsEnded || arg.size() < 2 || arg[0] != '-' )
         positional.push_back(arg);
       else if ( arg == "--" )
         optionsEnded = true;
       else if ( arg[1] == '-' )
         takeLongOption(arg, options);
       else
         takeShortFlags(arg, options);
     }

   if ( options.help )
     return options;

   if ( positional.size() < positionalCount )
     throw UsageError(std::string("Missing argument '") + positionalNames[positional.size()] + "'.");
   if ( positional.size() > positionalCount )
     {
       std::string extra;
       for ( size_t i = positionalCount; i < positional.size(); i++ )
         extra += (i > positionalCount ? " " : "") + positional[i];
       throw UsageError(std::string("Got unexpected extra argument")
                        + (positional.size() - positionalCount > 1 ? "s" : "")
                        + " (" + extra + ")");
     }
   options.xmlFile = positional[0];
   options.schemaFile = positional[1];
   return options;
}

void
printUsage(std::ostream& out)
{
   out << "Usage: " << programName << " [OPTIONS] XML_FILE SCHEMA_FILE" << std::endl
       << "Try '" << programName << " --help' for help." << std::endl;
}

void
printHelp(std::ostream& out)
{
   out << "Usage: " << programName << " [OPTIONS] XML_FILE SCHEMA_FILE" << std::endl
       << std::endl
       << "  Validate an XML against an XSD SCHEMA." << std::endl
       << std::endl
       << "  XML_FILE and SCHEMA_FILE may each be a file path, a file:// URI," << std::endl
       << "  an http(s):// URL or an ftp:// URL." << std::endl
       << std::endl
       << "Options:" << std::endl
       << "  -v, --verbose  Verbose printout for XML validation errors." << std::endl
       << "  --help         Show this message and exit." << std::endl;
}

std::string
configureLocale()
{
   const char* const candidates[] = { "en_US.UTF-8", "C.UTF-8" };
   for ( size_t i = 0; i < sizeof(candidates) / sizeof(candidates[0]); i++ )
     {
       if ( std::setlocale(LC_ALL, candidates[i]) != 0 )
         return candidates[i];
     }
   return std::string();
}

} // namespace xmlvalidate
