//
// command_line.h -- xml-validate [-v|--verbose] XML_FILE SCHEMA_FILE
//
#ifndef XMLVALIDATE_COMMAND_LINE_H
#define XMLVALIDATE_COMMAND_LINE_H

#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace xmlvalidate {

extern const char* const programName;

class UsageError : public std::runtime_error
{
public :
   explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

struct Options
{
   bool verbose;
   bool help;
   std::string xmlFile;
   std::string schemaFile;

   Options() : verbose(false), help(false) {}
};

// args excludes the program name. Throws UsageError.
Options parseCommandLine(const std::vector<std::string>& args);

void printUsage(std::ostream& out);
void printHelp(std::ostream& out);

// Selects a UTF-8 LC_ALL locale for the process; returns the locale name
// chosen, or an empty string if none of the candidates is installed.
std::string configureLocale();

} // namespace xmlvalidate

#endif
