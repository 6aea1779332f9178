//
// reporter.h -- terminal text for a validation outcome
//
#ifndef XMLVALIDATE_REPORTER_H
#define XMLVALIDATE_REPORTER_H

#include <ostream>
#include <string>

namespace xmlvalidate {

struct Outcome;
struct Resource;

// ANSI styling, emitted only when enabled (standard output is a terminal).
class ConsoleStyle
{
   bool fEnabled;
   std::string wrap(const char* code, const std::string& text) const;
public :
   explicit ConsoleStyle(bool enabled) : fEnabled(enabled) {}
   std::string green(const std::string& text) const { return wrap("32", text); }
   std::string red(const std::string& text) const { return wrap("31", text); }
   std::string bold(const std::string& text) const { return wrap("1", text); }
};

class Reporter
{
   std::ostream& fOut;
   ConsoleStyle fStyle;
   bool fVerbose;

   void heading(const Resource& xml) const;
public :
   Reporter(std::ostream& out, bool verbose, bool color)
     : fOut(out), fStyle(color), fVerbose(verbose) {}

   void report(const Outcome& outcome, const Resource& xml) const;
};

} // namespace xmlvalidate

#endif
