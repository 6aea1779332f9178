//
// resolver.h -- turn an XML_FILE / SCHEMA_FILE argument into usable content
//
#ifndef XMLVALIDATE_RESOLVER_H
#define XMLVALIDATE_RESOLVER_H

#include <ostream>
#include <stdexcept>
#include <string>

namespace xmlvalidate {

class Transport;

enum Origin
{
   LocalPath,
   FileUri,
   HttpUrl,
   FtpUrl,
   Unsupported
};

// The full printable message, e.g.
// "Error: Invalid value for XML_FILE\nPath x.xml does not exist.\n"
class ResolveError : public std::runtime_error
{
public :
   explicit ResolveError(const std::string& what) : std::runtime_error(what) {}
};

struct Resource
{
   Origin origin;
   std::string argument;   // as given on the command line
   std::string location;   // absolute path, or the URL for remote origins
   std::string content;    // fetched text; empty for local origins

   Resource() : origin(LocalPath) {}
   bool isRemote() const { return origin == HttpUrl || origin == FtpUrl; }
};

// Lower-cased URL scheme of arg, or an empty string when there is none.
std::string urlScheme(const std::string& arg);

Origin classifyArgument(const std::string& arg);

class Resolver
{
   Transport& fTransport;
   std::ostream* fTrace;

   Resource resolveLocal(const std::string& arg, Origin origin, const std::string& label) const;
   Resource resolveHttp(const std::string& arg) const;
   Resource resolveFtp(const std::string& arg) const;

public :
   // trace, when given, receives one line per remote fetch
   explicit Resolver(Transport& transport, std::ostream* trace = 0)
     : fTransport(transport), fTrace(trace) {}

   // label names the argument in error messages ("XML_FILE", "SCHEMA_FILE").
   // Throws ResolveError, or TransportError for connection level failures.
   Resource resolve(const std::string& arg, const std::string& label) const;
};

} // namespace xmlvalidate

#endif
