//
// resolver.cpp -- classify an argument, then read it locally or fetch it
//
#include "resolver.h"
#include "transport.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace xmlvalidate {

namespace {

const char* const fileUriPrefix = "file://";
const char* const correctUrlHint = "\nMake sure the URL is correct.\n";

bool
isRegularFile(const std::string& path)
{
   struct stat info;
   return ::stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode);
}

std::string
currentDirectory()
{
   std::vector<char> buffer(4096);
   while ( ::getcwd(&buffer[0], buffer.size()) == 0 )
     {
       if ( errno != ERANGE )
         throw ResolveError(std::string("Error: Cannot determine the working directory: ")
                            + std::strerror(errno) + "\n");
       buffer.resize(buffer.size() * 2);
     }
   return std::string(&buffer[0]);
}

std::string
absolutePath(const std::string& path)
{
   if ( !path.empty() && path[0] == '/' )
     return path;
   std::string relative = path;
   while ( relative.compare(0, 2, "./") == 0 )
     relative.erase(0, 2);
   return currentDirectory() + "/" + relative;
}

bool
isXmlContentType(const HttpResponse& response)
{
   if ( !response.hasContentType )
     return false;
   return response.contentType.find("text/plain") != std::string::npos
     || response.contentType.find("xml") != std::string::npos;
}

std::string
statusCategory(long status)
{
   if ( status >= 400 && status < 500 )
     return "Client Error";
   if ( status >= 500 && status < 600 )
     return "Server Error";
   return "HTTP Error";
}

bool
isValidUtf8(const std::string& text)
{
   std::string::size_type i = 0;
   while ( i < text.size() )
     {
       unsigned char lead = static_cast<unsigned char>(text[i]);
       int trailing;
       unsigned long codepoint;
       if ( lead < 0x80 )
         {
           ++i;
           continue;
         }
       else if ( (lead & 0xE0) == 0xC0 )
         {
           trailing = 1;
           codepoint = lead & 0x1F;
         }
       else if ( (lead & 0xF0) == 0xE0 )
         {
           trailing = 2;
           codepoint = lead & 0x0F;
         }
       else if ( (lead & 0xF8) == 0xF0 )
         {
           trailing = 3;
           codepoint = lead & 0x07;
         }
       else
         return false;

       if ( i + trailing >= text.size() )
         return false;
       for ( int k = 1; k <= trailing; k++ )
         {
           unsigned char next = static_cast<unsigned char>(text[i + k]);
           if ( (next & 0xC0) != 0x80 )
             return false;
           codepoint = (codepoint << 6) | (next & 0x3F);
         }
       // overlong forms, surrogates and values past U+10FFFF
       if ( (trailing == 1 && codepoint < 0x80)
            || (trailing == 2 && codepoint < 0x800)
            || (trailing == 3 && codepoint < 0x10000)
            || (codepoint >= 0xD800 && codepoint <= 0xDFFF)
            || codepoint > 0x10FFFF )
         return false;
       i += trailing + 1;
     }
   return true;
}

} // namespace

std::string
urlScheme(const std::string& arg)
{
   if ( arg.empty() || !std::isalpha(static_cast<unsigned char>(arg[0])) )
     return std::string();
   std::string::size_type i = 1;
   while ( i < arg.size() )
     {
       unsigned char c = static_cast<unsigned char>(arg[i]);
       if ( c == ':' )
         break;
       if ( !std::isalnum(c) && c != '+' && c != '-' && c != '.' )
         return std::string();
       ++i;
     }
   if ( i == arg.size() )
     return std::string();
   std::string scheme = arg.substr(0, i);
   for ( std::string::size_type k = 0; k < scheme.size(); k++ )
     scheme[k] = static_cast<char>(std::tolower(static_cast<unsigned char>(scheme[k])));
   return scheme;
}

Origin
classifyArgument(const std::string& arg)
{
   std::string scheme = urlScheme(arg);
   if ( scheme.empty() )
     return LocalPath;
   if ( scheme == "file" )
     return FileUri;
   if ( scheme == "http" || scheme == "https" )
     return HttpUrl;
   if ( scheme == "ftp" )
     return FtpUrl;
   // drive letter
   if ( scheme.size() == 1 && arg.size() > 2 && (arg[2] == '\\' || arg[2] == '/') )
     return LocalPath;
   return Unsupported;
}

Resource
Resolver::resolve(const std::string& arg, const std::string& label) const
{
   Origin origin = classifyArgument(arg);
   switch ( origin )
     {
     case LocalPath:
     case FileUri:
       return resolveLocal(arg, origin, label);
     case HttpUrl:
       return resolveHttp(arg);
     case FtpUrl:
       return resolveFtp(arg);
     case Unsupported:
       break;
     }
   throw ResolveError("Error: Unsupported URL scheme '" + urlScheme(arg) + "' in " + arg + "\n");
}

Resource
Resolver::resolveLocal(const std::string& arg, Origin origin, const std::string& label) const
{
   std::string path = arg;
   if ( origin == FileUri && arg.compare(4, 3, "://") == 0 )
     path = arg.substr(std::strlen(fileUriPrefix));

   if ( !isRegularFile(path) )
     throw ResolveError("Error: Invalid value for " + label + "\n"
                        + "Path " + path + " does not exist.\n");

   Resource resource;
   resource.origin = origin;
   resource.argument = arg;
   resource.location = absolutePath(path);
   return resource;
}

Resource
Resolver::resolveHttp(const std::string& arg) const
{
   if ( fTrace )
     *fTrace << "xml-validate: GET " << arg << std::endl;

   HttpResponse response = fTransport.httpGet(arg);
   const std::string& url = response.url.empty() ? arg : response.url;

   if ( response.status < 200 || response.status >= 300 )
     {
       std::ostringstream error;
       error << response.status << " " << statusCategory(response.status) << ": "
             << response.reason << " for url: " << url << correctUrlHint;
       throw ResolveError(error.str());
     }
   if ( !isXmlContentType(response) )
     throw ResolveError("Error: Content of the URL (" + url + ")\n"
                        + "is not in XML format. Make sure the URL is correct.\n");

   Resource resource;
   resource.origin = HttpUrl;
   resource.argument = arg;
   resource.location = arg;
   resource.content = response.body;
   return resource;
}

Resource
Resolver::resolveFtp(const std::string& arg) const
{
   // ftp://[user@]host[:port]/path[?query][#fragment]
   std::string::size_type start = arg.find("://");
   if ( start == std::string::npos )
     throw ResolveError("Error: Invalid FTP URL " + arg + correctUrlHint);
   start += 3;
   std::string::size_type slash = arg.find('/', start);
   std::string netloc = arg.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
   std::string path = slash == std::string::npos ? std::string() : arg.substr(slash);
   std::string::size_type suffix = path.find_first_of("?#");
   if ( suffix != std::string::npos )
     path.erase(suffix);
   std::string::size_type at = netloc.rfind('@');
   std::string host = at == std::string::npos ? netloc : netloc.substr(at + 1);

   if ( fTrace )
     *fTrace << "xml-validate: RETR " << path << " from " << host << std::endl;

   std::unique_ptr<FtpSession> session = fTransport.ftpConnect(host);
   std::string content;
   try
     {
       session->login();
       content = session->retrieveBinary(path);
     }
   catch ( const FtpError& e )
     {
       session->close();
       throw ResolveError(std::string(e.what()) + " (" + arg + ")" + correctUrlHint);
     }
   catch ( ... )
     {
       session->close();
       throw;
     }
   session->close();

   if ( !isValidUtf8(content) )
     throw ResolveError("Error: Content of the URL (" + arg + ")\n"
                        + "is not valid UTF-8 text.\n");

   Resource resource;
   resource.origin = FtpUrl;
   resource.argument = arg;
   resource.location = arg;
   resource.content = content;
   return resource;
}

} // namespace xmlvalidate
