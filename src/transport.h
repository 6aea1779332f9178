//
// transport.h -- HTTP GET and anonymous FTP retrieval used by the resolver
//
#ifndef XMLVALIDATE_TRANSPORT_H
#define XMLVALIDATE_TRANSPORT_H

#include <memory>
#include <stdexcept>
#include <string>

namespace xmlvalidate {

// Connection level failure: DNS, refused connection, TLS, out of memory.
class TransportError : public std::runtime_error
{
public :
   explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// The FTP server answered with an error reply, e.g. "550 Failed to open file."
class FtpError : public std::runtime_error
{
public :
   explicit FtpError(const std::string& what) : std::runtime_error(what) {}
};

struct HttpResponse
{
   long status;
   std::string reason;        // reason phrase of the final status line, may be empty
   bool hasContentType;
   std::string contentType;
   std::string url;           // effective URL after redirects
   std::string body;

   HttpResponse() : status(0), hasContentType(false) {}
};

// One control connection to an FTP server.
class FtpSession
{
public :
   virtual ~FtpSession() {}
   virtual void login() = 0;
   virtual std::string retrieveBinary(const std::string& path) = 0;
   virtual void close() = 0;
};

class Transport
{
public :
   virtual ~Transport() {}
   virtual HttpResponse httpGet(const std::string& url) = 0;
   virtual std::unique_ptr<FtpSession> ftpConnect(const std::string& host) = 0;
};

// libcurl backed transport. No timeouts and no retries are configured.
class CurlTransport : public Transport
{
public :
   HttpResponse httpGet(const std::string& url);
   std::unique_ptr<FtpSession> ftpConnect(const std::string& host);
};

// Reason phrase of an HTTP status line, "HTTP/1.1 404 Not Found" -> "Not Found".
// Returns false, leaving reason alone, for any other header line.
bool parseStatusLine(const std::string& line, std::string& reason);

// Final line of an FTP control reply without its line ending, e.g.
// "550 Failed to open file.". Returns false for continuation lines
// ("550-...") and anything that is not a reply.
bool parseFtpReply(const std::string& line, std::string& reply);

// RETR needs a file name: throws FtpError for an empty path or one
// ending in '/'.
void checkRetrievePath(const std::string& path);

// curl_global_init/curl_global_cleanup for the lifetime of the object
class CurlGlobal
{
   CurlGlobal(const CurlGlobal&);
   CurlGlobal& operator=(const CurlGlobal&);
public :
   CurlGlobal();
   ~CurlGlobal();
};

} // namespace xmlvalidate

#endif
