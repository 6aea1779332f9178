//
// transport.cpp -- libcurl implementation of HTTP GET and anonymous FTP RETR
//
#include "transport.h"

#include <curl/curl.h>
#include <sstream>

namespace xmlvalidate {

namespace {

const char* const userAgent = "xml-validate/1.0";

// owns one easy handle
class CurlEasy
{
   CURL* fHandle;
   CurlEasy(const CurlEasy&);
   CurlEasy& operator=(const CurlEasy&);
public :
   char errorBuffer[CURL_ERROR_SIZE];

   CurlEasy() : fHandle(curl_easy_init())
   {
     if ( fHandle == 0 )
       throw TransportError("Failed to create a curl handle");
     errorBuffer[0] = '\0';
     curl_easy_setopt(fHandle, CURLOPT_ERRORBUFFER, errorBuffer);
     curl_easy_setopt(fHandle, CURLOPT_USERAGENT, userAgent);
   }
   ~CurlEasy() { release(); }

   CURL* get() const { return fHandle; }

   void release()
   {
     if ( fHandle )
       {
         curl_easy_cleanup(fHandle);
         fHandle = 0;
       }
   }

   std::string lastError(CURLcode code) const
   {
     if ( errorBuffer[0] != '\0' )
       return std::string(errorBuffer);
     return std::string(curl_easy_strerror(code));
   }
};

size_t
appendBody(char* data, size_t size, size_t count, void* userdata)
{
   std::string* body = static_cast<std::string*>(userdata);
   body->append(data, size * count);
   return size * count;
}

// Tracks the reason phrase of the most recent status line; redirects
// produce one status line per hop.
size_t
scanHeader(char* data, size_t size, size_t count, void* userdata)
{
   HttpResponse* response = static_cast<HttpResponse*>(userdata);
   parseStatusLine(std::string(data, size * count), response->reason);
   return size * count;
}

// libcurl hands FTP control replies to the header callback
size_t
scanFtpReply(char* data, size_t size, size_t count, void* userdata)
{
   std::string* lastReply = static_cast<std::string*>(userdata);
   parseFtpReply(std::string(data, size * count), *lastReply);
   return size * count;
}

class CurlFtpSession : public FtpSession
{
   CurlEasy fCurl;
   std::string fBaseUrl;
   std::string fLastReply;

   long replyCode() const
   {
     long code = 0;
     curl_easy_getinfo(fCurl.get(), CURLINFO_RESPONSE_CODE, &code);
     return code;
   }

   void perform()
   {
     fCurl.errorBuffer[0] = '\0';
     fLastReply.clear();
     CURLcode rc = curl_easy_perform(fCurl.get());
     if ( rc == CURLE_OK )
       return;
     long code = replyCode();
     if ( code == 0 )
       throw TransportError(fCurl.lastError(rc));
     if ( !fLastReply.empty() && fLastReply[0] >= '4' )
       throw FtpError(fLastReply);
     std::ostringstream reply;
     reply << code << " " << fCurl.lastError(rc);
     throw FtpError(reply.str());
   }

public :
   explicit CurlFtpSession(const std::string& host) : fBaseUrl("ftp://" + host + "/")
   {
     curl_easy_setopt(fCurl.get(), CURLOPT_HEADERFUNCTION, scanFtpReply);
     curl_easy_setopt(fCurl.get(), CURLOPT_HEADERDATA, &fLastReply);
   }

   void login()
   {
     // NOBODY on the server root only connects and authenticates; the
     // control connection is kept by the handle for the transfer.
     curl_easy_setopt(fCurl.get(), CURLOPT_URL, fBaseUrl.c_str());
     curl_easy_setopt(fCurl.get(), CURLOPT_USERNAME, "anonymous");
     curl_easy_setopt(fCurl.get(), CURLOPT_PASSWORD, "anonymous@");
     curl_easy_setopt(fCurl.get(), CURLOPT_NOBODY, 1L);
     perform();
   }

   std::string retrieveBinary(const std::string& path)
   {
     // an empty or directory path would make libcurl send LIST instead of RETR
     checkRetrievePath(path);
     std::string content;
     // %2F makes the path absolute instead of relative to the login directory
     std::string url = fBaseUrl + "%2F" + (path.empty() || path[0] != '/' ? path : path.substr(1));
     curl_easy_setopt(fCurl.get(), CURLOPT_URL, url.c_str());
     curl_easy_setopt(fCurl.get(), CURLOPT_NOBODY, 0L);
     curl_easy_setopt(fCurl.get(), CURLOPT_TRANSFERTEXT, 0L);
     curl_easy_setopt(fCurl.get(), CURLOPT_WRITEFUNCTION, appendBody);
     curl_easy_setopt(fCurl.get(), CURLOPT_WRITEDATA, &content);
     perform();
     return content;
   }

   void close() { fCurl.release(); }
};

} // namespace

bool
parseStatusLine(const std::string& line, std::string& reason)
{
   if ( line.compare(0, 5, "HTTP/") != 0 )
     return false;
   std::string::size_type code = line.find(' ');
   std::string::size_type phrase = std::string::npos;
   if ( code != std::string::npos )
     phrase = line.find(' ', code + 1);
   reason.clear();
   if ( phrase != std::string::npos )
     {
       reason = line.substr(phrase + 1);
       std::string::size_type end = reason.find_last_not_of("\r\n ");
       reason.erase(end == std::string::npos ? 0 : end + 1);
     }
   return true;
}

bool
parseFtpReply(const std::string& line, std::string& reply)
{
   std::string::size_type end = line.find_last_not_of("\r\n");
   if ( end == std::string::npos || end < 3 )
     return false;
   for ( int i = 0; i < 3; i++ )
     {
       if ( line[i] < '0' || line[i] > '9' )
         return false;
     }
   // "550-" starts a multi-line reply; only its final "550 " line counts
   if ( line[3] != ' ' )
     return false;
   reply = line.substr(0, end + 1);
   return true;
}

void
checkRetrievePath(const std::string& path)
{
   if ( path.empty() || path[path.size() - 1] == '/' )
     throw FtpError("550 Failed to open file.");
}

HttpResponse
CurlTransport::httpGet(const std::string& url)
{
   CurlEasy curl;
   HttpResponse response;

   curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
   curl_easy_setopt(curl.get(), CURLOPT_HTTP_VERSION, static_cast<long>(CURL_HTTP_VERSION_1_1));
   curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
   curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
   curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendBody);
   curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
   curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, scanHeader);
   curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);

   CURLcode rc = curl_easy_perform(curl.get());
   if ( rc != CURLE_OK )
     throw TransportError(curl.lastError(rc));

   curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
   char* contentType = 0;
   curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &contentType);
   if ( contentType )
     {
       response.hasContentType = true;
       response.contentType = contentType;
     }
   char* effectiveUrl = 0;
   curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effectiveUrl);
   response.url = effectiveUrl ? effectiveUrl : url;
   return response;
}

std::unique_ptr<FtpSession>
CurlTransport::ftpConnect(const std::string& host)
{
   return std::unique_ptr<FtpSession>(new CurlFtpSession(host));
}

CurlGlobal::CurlGlobal()
{
   CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
   if ( rc != CURLE_OK )
     throw TransportError(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
}

CurlGlobal::~CurlGlobal()
{
   curl_global_cleanup();
}

} // namespace xmlvalidate
