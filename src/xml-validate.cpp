//
// xml-validate.cpp -- validate an XML document against an XSD schema
//
// Published with DCI-CTP v1.1, Copyright 2007,2009, Digital Cinema Initiatives, LLC
//
// XML_FILE and SCHEMA_FILE may be local paths, file:// URIs, http(s):// or
// ftp:// URLs. Requires the Xerces-c XML library and libcurl.
//
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>
#include <xercesc/util/XMLException.hpp>

#include "command_line.h"
#include "transport.h"
#include "validate_command.h"
#include "xerces_support.h"

using std::cerr;
using std::endl;
XERCES_CPP_NAMESPACE_USE
using namespace xmlvalidate;

int
main(int argc, const char** argv)
{
   configureLocale();

   std::vector<std::string> args(argv + 1, argv + argc);
   try
     {
       XercesPlatform platform;
       CurlGlobal curl;
       CurlTransport transport;
       return runValidate(args, std::cout, cerr, transport, isatty(STDOUT_FILENO) != 0);
     }
   catch ( const XMLException& e )
     {
       StrX tmp_e(e.getMessage());
       cerr << "Xerces initialization error: " << tmp_e.localForm() << endl;
       return 1;
     }
   catch ( const TransportError& e )
     {
       cerr << e.what() << endl;
       return 1;
     }
}
