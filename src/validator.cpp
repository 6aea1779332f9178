//
// validator.cpp -- test XML document against schema
//
// Published with DCI-CTP v1.1, Copyright 2007,2009, Digital Cinema Initiatives, LLC
//
#include "validator.h"
#include "resolver.h"
#include "xerces_support.h"

#include <memory>
#include <sstream>
#include <vector>
#include <xercesc/dom/DOM.hpp>
#include <xercesc/framework/LocalFileInputSource.hpp>
#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/framework/XMLGrammarDescription.hpp>
#include <xercesc/parsers/XercesDOMParser.hpp>
#include <xercesc/sax/ErrorHandler.hpp>
#include <xercesc/sax/SAXParseException.hpp>
#include <xercesc/util/OutOfMemoryException.hpp>
#include <xercesc/validators/common/Grammar.hpp>

XERCES_CPP_NAMESPACE_USE

namespace xmlvalidate {

namespace {

// error handler interface: keeps the first fatal error and every
// recoverable (validity) error
class ValidationErrorCollector : public ErrorHandler
{
   bool fFatal;
   std::string fFatalMessage;
   std::vector<std::string> fErrors;
public :
   ValidationErrorCollector() : fFatal(false) {}

   void warning(const SAXParseException&) {}
   void resetErrors() { fFatal = false; fFatalMessage.clear(); fErrors.clear(); }
   void error(const SAXParseException& toCatch) {
     std::ostringstream message;
     message << "line " << toCatch.getLineNumber()
             << ", column " << toCatch.getColumnNumber()
             << ": " << StrX(toCatch.getMessage());
     fErrors.push_back(message.str());
   }
   void fatalError(const SAXParseException& toCatch) {
     if ( fFatal )
       return;
     std::ostringstream message;
     message << StrX(toCatch.getMessage())
             << ": line " << toCatch.getLineNumber()
             << ", column " << toCatch.getColumnNumber();
     fFatal = true;
     fFatalMessage = message.str();
   }

   bool fatal() const { return fFatal; }
   const std::string& fatalMessage() const { return fFatalMessage; }
   const std::vector<std::string>& errors() const { return fErrors; }
};

std::string
joinLines(const std::vector<std::string>& lines)
{
   std::string joined;
   for ( size_t i = 0; i < lines.size(); i++ )
     {
       if ( i > 0 )
         joined += "\n";
       joined += lines[i];
     }
   return joined;
}

// Remote content is parsed from memory with the URL as system id, so
// relative xs:include/xs:import locations resolve against it.
std::unique_ptr<InputSource>
makeInputSource(const Resource& resource)
{
   if ( resource.isRemote() )
     return std::unique_ptr<InputSource>(
       new MemBufInputSource(reinterpret_cast<const XMLByte*>(resource.content.data()),
                             resource.content.size(),
                             resource.location.c_str()));
   XStr path(resource.location.c_str());
   return std::unique_ptr<InputSource>(new LocalFileInputSource(path.unicodeForm()));
}

} // namespace

std::string
displayName(const Resource& resource)
{
   if ( resource.isRemote() )
     return resource.location;
   std::string::size_type slash = resource.location.rfind('/');
   return slash == std::string::npos ? resource.location : resource.location.substr(slash + 1);
}

Outcome
SchemaValidator::validate(const Resource& xml, const Resource& schema) const
{
   ValidationErrorCollector errReporter;
   XercesDOMParser parser;
   parser.setErrorHandler(&errReporter);
   parser.setDoNamespaces(true);
   parser.setCreateEntityReferenceNodes(true);
   parser.useCachedGrammarInParse(true);
   parser.setDoSchema(true);
   parser.setValidationScheme(XercesDOMParser::Val_Always);
   parser.setValidationSchemaFullChecking(true);

   try
     {
       Grammar* grammar;
       {
         std::unique_ptr<InputSource> source = makeInputSource(schema);
         grammar = parser.loadGrammar(*source, Grammar::SchemaGrammarType, true);
       }
       if ( errReporter.fatal() )
         return Outcome(Outcome::Malformed, errReporter.fatalMessage());
       if ( !errReporter.errors().empty() )
         return Outcome(Outcome::Unexpected, joinLines(errReporter.errors()));
       if ( grammar == 0 )
         return Outcome(Outcome::Unexpected, "Error loading grammar " + schema.location);

       errReporter.resetErrors();
       {
         std::unique_ptr<InputSource> source = makeInputSource(xml);
         parser.parse(*source);
       }
       if ( errReporter.fatal() )
         return Outcome(Outcome::Malformed, errReporter.fatalMessage());
       if ( !errReporter.errors().empty() )
         {
           std::string detail = "failed validating " + displayName(xml) + " with "
             + displayName(schema) + ":\n";
           for ( size_t i = 0; i < errReporter.errors().size(); i++ )
             detail += "\nReason: " + errReporter.errors()[i];
           return Outcome(Outcome::Invalid, detail);
         }
       return Outcome(Outcome::Valid);
     }
   catch ( const OutOfMemoryException& )
     {
       return Outcome(Outcome::Unexpected, "Out of memory exception.");
     }
   catch ( const XMLException& e )
     {
       return Outcome(Outcome::Unexpected,
                      "An error occurred during parsing\n    Message: " + StrX(e.getMessage()).str());
     }
   catch ( const DOMException& e )
     {
       const unsigned int maxChars = 2047;
       XMLCh errText[maxChars + 1];
       std::ostringstream message;
       message << "DOM Error during parsing: '" << displayName(xml) << "'" << std::endl
               << "DOM Exception code is: " << e.code;
       if ( DOMImplementation::loadDOMExceptionMsg(e.code, errText, maxChars) )
         message << std::endl << "Message is: " << StrX(errText);
       return Outcome(Outcome::Unexpected, message.str());
     }
}

} // namespace xmlvalidate
