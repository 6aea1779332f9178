//
// validate_command.cpp -- one xml-validate invocation
//
#include "validate_command.h"
#include "command_line.h"
#include "reporter.h"
#include "resolver.h"
#include "transport.h"
#include "validator.h"

namespace xmlvalidate {

int
runValidate(const std::vector<std::string>& args,
            std::ostream& out, std::ostream& err,
            Transport& transport, bool color)
{
   Options options;
   try
     {
       options = parseCommandLine(args);
     }
   catch ( const UsageError& e )
     {
       printUsage(err);
       err << std::endl << "Error: " << e.what() << std::endl;
       return 2;
     }

   if ( options.help )
     {
       printHelp(out);
       return 0;
     }

   Resolver resolver(transport, options.verbose ? &err : 0);
   Resource xml;
   Resource schema;
   try
     {
       xml = resolver.resolve(options.xmlFile, "XML_FILE");
       schema = resolver.resolve(options.schemaFile, "SCHEMA_FILE");
     }
   catch ( const ResolveError& e )
     {
       out << e.what() << std::endl;
       return 0;
     }
   catch ( const TransportError& e )
     {
       out << e.what() << std::endl;
       return 0;
     }

   SchemaValidator validator;
   Reporter reporter(out, options.verbose, color);
   reporter.report(validator.validate(xml, schema), xml);
   return 0;
}

} // namespace xmlvalidate
