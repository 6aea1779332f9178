//
// validate_command.h -- one xml-validate invocation
//
#ifndef XMLVALIDATE_VALIDATE_COMMAND_H
#define XMLVALIDATE_VALIDATE_COMMAND_H

#include <ostream>
#include <string>
#include <vector>

namespace xmlvalidate {

class Transport;

// Parses args (program name excluded), resolves both inputs, validates and
// reports. Results and resolution errors go to out, usage errors and
// --verbose fetch traces to err. Returns the process exit code: 2 for usage
// errors, 0 otherwise. Requires an initialized Xerces platform.
int runValidate(const std::vector<std::string>& args,
                std::ostream& out, std::ostream& err,
                Transport& transport, bool color);

} // namespace xmlvalidate

#endif
