#ifndef printrelay_Utils_hpp_
#define printrelay_Utils_hpp_

#include <string>

namespace PrintRelay {

// Logging levels: 0 fatal .. 5 trace.
extern void set_logging_level(unsigned int level);
// Converts a level name ("error", "info", ...) or a digit to 0..5. Returns -1 when unknown.
extern int  parse_logging_level(const std::string &level);
// Adds a rotating file sink "printrelay_%N.log" into the given directory.
extern bool add_file_log(const std::string &log_dir);
extern void flush_logs();

} // namespace PrintRelay

#endif // printrelay_Utils_hpp_
