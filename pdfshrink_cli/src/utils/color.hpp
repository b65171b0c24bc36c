//
// ANSI escape sequences for console output.
//

#ifndef PDFSHRINK_CLI_COLOR_HPP
#define PDFSHRINK_CLI_COLOR_HPP

#define RESET   "\033[0m"
#define RED     "\033[1;31m"
#define GREEN   "\033[1;32m"
#define YELLOW  "\033[1;33m"
#define CYAN    "\033[1;36m"

#endif // PDFSHRINK_CLI_COLOR_HPP
