#ifndef MING_COLOR_HPP
#define MING_COLOR_HPP

// ANSI escape sequences used by the console output
#define RESET   "\033[0m"
#define RED     "\033[1;31m"
#define GREEN   "\033[1;32m"
#define YELLOW  "\033[1;33m"
#define CYAN    "\033[1;36m"

#endif // MING_COLOR_HPP
