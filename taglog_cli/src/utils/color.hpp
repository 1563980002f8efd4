//
// Created by Giuseppe Francione on 10/10/26.
//

#ifndef TAGLOG_COLOR_HPP
#define TAGLOG_COLOR_HPP

// ANSI escape codes for terminal output
#define RESET  "\033[0m"
#define RED    "\033[1;31m"
#define CYAN   "\033[1;36m"

#endif // TAGLOG_COLOR_HPP
