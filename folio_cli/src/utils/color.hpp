//
// Created by Giuseppe Francione on 17/02/26.
//

#ifndef FOLIO_COLOR_HPP
#define FOLIO_COLOR_HPP

// ANSI escape sequences for console output
#define RESET   "\033[0m"
#define RED     "\033[1;31m"
#define GREEN   "\033[1;32m"
#define YELLOW  "\033[1;33m"
#define CYAN    "\033[1;36m"
#define GRAY    "\033[90m"

#endif // FOLIO_COLOR_HPP
