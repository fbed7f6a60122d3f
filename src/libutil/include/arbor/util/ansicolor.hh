#pragma once
///@file

/* Terminal escape sequences used in log messages. The simple logger
   strips them when stderr is not a terminal. */

#define ANSI_NORMAL "\e[0m"
#define ANSI_BOLD "\e[1m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"

/**
 * Warnings, and values interpolated into messages.
 */
#define ANSI_WARNING "\e[35;1m"
