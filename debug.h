/*
 * Debug level support for nimbridge
 * Provides fine-grained debug output control with dprintf macro
 */

#ifndef __NIMBRIDGE_DEBUG_H
#define __NIMBRIDGE_DEBUG_H

#include "logger.h"
#include <cstdio>

// Global debug level variable (defined in main.cpp)
extern int g_debug_level;

#define dprintf(level,format,args...) \
	do { \
		if (g_debug_level >= level) { \
			fprintf(stderr, "[DEBUG] %s(%d) %s: " format "\n",__FILE__,__LINE__, __FUNCTION__, ## args); \
		} \
	} while(0)

#endif /* __NIMBRIDGE_DEBUG_H */
