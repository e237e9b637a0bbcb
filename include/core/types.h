/**
* @file   types.h
* @brief  Core types for the tsanalyzer library
*/

#ifndef TSANALYZER_TYPES_H
#define TSANALYZER_TYPES_H

#include <stddef.h>

typedef unsigned int tsanalyzer_uint_t; /**< Double word type */
typedef signed int tsanalyzer_int_t; /**< Signed double word type */
typedef char* tsanalyzer_string_t; /**< String type */
typedef const char* tsanalyzer_cstring_t; /**< Constant string type */
typedef size_t tsanalyzer_size_t; /**< Size type */

#endif
