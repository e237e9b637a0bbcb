/**
 * @file constants.h
 * @brief Core constants for tsanalyzer
 */

#ifndef TSANALYZER_CONSTANTS_H
#define TSANALYZER_CONSTANTS_H

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "0.0.0"
#endif

#define TSANALYZER_VERSION PROJECT_VERSION

#define TSANALYZER_CONFIG_FILE "tsanalyzer.toml"
#define TSANALYZER_STDIN_PATH "-"

#ifdef _MSC_VER
#pragma warning(disable : 4996)
#endif

#endif
