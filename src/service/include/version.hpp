/**
 * @file version.hpp
 * @brief Версия агента (задаётся системой сборки)
 */

#pragma once

#ifndef SKY_AGENT_VERSION
#define SKY_AGENT_VERSION "0.1.0"
#endif

inline constexpr const char *kAgentVersion = SKY_AGENT_VERSION;
