/*
 * sections.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Aggregated header for all configuration sections

**************************************************/

#ifndef CURATOR_CONFIG_SECTIONS_HPP
#define CURATOR_CONFIG_SECTIONS_HPP

#include "cache_config.hpp"
#include "history_config.hpp"
#include "logging_config.hpp"
#include "pipeline_config.hpp"
#include "storage_config.hpp"

#endif  // CURATOR_CONFIG_SECTIONS_HPP
