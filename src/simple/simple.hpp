/**
 * @file simple.hpp
 * @brief Umbrella header for strikeopt::simple namespace
 */

#pragma once

#include "strikeopt/simple/pricing.hpp"
