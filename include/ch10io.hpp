#pragma once

/**
 * @file ch10io.hpp
 * @brief Single include for the ch10io library
 *
 * IRIG 106 Chapter 10 packet headers, data type catalog, status vocabulary,
 * and file navigation.
 */

#include "ch10io/data_type.hpp"
#include "ch10io/expected.hpp"
#include "ch10io/packet_header.hpp"
#include "ch10io/status.hpp"
#include "ch10io/types.hpp"
#include "ch10io/ch10io_io.hpp"
