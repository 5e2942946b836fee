/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __TLEKIT_HPP
#define __TLEKIT_HPP

#include <tlekit/config.hpp>
#include <tlekit/tle.hpp>
#include <tlekit/propagator.hpp>
#include <tlekit/jacobians.hpp>
#include <tlekit/generation.hpp>

#endif
