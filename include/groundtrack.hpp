/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __GROUNDTRACK_HPP
#define __GROUNDTRACK_HPP

#include <groundtrack/config.hpp>
#include <groundtrack/coverage.hpp>
#include <groundtrack/element_log.hpp>
#include <groundtrack/element_store.hpp>
#include <groundtrack/propagator.hpp>
#include <groundtrack/track_sampler.hpp>
#include <groundtrack/snapshot_server.hpp>
#include <groundtrack/celestrak.hpp>
#include <groundtrack/json.hpp>
#include <groundtrack/daemon.hpp>

#endif
