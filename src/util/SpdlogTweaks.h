#pragma once

// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

// Included before spdlog.h. Only settings that do not change the layout of
// the installed (compiled) spdlog may go here.

#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
