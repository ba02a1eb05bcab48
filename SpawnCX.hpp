// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025 assembler-0
// Licensed under GPL-3.0-or-later

/**
 * @brief SpawnCX - A header-only C++ library for spawning child processes and managing their lifecycle and I/O.
 * @file SpawnCX.hpp
 * @version 0.1.0
 * @date 19-10-26 (last modified)
 * @author assembler-0
 */

#pragma once
#ifndef SPAWNCX_HPP
#define SPAWNCX_HPP

#include "SpawnCX/Constants.hpp"
#include "SpawnCX/Result.hpp"
#include "SpawnCX/Signal.hpp"
#include "SpawnCX/OutputOptions.hpp"
#include "SpawnCX/Stdio.hpp"
#include "SpawnCX/Descriptor.hpp"
#include "SpawnCX/LineScanner.hpp"
#include "SpawnCX/OutputFeed.hpp"
#include "SpawnCX/Wait.hpp"
#include "SpawnCX/SpawnEngine.hpp"
#include "SpawnCX/Process.hpp"
#include "SpawnCX/Output.hpp"
#include "SpawnCX/Command.hpp"

#endif
