//////////////////////////////////////////////////////////////////////////
// Copyright 2025 The Aerospace Corporation.
// This file is a part of Netboot, licensed under CERN-OHL-W v2 or later.
//////////////////////////////////////////////////////////////////////////
//!\file
//! Core Netboot I/O interfaces: Readable and Writeable.

#pragma once

#include <netboot/io_readable.h>
#include <netboot/io_writeable.h>
