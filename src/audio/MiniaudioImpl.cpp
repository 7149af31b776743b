// SPDX-License-Identifier: Apache-2.0

// Single translation unit for the miniaudio implementation (device I/O and the WAV encoder).
// All other sources include <miniaudio.h> without the IMPLEMENTATION define.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
