// SPDX-FileCopyrightText: 2025 Contributors to the tracemux project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.hpp
 * @brief Compiler portability macros for the tracemux library.
 *
 * Every other public tracemux header includes this file so that the
 * export/visibility annotation is always available.
 *
 * Macros defined here:
 *   - TRACEMUX_EXPORT : Marks a symbol for export from the shared library.
 */

#pragma once

/*
 * ---------------------------------------------------------------------------
 * TRACEMUX_EXPORT  --  Shared library symbol visibility
 * ---------------------------------------------------------------------------
 * On GCC and Clang we use the "default" visibility attribute so the linker
 * exports the symbol from the .so / .dylib.  On compilers that do not support
 * this attribute (e.g., MSVC) the macro expands to nothing.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define TRACEMUX_EXPORT __attribute__((visibility("default")))
#else
#   define TRACEMUX_EXPORT
#endif
