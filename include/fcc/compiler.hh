//
// Created by igor on 10/08/2025.
//

#pragma once


#if !defined(__EMSCRIPTEN__)
#if defined(__clang__)
#define LIBFCC_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define LIBFCC_COMPILER_GCC
#elif defined(_MSC_VER)
#define LIBFCC_COMPILER_MSVC
#endif
#else
#define LIBFCC_COMPILER_WASM
#endif

#if defined(LIBFCC_COMPILER_CLANG) || defined(LIBFCC_COMPILER_GCC) || defined(LIBFCC_COMPILER_WASM)
#define LIBFCC_HAS_BUILTIN_BSWAP 1
#else
#define LIBFCC_HAS_BUILTIN_BSWAP 0
#endif
