#pragma once

// Customize the namespace (default is `courier`) if necessary
#ifndef COURIER_API
#define COURIER_API courier
#endif


#if ((__cplusplus >= 201703L) || (defined(_MSVC_LANG) && _MSVC_LANG >= 201703L))
#define COMPILER_SUPPORTS_CPP_17 1      // NOLINT
#else
#define COMPILER_SUPPORTS_CPP_17 0      // NOLINT
#endif

#if !COMPILER_SUPPORTS_CPP_17
#error "courier requires C++17 (std::variant, std::optional)"
#endif

