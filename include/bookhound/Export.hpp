#pragma once

#if defined(_WIN32)
#  if defined(BOOKHOUND_BUILD_SHARED)
#    if defined(bookhound_core_EXPORTS)
#      define BOOKHOUND_API __declspec(dllexport)
#    else
#      define BOOKHOUND_API __declspec(dllimport)
#    endif
#  else
#    define BOOKHOUND_API
#  endif
#else
#  if defined(BOOKHOUND_BUILD_SHARED)
#    define BOOKHOUND_API __attribute__((visibility("default")))
#  else
#    define BOOKHOUND_API
#  endif
#endif
