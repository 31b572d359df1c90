#pragma once

#if defined(_WIN32)
#  if defined(TASKMARKET_BUILD_SHARED)
#    if defined(taskmarket_core_EXPORTS)
#      define TASKMARKET_API __declspec(dllexport)
#    else
#      define TASKMARKET_API __declspec(dllimport)
#    endif
#  else
#    define TASKMARKET_API
#  endif
#else
#  if defined(TASKMARKET_BUILD_SHARED)
#    define TASKMARKET_API __attribute__((visibility("default")))
#  else
#    define TASKMARKET_API
#  endif
#endif
