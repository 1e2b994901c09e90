#pragma once

#if defined(_WIN32)
#if defined(ASYNCKIT_BUILD_DLL)
#define ASYNCKIT_API __declspec(dllexport)
#elif defined(ASYNCKIT_USE_DLL)
#define ASYNCKIT_API __declspec(dllimport)
#else
#define ASYNCKIT_API
#endif
#else
#define ASYNCKIT_API
#endif
