#pragma once

#if defined _WIN32 || defined __CYGWIN__
#ifdef tcoll_EXPORTS
#ifdef __GNUC__
#define TCOLL_EXPORT __attribute__ ((dllexport))
#else
#define TCOLL_EXPORT __declspec(dllexport)
#endif
#else
#ifdef __GNUC__
#define TCOLL_EXPORT __attribute__ ((dllexport))
#else
#define TCOLL_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define TCOLL_EXPORT __attribute__ ((visibility ("default")))
#else
#define TCOLL_EXPORT
#endif
#endif

