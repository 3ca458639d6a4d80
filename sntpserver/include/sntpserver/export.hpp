// Copyright (c) 2025 The SNTP Server Authors
#pragma once

#if defined(_WIN32)
#if defined(SNTP_SERVER_BUILDING_DLL)
#define SNTP_SERVER_API __declspec(dllexport)
#elif defined(SNTP_SERVER_SHARED)
#define SNTP_SERVER_API __declspec(dllimport)
#else
#define SNTP_SERVER_API
#endif
#else
#define SNTP_SERVER_API
#endif
