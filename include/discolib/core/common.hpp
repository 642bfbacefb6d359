#pragma once

// -------------------------------------------------------------------------
// 1. PLATFORM DETECTION & SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // avoid std::min/std::max clashes on Windows
    #include <windows.h>
#else
    #include <sys/time.h>
    #include <ctime>
#endif

// -------------------------------------------------------------------------
// 2. STANDARD C++ LIBRARY (Commonly used across the project)
// -------------------------------------------------------------------------
// Containers
#include <vector>
#include <string>
#include <map>
#include <optional>
#include <utility> // std::pair
#include <ranges> // C++20 ranges for convenience
#include <functional> // std::function

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::iota, std::accumulate
#include <limits>  // std::numeric_limits

// IO & Strings
#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdint>

// Concurrency & Randoms
#include <mutex>
#include <random>
#include <chrono>

#include <memory> // std::unique_ptr, std::shared_ptr
#include <stdexcept>
