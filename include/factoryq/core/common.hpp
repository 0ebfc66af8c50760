#pragma once

// -------------------------------------------------------------------------
// 1. PLATFORM DETECTION & SYSTEM HEADERS
// -------------------------------------------------------------------------
#if defined(_WIN32) || defined(_WIN64)
    #define NOMINMAX // Avoid std::min/std::max clashes on Windows
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
#include <array>
#include <string>
#include <map>
#include <unordered_map>
#include <optional>
#include <utility> // std::pair
#include <functional> // std::function, std::hash

// Math & Algorithms
#include <cmath>
#include <algorithm>
#include <numeric> // std::iota, std::accumulate
#include <limits>  // std::numeric_limits

// IO & Strings
#include <iostream>
#include <iomanip>
#include <format>
#include <sstream>
#include <fstream>
#include <cstdint>
#include <cstdlib>
#include <cctype>  // std::isdigit
#include <charconv> // std::from_chars

// Errors
#include <stdexcept>

// Randoms & time
#include <random>
#include <chrono>

#include <memory> // std::unique_ptr, std::shared_ptr

// -------------------------------------------------------------------------
// 3. GLOBAL CONSTANTS & MACROS
// -------------------------------------------------------------------------
#define FACTORYQ_EPS 1e-4 // completion tolerance in simulated minutes
