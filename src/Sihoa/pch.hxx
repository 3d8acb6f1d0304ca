#ifndef PCH_HXX
#define PCH_HXX

// Standard C++ library headers
#include <algorithm>
#include <array>
#include <set>
#include <atomic>
#include <cctype>
#include <charconv>
#include <compare>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>
// C headers
#ifdef __cplusplus
extern "C" {
#endif

#include <cJSON.h>

#ifdef __cplusplus
}
#endif

#include "system/Error.hxx"
#include "system/Log.hxx"

#endif //PCH_HXX
