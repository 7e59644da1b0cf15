#ifndef C3B1E0A2_7F4D_4B8E_9A61_2D5F0C8E4B17
#define C3B1E0A2_7F4D_4B8E_9A61_2D5F0C8E4B17

// EnTT を include する前に ENTT_ASSERT を差し替える。
// EnTT を使う翻訳単位はすべて <entt/entt.hpp> ではなくこのヘッダを include すること。

#include <SDL2/SDL_log.h>

#include <boost/stacktrace.hpp>
#include <cstdlib>
#include <sstream>
#include <string>

inline void entt_assert_handler(bool condition, const char* msg, const char* expr, const char* file,
                                int line) {
    if (condition) return;

    std::ostringstream trace;
    trace << boost::stacktrace::stacktrace();
    const std::string trace_text = trace.str();

    SDL_LogCritical(SDL_LOG_CATEGORY_ASSERT,
                    "ENTT_ASSERT failed: %s\n  expr : %s\n  file : %s:%d\nStacktrace:\n%s",
                    msg ? msg : "(no message)", expr, file, line, trace_text.c_str());

    std::abort();
}

#define ENTT_ASSERT(condition, msg) \
    ::entt_assert_handler((condition), (msg), #condition, __FILE__, __LINE__)

#include <entt/entt.hpp>

#endif /* C3B1E0A2_7F4D_4B8E_9A61_2D5F0C8E4B17 */
