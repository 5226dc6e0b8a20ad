// SPDX-License-Identifier: Apache-2.0
// Asynchronous line logger (header-only) shared by the relay, the peer client
// and the match core. Lines are queued and written to stderr by one background
// thread so the tick loop never blocks on I/O.
//  - PONG_LOG_LEVEL   trace|debug|info|warn|error (default info)
//  - PONG_LOG_JSON    any value switches to one JSON object per line
//  - PONG_LOG_APP_ID  prefix identifying the process (e.g. "relay", "peer-a")

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

namespace pong::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {

struct line
{
    level lv;
    std::string text;
    std::chrono::system_clock::time_point ts;
};

struct state
{
    std::atomic<int> min_level{static_cast<int>(level::info)};
    std::atomic<bool> json{false};
    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::mutex queue_mtx;
    std::condition_variable queue_cv;
    std::condition_variable drained_cv;
    std::deque<line> queue;
    std::size_t in_flight{0}; // guarded by queue_mtx
    std::mutex out_mtx;
    std::string app_id; // guarded by out_mtx
    std::thread worker;
};

inline state &global()
{
    static state s;
    return s;
}

inline const char *level_name(level lv)
{
    switch (lv) {
        case level::trace:
            return "trace";
        case level::debug:
            return "debug";
        case level::info:
            return "info";
        case level::warn:
            return "warn";
        case level::error:
            return "error";
    }
    return "info";
}

inline char level_tag(level lv)
{
    switch (lv) {
        case level::trace:
            return 'T';
        case level::debug:
            return 'D';
        case level::info:
            return 'I';
        case level::warn:
            return 'W';
        case level::error:
            return 'E';
    }
    return 'I';
}

inline level parse_level(std::string_view s)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return level::trace;
    if (v == "debug")
        return level::debug;
    if (v == "warn" || v == "warning")
        return level::warn;
    if (v == "error" || v == "err")
        return level::error;
    return level::info;
}

inline void json_escape(std::ostream &os, std::string_view s)
{
    for (char c : s) {
        switch (c) {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                os << c;
        }
    }
}

inline void emit(const line &l)
{
    auto &g = global();
    std::time_t tt = std::chrono::system_clock::to_time_t(l.ts);
    std::tm tm{};
    localtime_r(&tt, &tm);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(l.ts.time_since_epoch()).count() % 1000;
    std::lock_guard lk(g.out_mtx);
    if (g.json.load(std::memory_order_relaxed)) {
        std::cerr << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
                  << std::setfill('0') << millis << std::setfill(' ') << "\",\"level\":\"" << level_name(l.lv) << '"';
        if (!g.app_id.empty()) {
            std::cerr << ",\"app\":\"";
            json_escape(std::cerr, g.app_id);
            std::cerr << '"';
        }
        std::cerr << ",\"msg\":\"";
        json_escape(std::cerr, l.text);
        std::cerr << "\"}\n";
    } else {
        char buf[16];
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
        if (!g.app_id.empty())
            std::cerr << g.app_id << ' ';
        std::cerr << '[' << level_tag(l.lv) << ' ' << buf << '.' << std::setw(3) << std::setfill('0') << millis
                  << std::setfill(' ') << "] " << l.text << '\n';
    }
    std::cerr.flush();
}

inline void worker_loop()
{
    auto &g = global();
    for (;;) {
        std::deque<line> batch;
        {
            std::unique_lock lk(g.queue_mtx);
            g.queue_cv.wait(lk, [&] { return !g.running.load(std::memory_order_acquire) || !g.queue.empty(); });
            if (g.queue.empty() && !g.running.load(std::memory_order_acquire))
                break;
            batch.swap(g.queue);
            g.in_flight = batch.size();
        }
        for (auto &l : batch)
            emit(l);
        {
            std::lock_guard lk(g.queue_mtx);
            g.in_flight = 0;
        }
        g.drained_cv.notify_all();
    }
    g.drained_cv.notify_all();
}

inline void stop()
{
    auto &g = global();
    if (!g.running.exchange(false, std::memory_order_acq_rel))
        return;
    g.queue_cv.notify_all();
    if (g.worker.joinable())
        g.worker.join();
}

inline void start()
{
    auto &g = global();
    if (g.started.exchange(true, std::memory_order_acq_rel))
        return;
    if (const char *lvl = std::getenv("PONG_LOG_LEVEL"))
        g.min_level.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
    if (std::getenv("PONG_LOG_JSON"))
        g.json.store(true, std::memory_order_relaxed);
    if (const char *app = std::getenv("PONG_LOG_APP_ID"); app && *app) {
        std::lock_guard lk(g.out_mtx);
        g.app_id.assign(app);
    }
    g.running.store(true, std::memory_order_release);
    g.worker = std::thread([] { worker_loop(); });
    std::atexit([] { stop(); });
}

} // namespace detail

namespace detail_format {

template <typename T>
inline std::string stringify(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, const char *> || std::is_same_v<D, char *>)
        return v ? std::string(v) : std::string("(null)");
    else if constexpr (std::is_convertible_v<const T &, std::string_view>)
        return std::string(std::string_view(v));
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss.setf(std::ios::fixed, std::ios::floatfield);
        oss.precision(3);
        oss << v;
        return oss.str();
    } else if constexpr (std::is_enum_v<D>)
        return std::to_string(static_cast<std::underlying_type_t<D>>(v));
    else if constexpr (std::is_arithmetic_v<D>)
        return std::to_string(v);
    else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// Substitutes each "{}" with the next argument; surplus arguments are appended
// space separated, surplus placeholders are left as is.
template <typename... Args>
inline std::string tiny_format(std::string_view fmt, const Args &...args)
{
    if constexpr (sizeof...(Args) == 0) {
        return std::string(fmt);
    } else {
        std::array<std::string, sizeof...(Args)> values{stringify(args)...};
        std::string out;
        out.reserve(fmt.size() + values.size() * 8);
        std::size_t pos = 0;
        std::size_t next = 0;
        while (next < values.size()) {
            auto p = fmt.find("{}", pos);
            if (p == std::string_view::npos)
                break;
            out.append(fmt.substr(pos, p - pos));
            out += values[next++];
            pos = p + 2;
        }
        out.append(fmt.substr(pos));
        for (; next < values.size(); ++next) {
            out.push_back(' ');
            out += values[next];
        }
        return out;
    }
}

} // namespace detail_format

inline void init()
{
    detail::start();
}

inline void set_level(level lv) noexcept
{
    detail::global().min_level.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_level(std::string_view name) noexcept
{
    set_level(detail::parse_level(name));
}

inline void set_json(bool on) noexcept
{
    detail::global().json.store(on, std::memory_order_relaxed);
}

inline void set_app_id(std::string id)
{
    auto &g = detail::global();
    std::lock_guard lk(g.out_mtx);
    g.app_id = std::move(id);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::global().min_level.load(std::memory_order_relaxed);
}

inline void write(level lv, std::string_view msg)
{
    if (!enabled(lv))
        return;
    detail::start();
    auto &g = detail::global();
    {
        std::lock_guard lk(g.queue_mtx);
        g.queue.push_back(detail::line{lv, std::string(msg), std::chrono::system_clock::now()});
    }
    g.queue_cv.notify_one();
}

// Blocks until every queued line has been written.
inline void flush()
{
    auto &g = detail::global();
    if (!g.running.load(std::memory_order_acquire))
        return;
    std::unique_lock lk(g.queue_mtx);
    g.drained_cv.wait_for(lk, std::chrono::seconds(2), [&] { return g.queue.empty() && g.in_flight == 0; });
}

template <typename... Args>
inline void write(level lv, const char *fmt, const Args &...args)
{
    if (enabled(lv))
        write(lv, std::string_view(detail_format::tiny_format(fmt, args...)));
}

template <typename... Args>
inline void trace(const char *fmt, const Args &...args)
{
    write(level::trace, fmt, args...);
}

template <typename... Args>
inline void debug(const char *fmt, const Args &...args)
{
    write(level::debug, fmt, args...);
}

template <typename... Args>
inline void info(const char *fmt, const Args &...args)
{
    write(level::info, fmt, args...);
}

template <typename... Args>
inline void warn(const char *fmt, const Args &...args)
{
    write(level::warn, fmt, args...);
}

template <typename... Args>
inline void error(const char *fmt, const Args &...args)
{
    write(level::error, fmt, args...);
}

} // namespace pong::log
