// SPDX-License-Identifier: Apache-2.0
// Asynchronous battle logger (header-only).
// Lines are queued and written by one background thread, so a tick never waits on the terminal.
// Environment:
//  BOTARENA_LOG_LEVEL  trace|debug|info|warn|error (default info)
//  BOTARENA_LOG_JSON   any value: one JSON object per line
//  BOTARENA_LOG_TAG    prefix for every line (process or worker name)
//  BOTARENA_LOG_FILE   append to this file instead of stderr
// Every line carries the battle id and frame of the calling thread when a log::BattleScope is active.

#pragma once

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <vector>

namespace botarena::log {

enum class level
{
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4
};

namespace detail {

constexpr std::array<std::string_view, 5> kLevelNames{"trace", "debug", "info", "warn", "error"};
constexpr std::array<char, 5> kLevelLetters{'T', 'D', 'I', 'W', 'E'};

inline std::string_view level_name(level lv)
{
    return kLevelNames[static_cast<size_t>(lv)];
}

inline level parse_level(std::string_view s)
{
    std::string v;
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "warning")
        return level::warn;
    if (v == "err")
        return level::error;
    for (size_t i = 0; i < kLevelNames.size(); ++i) {
        if (kLevelNames[i] == v)
            return static_cast<level>(i);
    }
    return level::info;
}

// Battle context of the calling thread; a coroutine resumed on another worker re-enters its scope per tick.
struct BattleContext
{
    std::string battle;
    int64_t frame{-1};
};

inline thread_local BattleContext t_context;

struct Record
{
    level lv;
    std::chrono::system_clock::time_point ts;
    BattleContext ctx;
    std::string msg;
};

using Callback = void (*)(int, const char *, void *);

class Sink
{
public:
    static Sink &instance()
    {
        static Sink s;
        return s;
    }

    std::atomic<int> threshold{static_cast<int>(level::info)};

    void ensure_started()
    {
        if (started_.exchange(true, std::memory_order_acq_rel))
            return;
        if (const char *lvl = std::getenv("BOTARENA_LOG_LEVEL"))
            threshold.store(static_cast<int>(parse_level(lvl)), std::memory_order_relaxed);
        json_ = std::getenv("BOTARENA_LOG_JSON") != nullptr;
        {
            std::lock_guard lk(out_mtx_);
            if (const char *tag = std::getenv("BOTARENA_LOG_TAG"))
                tag_ = tag;
            if (const char *path = std::getenv("BOTARENA_LOG_FILE")) {
                file_.open(path, std::ios::app);
                if (!file_)
                    std::cerr << "[log] cannot open " << path << ", using stderr" << std::endl;
            }
        }
        running_.store(true, std::memory_order_release);
        worker_ = std::thread([this] { drain(); });
        std::atexit([] { Sink::instance().stop(); });
    }

    void push(Record r)
    {
        if (!running_.load(std::memory_order_acquire)) {
            // writer already gone (logging during exit)
            write_record(r);
            return;
        }
        {
            std::lock_guard lk(q_mtx_);
            queue_.push_back(std::move(r));
        }
        q_cv_.notify_one();
    }

    void stop()
    {
        if (!running_.exchange(false, std::memory_order_acq_rel))
            return;
        q_cv_.notify_all();
        if (worker_.joinable())
            worker_.join();
        std::lock_guard lk(out_mtx_);
        out().flush();
    }

    void set_tag(std::string tag)
    {
        std::lock_guard lk(out_mtx_);
        tag_ = std::move(tag);
    }

    void set_callback(Callback cb, void *ud)
    {
        std::lock_guard lk(out_mtx_);
        cb_ = cb;
        cb_ud_ = ud;
    }

private:
    void drain()
    {
        std::vector<Record> batch;
        for (;;) {
            {
                std::unique_lock lk(q_mtx_);
                q_cv_.wait(lk, [this] { return !running_.load(std::memory_order_acquire) || !queue_.empty(); });
                if (queue_.empty())
                    return;
                batch.swap(queue_);
            }
            for (const auto &r : batch)
                write_record(r);
            batch.clear();
        }
    }

    std::ostream &out() { return file_.is_open() ? static_cast<std::ostream &>(file_) : std::cerr; }

    static void json_escape(std::ostream &os, std::string_view s)
    {
        for (char c : s) {
            if (c == '"' || c == '\\')
                os << '\\' << c;
            else if (c == '\n')
                os << "\\n";
            else
                os << c;
        }
    }

    void write_record(const Record &r)
    {
        std::time_t tt = std::chrono::system_clock::to_time_t(r.ts);
        std::tm tm{};
        localtime_r(&tt, &tm);
        std::lock_guard lk(out_mtx_);
        std::ostream &os = out();
        if (json_) {
            os << "{\"ts\":\"" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "\",\"level\":\"" << level_name(r.lv)
               << '"';
            if (!tag_.empty())
                os << ",\"tag\":\"" << tag_ << '"';
            if (!r.ctx.battle.empty()) {
                os << ",\"battle\":\"";
                json_escape(os, r.ctx.battle);
                os << '"';
            }
            if (r.ctx.frame >= 0)
                os << ",\"frame\":" << r.ctx.frame;
            os << ",\"msg\":\"";
            json_escape(os, r.msg);
            os << "\"}\n";
        } else {
            if (!tag_.empty())
                os << tag_ << ' ';
            os << '[' << kLevelLetters[static_cast<size_t>(r.lv)] << ' ' << std::put_time(&tm, "%H:%M:%S") << "] ";
            if (!r.ctx.battle.empty() || r.ctx.frame >= 0) {
                os << '<' << (r.ctx.battle.empty() ? "-" : r.ctx.battle);
                if (r.ctx.frame >= 0)
                    os << '#' << r.ctx.frame;
                os << "> ";
            }
            os << r.msg << '\n';
        }
        if (r.lv >= level::warn)
            os.flush();
        if (cb_)
            cb_(static_cast<int>(r.lv), r.msg.c_str(), cb_ud_);
    }

    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    bool json_{false};
    std::mutex q_mtx_;
    std::condition_variable q_cv_;
    std::vector<Record> queue_;
    std::thread worker_;
    std::mutex out_mtx_; // guards everything below plus the stream
    std::string tag_;
    std::ofstream file_;
    Callback cb_{nullptr};
    void *cb_ud_{nullptr};
};

template <typename T>
std::string stringify(const T &v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, bool>) {
        return v ? "true" : "false";
    } else if constexpr (std::is_convertible_v<const T &, std::string_view>) {
        return std::string(std::string_view(v));
    } else if constexpr (std::is_floating_point_v<D>) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << v;
        return oss.str();
    } else if constexpr (std::is_enum_v<D>) {
        return std::to_string(static_cast<std::underlying_type_t<D>>(v));
    } else if constexpr (std::is_arithmetic_v<D>) {
        return std::to_string(v);
    } else {
        std::ostringstream oss;
        oss << v;
        return oss.str();
    }
}

// "{}" placeholders are filled in order; arguments without a placeholder are appended after a space.
template <typename... Args>
std::string format(std::string_view fmt, const Args &...args)
{
    std::vector<std::string> values{stringify(args)...};
    std::string out;
    out.reserve(fmt.size() + values.size() * 8);
    size_t pos = 0;
    size_t next = 0;
    for (; next < values.size(); ++next) {
        size_t p = fmt.find("{}", pos);
        if (p == std::string_view::npos)
            break;
        out.append(fmt, pos, p - pos);
        out += values[next];
        pos = p + 2;
    }
    out.append(fmt, pos, std::string_view::npos);
    for (; next < values.size(); ++next)
        out.append(" ").append(values[next]);
    return out;
}

} // namespace detail

inline void init()
{
    detail::Sink::instance().ensure_started();
}

// Blocks until every queued line is written. Later lines are written synchronously.
inline void flush()
{
    detail::Sink::instance().stop();
}

inline void set_level(level lv) noexcept
{
    detail::Sink::instance().threshold.store(static_cast<int>(lv), std::memory_order_relaxed);
}

inline void set_tag(std::string tag)
{
    detail::Sink::instance().set_tag(std::move(tag));
}

inline void set_callback(void (*cb)(int, const char *, void *), void *ud)
{
    detail::Sink::instance().set_callback(cb, ud);
}

inline bool enabled(level lv) noexcept
{
    return static_cast<int>(lv) >= detail::Sink::instance().threshold.load(std::memory_order_relaxed);
}

// Tags the calling thread's lines with a battle id and frame until destroyed.
class BattleScope
{
public:
    BattleScope(std::string_view battle, int64_t frame) : saved_(detail::t_context)
    {
        detail::t_context.battle.assign(battle);
        detail::t_context.frame = frame;
    }
    ~BattleScope() { detail::t_context = std::move(saved_); }
    BattleScope(const BattleScope &) = delete;
    BattleScope &operator=(const BattleScope &) = delete;

private:
    detail::BattleContext saved_;
};

inline void write(level lv, std::string msg)
{
    if (!enabled(lv))
        return;
    auto &sink = detail::Sink::instance();
    sink.ensure_started();
    sink.push(detail::Record{lv, std::chrono::system_clock::now(), detail::t_context, std::move(msg)});
}

template <typename... Args>
void trace(std::string_view fmt, const Args &...args)
{
    if (enabled(level::trace))
        write(level::trace, detail::format(fmt, args...));
}

template <typename... Args>
void debug(std::string_view fmt, const Args &...args)
{
    if (enabled(level::debug))
        write(level::debug, detail::format(fmt, args...));
}

template <typename... Args>
void info(std::string_view fmt, const Args &...args)
{
    if (enabled(level::info))
        write(level::info, detail::format(fmt, args...));
}

template <typename... Args>
void warn(std::string_view fmt, const Args &...args)
{
    if (enabled(level::warn))
        write(level::warn, detail::format(fmt, args...));
}

template <typename... Args>
void error(std::string_view fmt, const Args &...args)
{
    if (enabled(level::error))
        write(level::error, detail::format(fmt, args...));
}

} // namespace botarena::log
