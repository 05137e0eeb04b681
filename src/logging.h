// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#ifndef PULLJSON_LOGGING_H
#define PULLJSON_LOGGING_H

#include "pulljson/options.h"
#include "pulljson/status.h"
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace pulljson
{

using Log = spdlog::logger;
using LogPtr = std::shared_ptr<spdlog::logger>;
using LogSink = spdlog::sink_ptr;

// Create a sink for the level and target named in "options"
// If the sink cannot be created, "out" is set to a null sink and a non-OK
// status is returned.
auto create_sink(const Options &options, LogSink &out) -> Status;

// Create a logger that is not registered with spdlog. Tokenizers are short
// lived and never share a logger.
auto create_log(LogSink sink, const std::string &name) -> LogPtr;

// Message made up of a primary part, an optional detail, and an optional hint,
// rendered as "primary: detail (hint)"
class ThreePartMessage
{
public:
    ThreePartMessage() = default;

    template <class... Args>
    auto set_primary(const char *format, Args &&...args) -> void
    {
        return set_text(kPrimary, format, std::forward<Args>(args)...);
    }

    template <class... Args>
    auto set_detail(const char *format, Args &&...args) -> void
    {
        return set_text(kDetail, format, std::forward<Args>(args)...);
    }

    template <class... Args>
    auto set_hint(const char *format, Args &&...args) -> void
    {
        return set_text(kHint, format, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto text() const -> std::string;

private:
    static constexpr size_t kPrimary = 0;
    static constexpr size_t kDetail = 1;
    static constexpr size_t kHint = 2;

    template <class... Args>
    auto set_text(size_t index, const char *format, Args &&...args) -> void
    {
        m_text[index] = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
    }

    std::string m_text[3];
};

// Message that is written to a logger before being converted into a Status
class LogMessage
{
public:
    explicit LogMessage(Log &logger)
        : m_logger(&logger)
    {
    }

    template <class... Args>
    auto set_primary(const char *format, Args &&...args) -> void
    {
        return m_message.set_primary(format, std::forward<Args>(args)...);
    }

    template <class... Args>
    auto set_detail(const char *format, Args &&...args) -> void
    {
        return m_message.set_detail(format, std::forward<Args>(args)...);
    }

    template <class... Args>
    auto set_hint(const char *format, Args &&...args) -> void
    {
        return m_message.set_hint(format, std::forward<Args>(args)...);
    }

    [[nodiscard]] auto syntax_error(Status::SubCode subc, spdlog::level::level_enum level = spdlog::level::debug) const -> Status;
    auto log(spdlog::level::level_enum level) const -> std::string;

private:
    ThreePartMessage m_message;
    Log *m_logger;
};

} // namespace pulljson

#endif // PULLJSON_LOGGING_H
