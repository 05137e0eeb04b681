// Copyright (c) 2022, The pulljson Authors. All rights reserved.
// This source code is licensed under the MIT License, which can be found in
// LICENSE.md. See AUTHORS.md for a list of contributor names.

#include "logging.h"
#include "internal.h"
#include "status_internal.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace pulljson
{

namespace
{

constexpr auto to_spdlog_level(LogLevel level) -> spdlog::level::level_enum
{
    switch (level) {
        case LogLevel::kTrace:
            return spdlog::level::trace;
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        default:
            return spdlog::level::off;
    }
}

} // namespace

auto create_sink(const Options &options, LogSink &out) -> Status
{
    const auto level = to_spdlog_level(options.log_level);
    out = std::make_shared<spdlog::sinks::null_sink_mt>();
    out->set_level(spdlog::level::off);
    if (level == spdlog::level::off) {
        return Status::ok();
    }
    try {
        switch (options.log_target) {
            case LogTarget::kFile:
                PULLJSON_EXPECT_NE(options.log_filename, nullptr);
                out = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_filename);
                break;
            case LogTarget::kStdout:
                out = std::make_shared<spdlog::sinks::stdout_sink_mt>();
                break;
            case LogTarget::kStderr:
                out = std::make_shared<spdlog::sinks::stderr_sink_mt>();
                break;
            case LogTarget::kStdoutColor:
                out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                break;
            case LogTarget::kStderrColor:
                out = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                break;
            default:
                return Status::invalid_argument("unrecognized log target");
        }
    } catch (const spdlog::spdlog_ex &error) {
        out = std::make_shared<spdlog::sinks::null_sink_mt>();
        out->set_level(spdlog::level::off);
        return StatusBuilder::io_error("cannot create log sink: {}", error.what());
    }
    out->set_level(level);
    return Status::ok();
}

auto create_log(LogSink sink, const std::string &name) -> LogPtr
{
    PULLJSON_EXPECT_FALSE(name.empty());
    auto log = std::make_shared<Log>(name, std::move(sink));
    log->set_level(spdlog::level::trace);
    return log;
}

auto ThreePartMessage::text() const -> std::string
{
    PULLJSON_EXPECT_FALSE(m_text[kPrimary].empty());
    auto message = m_text[kPrimary];

    if (!m_text[kDetail].empty()) {
        message = fmt::format("{}: {}", message, m_text[kDetail]);
    }
    if (!m_text[kHint].empty()) {
        message = fmt::format("{} ({})", message, m_text[kHint]);
    }
    return message;
}

auto LogMessage::syntax_error(Status::SubCode subc, spdlog::level::level_enum level) const -> Status
{
    return Status::syntax_error(subc, log(level).c_str());
}

auto LogMessage::log(spdlog::level::level_enum level) const -> std::string
{
    auto message = m_message.text();
    m_logger->log(level, message);
    return message;
}

} // namespace pulljson
