#pragma once

#include <memory>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

/**
 * @file Log.h
 * @brief 日志初始化工具。
 */

/**
 * @brief 初始化全局日志器（幂等）。
 *
 * 若 multi_sink 日志器尚未注册，则创建控制台与 typogly.log 文件两个输出，
 * 并将其设为 spdlog 默认日志器。核心库只调用 spdlog:: 自由函数，
 * 未初始化时退回 spdlog 自带的默认控制台日志器。
 */
inline void initLogging() {
  if (!spdlog::get("multi_sink")) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>("typogly.log", true);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    auto logger = std::make_shared<spdlog::logger>("multi_sink", spdlog::sinks_init_list{console_sink, file_sink});
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
  }
}
