#pragma once
#include <loguru.hpp>
#include <string>

// 在 log 前加上提交的 context: 使用者與 URL
#define LOG_SUB(request, level, fmt, ...)                  \
    LOG_F(level, "[u=%s,url=%s] " fmt,                     \
          (request).user_id.c_str(), (request).url.c_str(), \
          ##__VA_ARGS__)
