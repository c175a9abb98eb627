/**
 * @file http_client.hpp
 * @brief 同步 HTTP POST（libcurl）
 *
 * 阻塞调用，只能在工作线程池中使用
 */

#pragma once

#include <string>

namespace telelink::server {

struct HttpResponse {
    bool ok = false;            // 传输成功且状态码为 2xx
    bool timed_out = false;
    long status = 0;
    std::string body;
    std::string error;
};

/**
 * @brief 全局初始化 libcurl（进程启动时调用一次）
 */
void http_global_init();

void http_global_cleanup();

/**
 * @brief POST JSON
 * @param url 目标地址
 * @param body JSON 文本
 * @param bearer_token 非空时附加 Authorization 头
 * @param timeout_ms 总超时
 */
HttpResponse http_post_json(const std::string& url,
                            const std::string& body,
                            const std::string& bearer_token,
                            long timeout_ms);

} // namespace telelink::server
