#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace trade_pilot {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/// HTTP 响应统一结构，mock 与真实传输层共用。
struct HttpResponse {
  int status_code{0};  ///< 传输层失败时为 0。
  std::string body;
  std::string error;  ///< 传输层错误描述；为空表示请求已送达并拿到响应。
  bool timed_out{false};  ///< 是否因超时失败（模型错误分类依赖它）。
};

/**
 * @brief HTTP 传输抽象
 *
 * 交易所与模型适配器只依赖这个接口：
 * 1. 业务层不直接依赖 libcurl；
 * 2. 单元测试注入脚本化 transport。
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  /// method 取值 GET / POST / DELETE。
  virtual HttpResponse Send(const std::string& method,
                            const std::string& url,
                            const HttpHeaders& headers,
                            const std::string& body) const = 0;
};

/**
 * @brief libcurl 实现
 *
 * 每个实例持有一个 easy handle 并在请求间复用连接；
 * 析构即释放连接，适配器实例销毁时连接随之关闭。
 */
class CurlHttpTransport final : public HttpTransport {
 public:
  explicit CurlHttpTransport(long timeout_ms = 10000);
  ~CurlHttpTransport() override;

  CurlHttpTransport(const CurlHttpTransport&) = delete;
  CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

  HttpResponse Send(const std::string& method,
                    const std::string& url,
                    const HttpHeaders& headers,
                    const std::string& body) const override;

 private:
  long timeout_ms_{10000};
  mutable std::mutex mutex_;  ///< easy handle 不可并发使用。
  void* curl_{nullptr};  ///< CURL*，避免在头文件暴露 libcurl。
};

/// 创建默认 transport（libcurl）。
std::unique_ptr<HttpTransport> MakeCurlHttpTransport(long timeout_ms);

/// URL 查询参数编码（RFC 3986 unreserved 之外的字节做 %XX）。
std::string UrlEncode(const std::string& text);

/// 按顺序拼接 `k1=v1&k2=v2`（值做 UrlEncode）。
std::string BuildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params);

}  // namespace trade_pilot
