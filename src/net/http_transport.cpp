#include "net/http_transport.h"

#include <curl/curl.h>

namespace trade_pilot {

namespace {

std::size_t WriteToString(char* ptr, std::size_t size, std::size_t nmemb,
                          void* userdata) {
  if (ptr == nullptr || userdata == nullptr) {
    return 0;
  }
  std::string* out = static_cast<std::string*>(userdata);
  const std::size_t total = size * nmemb;
  out->append(ptr, total);
  return total;
}

bool CurlGlobalInit() {
  // 进程级初始化一次。
  static const bool kCurlGlobalInit = []() {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
  }();
  return kCurlGlobalInit;
}

}  // namespace

CurlHttpTransport::CurlHttpTransport(long timeout_ms)
    : timeout_ms_(timeout_ms > 0 ? timeout_ms : 10000) {
  if (CurlGlobalInit()) {
    curl_ = curl_easy_init();
  }
}

CurlHttpTransport::~CurlHttpTransport() {
  if (curl_ != nullptr) {
    curl_easy_cleanup(static_cast<CURL*>(curl_));
    curl_ = nullptr;
  }
}

HttpResponse CurlHttpTransport::Send(const std::string& method,
                                     const std::string& url,
                                     const HttpHeaders& headers,
                                     const std::string& body) const {
  HttpResponse out;
  if (curl_ == nullptr) {
    out.error = "curl_easy_init 失败";
    return out;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  CURL* curl = static_cast<CURL*>(curl_);
  curl_easy_reset(curl);

  struct curl_slist* header_list = nullptr;
  for (const auto& [key, value] : headers) {
    header_list = curl_slist_append(header_list, (key + ": " + value).c_str());
  }

  std::string response_body;
  char curl_error[CURL_ERROR_SIZE] = {0};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, curl_error);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "trade-pilot/0.1");
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

  if (method == "POST") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "POST");
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.size()));
  } else if (method == "DELETE") {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    if (!body.empty()) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(body.size()));
    }
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

  out.status_code = static_cast<int>(status_code);
  out.body = std::move(response_body);
  if (code != CURLE_OK) {
    const std::string detailed = (curl_error[0] != '\0')
                                     ? std::string(curl_error)
                                     : std::string(curl_easy_strerror(code));
    out.error = "curl_easy_perform 失败: " + detailed;
    out.timed_out = code == CURLE_OPERATION_TIMEDOUT;
  }

  curl_slist_free_all(header_list);
  return out;
}

std::unique_ptr<HttpTransport> MakeCurlHttpTransport(long timeout_ms) {
  return std::make_unique<CurlHttpTransport>(timeout_ms);
}

std::string UrlEncode(const std::string& text) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    const unsigned char c = static_cast<unsigned char>(ch);
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                            (c >= '0' && c <= '9') || c == '-' || c == '_' ||
                            c == '.' || c == '~';
    if (unreserved) {
      out.push_back(ch);
    } else {
      out.push_back('%');
      out.push_back(kHex[(c >> 4U) & 0x0FU]);
      out.push_back(kHex[c & 0x0FU]);
    }
  }
  return out;
}

std::string BuildQueryString(
    const std::vector<std::pair<std::string, std::string>>& params) {
  std::string out;
  for (const auto& [key, value] : params) {
    if (!out.empty()) {
      out.push_back('&');
    }
    out += key;
    out.push_back('=');
    out += UrlEncode(value);
  }
  return out;
}

}  // namespace trade_pilot
