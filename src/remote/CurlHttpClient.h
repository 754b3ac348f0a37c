#pragma once

#include <curl/curl.h>

#include "remote/HttpClient.h"

// libcurl-backed HttpClient. One easy handle is reused across requests so
// the connection to the control plane stays alive between ticks.
// curl_global_init() must have been called before construction.
class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  bool post(const std::string& url,
            const std::string& content_type,
            const std::string& body,
            uint32_t timeout_ms,
            HttpResponse& out) override;

  bool get(const std::string& url, uint32_t timeout_ms, HttpResponse& out) override;

  const std::string& lastError() const override { return _last_error; }

private:
  void prepare_(const std::string& url, uint32_t timeout_ms, HttpResponse& out);
  bool perform_(HttpResponse& out);

  static size_t onBody_(char* data, size_t size, size_t nmemb, void* userdata);

  CURL* _curl = nullptr;
  char _error_buf[CURL_ERROR_SIZE];
  std::string _last_error;
};
