#pragma once
#include <stdint.h>

#include <string>

struct HttpResponse {
  long status = 0;
  std::string body;
};

// Minimal blocking HTTP client used by RemoteSync. Both calls return false
// only on transport failure (resolve, connect, timeout); any HTTP status,
// 4xx/5xx included, is a completed exchange reported through out.status.
class HttpClient {
public:
  virtual ~HttpClient() {}

  virtual bool post(const std::string& url,
                    const std::string& content_type,
                    const std::string& body,
                    uint32_t timeout_ms,
                    HttpResponse& out) = 0;

  virtual bool get(const std::string& url, uint32_t timeout_ms, HttpResponse& out) = 0;

  virtual const std::string& lastError() const = 0;
};
