#include "remote/CurlHttpClient.h"

#include <string.h>

#include <memory>

namespace {

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
typedef std::unique_ptr<curl_slist, SlistDeleter> SlistPtr;

}  // namespace

CurlHttpClient::CurlHttpClient()
: _curl(curl_easy_init())
{
  memset(_error_buf, 0, sizeof(_error_buf));
}

CurlHttpClient::~CurlHttpClient() {
  if (_curl) {
    curl_easy_cleanup(_curl);
    _curl = nullptr;
  }
}

size_t CurlHttpClient::onBody_(char* data, size_t size, size_t nmemb, void* userdata) {
  std::string* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

void CurlHttpClient::prepare_(const std::string& url, uint32_t timeout_ms, HttpResponse& out) {
  out.status = 0;
  out.body.clear();
  _error_buf[0] = '\0';

  curl_easy_reset(_curl);
  curl_easy_setopt(_curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(_curl, CURLOPT_TIMEOUT_MS, (long)timeout_ms);
  curl_easy_setopt(_curl, CURLOPT_CONNECTTIMEOUT_MS, (long)timeout_ms);
  curl_easy_setopt(_curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(_curl, CURLOPT_ERRORBUFFER, _error_buf);
  curl_easy_setopt(_curl, CURLOPT_WRITEFUNCTION, &CurlHttpClient::onBody_);
  curl_easy_setopt(_curl, CURLOPT_WRITEDATA, &out.body);
}

bool CurlHttpClient::perform_(HttpResponse& out) {
  const CURLcode rc = curl_easy_perform(_curl);
  if (rc != CURLE_OK) {
    _last_error = (_error_buf[0] != '\0') ? _error_buf : curl_easy_strerror(rc);
    return false;
  }

  curl_easy_getinfo(_curl, CURLINFO_RESPONSE_CODE, &out.status);
  _last_error.clear();
  return true;
}

bool CurlHttpClient::post(const std::string& url,
                          const std::string& content_type,
                          const std::string& body,
                          uint32_t timeout_ms,
                          HttpResponse& out) {
  if (!_curl) {
    _last_error = "curl handle unavailable";
    return false;
  }

  prepare_(url, timeout_ms, out);

  const std::string header = "Content-Type: " + content_type;
  SlistPtr headers(curl_slist_append(nullptr, header.c_str()));
  if (!headers) {
    _last_error = "out of memory building headers";
    return false;
  }

  curl_easy_setopt(_curl, CURLOPT_POST, 1L);
  curl_easy_setopt(_curl, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(_curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(_curl, CURLOPT_POSTFIELDSIZE, (long)body.size());

  const bool ok = perform_(out);
  curl_easy_setopt(_curl, CURLOPT_HTTPHEADER, static_cast<curl_slist*>(nullptr));
  return ok;
}

bool CurlHttpClient::get(const std::string& url, uint32_t timeout_ms, HttpResponse& out) {
  if (!_curl) {
    _last_error = "curl handle unavailable";
    return false;
  }

  prepare_(url, timeout_ms, out);
  curl_easy_setopt(_curl, CURLOPT_HTTPGET, 1L);
  return perform_(out);
}
