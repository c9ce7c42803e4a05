#include "oac/http/http_client.hpp"

#include "oac/common/fs.hpp"

#include <curl/curl.h>

#ifndef OAC_VERSION
#define OAC_VERSION "0.1.0"
#endif

namespace oac::http {

namespace {

constexpr const char *USER_AGENT = "oac-client/" OAC_VERSION;
constexpr long MAX_REDIRECTS = 10;

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<Headers *>(userdata);

  // A new status line starts the headers of the next response (redirects).
  if (common::starts_with(header, "HTTP/")) {
    headers->clear();
    return total;
  }

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    const std::string value = common::trim(header.substr(separator + 1));
    (*headers)[key] = value;
  }

  return total;
}

} // namespace

CurlMethodPlan plan_curl_method(const HttpRequest &request) {
  const std::string method = common::to_upper(request.method);
  CurlMethodPlan plan;
  plan.send_body =
      !request.body.empty() || method == "POST" || method == "PUT" || method == "PATCH";
  if (plan.send_body) {
    plan.custom_request = method;
  } else if (method == "GET") {
    plan.http_get = true;
  } else if (method == "HEAD") {
    plan.no_body = true;
  } else {
    plan.custom_request = method;
  }
  return plan;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::send(const HttpRequest &request, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  const CurlMethodPlan plan = plan_curl_method(request);

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

  if (plan.http_get) {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  } else if (plan.no_body) {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  }
  if (plan.send_body) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  }
  // Without CUSTOMREQUEST, POSTFIELDS turns any verb into POST.
  if (!plan.custom_request.empty()) {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, plan.custom_request.c_str());
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : request.headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  return response;
}

} // namespace oac::http
