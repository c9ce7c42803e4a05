#include "test_framework.hpp"

#include "oac/http/http_client.hpp"

void register_http_tests(std::vector<oac::tests::TestCase> &tests) {
  using oac::tests::require;
  using oac::http::HttpRequest;
  using oac::http::plan_curl_method;

  tests.push_back({"http_plan_get_with_body_keeps_get", [] {
                     const auto plan = plan_curl_method(
                         HttpRequest{.method = "get", .url = "https://h/api", .body = "{\"q\":1}"});
                     require(plan.send_body, "body should be sent");
                     require(plan.custom_request == "GET", "verb must be named explicitly");
                     require(!plan.http_get, "HTTPGET would drop the body");
                   }});

  tests.push_back({"http_plan_bodiless_get_and_head", [] {
                     const auto get = plan_curl_method(HttpRequest{.method = "GET"});
                     require(get.http_get && !get.send_body && get.custom_request.empty(),
                             "plain GET");
                     const auto head = plan_curl_method(HttpRequest{.method = "HEAD"});
                     require(head.no_body && !head.send_body, "HEAD sends no body");
                   }});

  tests.push_back({"http_plan_write_methods_always_send_body", [] {
                     for (const char *method : {"POST", "PUT", "PATCH"}) {
                       const auto plan = plan_curl_method(HttpRequest{.method = method});
                       require(plan.send_body, std::string(method) + " sends a body");
                       require(plan.custom_request == method,
                               std::string(method) + " named explicitly");
                     }
                   }});

  tests.push_back({"http_plan_delete_without_body", [] {
                     const auto plan = plan_curl_method(HttpRequest{.method = "delete"});
                     require(!plan.send_body, "no body");
                     require(plan.custom_request == "DELETE", "custom verb upper-cased");
                   }});
}
