#include "srv/server.hpp"
#include "error.hpp"
#include "log.hpp"
#include "report.hpp"
#include "service.hpp"
#include "srv/cors.hpp"
#include "srv/payload.hpp"
#include <exception>
#include <fmt/format.h>
#include <iostream>
#include <memory>
#include <restinio/http_headers.hpp>
#include <restinio/http_server_run.hpp>
#include <restinio/router/express.hpp>
#include <restinio/traits.hpp>
#include <string>
#include <utility>

namespace crackbank::srv {

namespace {

void add_headers(auto& response, const header_list& headers) {
  for (const auto& [name, value]: headers) response.append_header(name, value);
}

auto respond(auto req, restinio::http_status_line_t status, const std::string& body) {
  auto response = req->create_response(std::move(status));
  response.append_header(restinio::http_field::content_type, "application/json; charset=utf-8");
  add_headers(response, cors_headers(req->header().get_field_or("Origin", ""),
                                     cli.allowed_origins));
  response.set_body(body + "\n");
  return response.done();
}

auto fail(auto req, const error& e) {
  logger.log(fmt::format("{} {}: {}: {}", req->header().method().c_str(), req->header().path(),
                         to_string(e.code()), e.what()));
  return respond(req, status_for(e.code()), detail_json(e.what()));
}

auto fail_internal(auto req, const std::exception& e) {
  logger.error(fmt::format("{} {}: {}", req->header().method().c_str(), req->header().path(),
                           e.what()));
  return respond(req, restinio::status_internal_server_error(), internal_error_json());
}

auto preflight(auto req) {
  auto response = req->create_response(restinio::status_no_content());
  add_headers(response,
              preflight_headers(req->header().get_field_or("Origin", ""),
                                req->header().get_field_or("Access-Control-Request-Headers", ""),
                                cli.allowed_origins));
  return response.connection_close().done();
}

auto handle_check(const breach_service& service, auto req) {
  try {
    const check_request request = parse_check_request(req->body());
    const match_result  result  = service.check_breach(request.hash, request.email);
    logger.log(fmt::format("check: breached={} matches={}", result.breached,
                           result.matches.size()));
    return respond(req, restinio::status_ok(), to_json(result));
  } catch (const error& e) {
    return fail(req, e);
  } catch (const std::exception& e) {
    return fail_internal(req, e);
  }
}

auto handle_summarize(const breach_service& service, auto req) {
  try {
    const auto        matches = parse_summarize_request(req->body());
    const std::string summary = service.summarize_matches(matches);
    return respond(req, restinio::status_ok(), summary_json(summary));
  } catch (const error& e) {
    return fail(req, e);
  } catch (const std::exception& e) {
    return fail_internal(req, e);
  }
}

auto get_router(const breach_service& service) {
  auto router = std::make_unique<restinio::router::express_router_t<>>();

  router->http_get("/", [](auto req, auto /*params*/) {
    return respond(req, restinio::status_ok(), status_json());
  });

  router->http_post("/check-breach-hash", [&service](auto req, auto /*params*/) {
    return handle_check(service, req);
  });

  router->http_post("/summarize-breach", [&service](auto req, auto /*params*/) {
    return handle_summarize(service, req);
  });

  for (const char* route: {"/", "/check-breach-hash", "/summarize-breach"}) {
    router->add_handler(restinio::http_method_options(), route,
                        [](auto req, auto /*params*/) { return preflight(req); });
  }

  router->non_matched_request_handler([](auto req) {
    return req->create_response(restinio::status_not_found()).connection_close().done();
  });

  return router;
}

} // namespace

void run_server(const breach_service& service) {
  struct server_traits : public restinio::default_traits_t {
    using request_handler_t = restinio::router::express_router_t<>;
  };

  std::cout << fmt::format("Serving {} breaches from {}:{}\n"
                           "POST http://{}:{}/check-breach-hash  {{\"hash\": \"<sha1>\"}}\n",
                           service.breaches().size(), cli.bind_address, cli.port,
                           cli.bind_address, cli.port);

  auto settings = restinio::on_thread_pool<server_traits>(cli.threads)
                      .address(cli.bind_address)
                      .port(cli.port)
                      .request_handler(get_router(service));

  restinio::run(std::move(settings));
}

} // namespace crackbank::srv
