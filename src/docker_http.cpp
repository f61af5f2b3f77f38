#include "docker_http.h"

#include "errors.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <curl/curl.h>

#ifndef STACKCTL_VERSION_STR
#error "STACKCTL_VERSION_STR must be defined by the build system"
#endif

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace stackctl {

namespace {

constexpr char kUserAgent[]{ "stackctl/" STACKCTL_VERSION_STR };
constexpr char kDefaultDockerSocket[]{ "/var/run/docker.sock" };

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

size_t curl_write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *out{ static_cast<std::string *>(userdata) };
  size_t const total{ size * nmemb };
  out->append(ptr, total);
  return total;
}

int curl_xferinfo(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto const *ctx{ static_cast<context const *>(userdata) };
  return ctx->done() ? 1 : 0;  // non-zero aborts the transfer
}

}  // namespace

docker_endpoint docker_endpoint_from_host(std::optional<std::string> const &docker_host) {
  std::string const prefix{ std::string{ "/" } + kDockerApiVersion };

  if (!docker_host || docker_host->empty()) {
    return { .unix_socket = kDefaultDockerSocket, .base_url = "http://localhost" + prefix };
  }

  std::string_view host{ *docker_host };
  if (host.starts_with("unix://")) {
    host.remove_prefix(7);
    if (host.empty()) { throw gateway_error{ "DOCKER_HOST has an empty socket path" }; }
    return { .unix_socket = std::string{ host }, .base_url = "http://localhost" + prefix };
  }

  if (host.starts_with("tcp://") || host.starts_with("http://")) {
    host.remove_prefix(host.find("://") + 3);
    while (host.ends_with('/')) { host.remove_suffix(1); }
    if (host.empty()) { throw gateway_error{ "DOCKER_HOST has an empty address" }; }
    return { .unix_socket = {}, .base_url = "http://" + std::string{ host } + prefix };
  }

  throw gateway_error{ "unsupported DOCKER_HOST: " + *docker_host };
}

curl_transport::curl_transport(docker_endpoint endpoint) : endpoint_{ std::move(endpoint) } {
  libcurl_ensure_initialized();
}

http_response curl_transport::request(context const &ctx,
                                      std::string_view method,
                                      std::string const &path,
                                      std::string const &body,
                                      std::string_view content_type) {
  ctx.throw_if_done();

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw gateway_error{ "curl_easy_init failed" }; }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw gateway_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
    }
  };

  std::string const url{ endpoint_.base_url + path };
  std::string const method_str{ method };
  std::string const content_type_header{ "Content-Type: " + std::string{ content_type } };

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers{ nullptr,
                                                                       &curl_slist_free_all };
  if (method == "POST" || method == "PUT") {
    headers.reset(curl_slist_append(nullptr, content_type_header.c_str()));
    if (!headers) { throw gateway_error{ "curl_slist_append failed" }; }
  }

  http_response response{};

  setopt(CURLOPT_URL, url.c_str());
  if (!endpoint_.unix_socket.empty()) {
    setopt(CURLOPT_UNIX_SOCKET_PATH, endpoint_.unix_socket.c_str());
  }
  setopt(CURLOPT_CUSTOMREQUEST, method_str.c_str());
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kUserAgent);
  setopt(CURLOPT_WRITEFUNCTION, curl_write_string);
  setopt(CURLOPT_WRITEDATA, &response.body);
  setopt(CURLOPT_NOPROGRESS, 0L);
  setopt(CURLOPT_XFERINFOFUNCTION, curl_xferinfo);
  setopt(CURLOPT_XFERINFODATA, const_cast<void *>(static_cast<void const *>(&ctx)));
  if (headers) {
    setopt(CURLOPT_HTTPHEADER, headers.get());
    setopt(CURLOPT_POSTFIELDS, body.data());
    setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  }
  if (auto const remaining{ ctx.remaining() }) {
    auto const ms{ std::chrono::duration_cast<std::chrono::milliseconds>(*remaining).count() };
    setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(std::max<long long>(1, ms)));
  }

  auto const start{ std::chrono::steady_clock::now() };
  CURLcode const result{ curl_easy_perform(handle.get()) };
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };

  if (result != CURLE_OK) {
    if (result == CURLE_ABORTED_BY_CALLBACK || result == CURLE_OPERATION_TIMEDOUT) {
      ctx.throw_if_done();
    }
    throw gateway_error{ method_str + " " + path + ": " + curl_easy_strerror(result) };
  }

  if (CURLcode const rc{
          curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status) };
      rc != CURLE_OK) {
    throw gateway_error(std::string("curl_easy_getinfo failed: ") + curl_easy_strerror(rc));
  }

  STACKCTL_TRACE_HTTP_REQUEST(method_str,
                              path,
                              static_cast<std::int64_t>(response.status),
                              static_cast<std::int64_t>(duration_ms));
  tui::debug("docker: %s %s -> %ld", method_str.c_str(), path.c_str(), response.status);
  return response;
}

std::shared_ptr<http_transport> make_docker_transport() {
  return std::make_shared<curl_transport>(
      docker_endpoint_from_host(platform::env_var_get("DOCKER_HOST")));
}

}  // namespace stackctl
