// SPDX-License-Identifier: MIT
// Copyright (c) 2025 remotezip Team

#include "curl_transport.h"
#include "remotezip/remote_error.h"

#include <curl/curl.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace remotezip {

namespace {

// Body bytes buffered ahead of the reader before the transfer is paused
constexpr size_t kPauseThreshold = 256 * 1024;

struct EasyDeleter {
  void operator()(CURL *handle) const {
    if (handle) {
      curl_easy_cleanup(handle);
    }
  }
};
using easy_ptr = std::unique_ptr<CURL, EasyDeleter>;

struct SlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using slist_ptr = std::unique_ptr<curl_slist, SlistDeleter>;

void ensure_global_init() {
  static std::once_flag once;
  static CURLcode init_result = CURLE_OK;
  std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (init_result != CURLE_OK) {
    throw TransportError(std::string("curl_global_init failed: ") + curl_easy_strerror(init_result), init_result);
  }
}

[[noreturn]] void throw_curl_error(const std::string &context, CURLcode code, const char *detail) {
  std::string message = context + ": ";
  if (detail && detail[0] != '\0') {
    message += detail;
  } else {
    message += curl_easy_strerror(code);
  }
  throw TransportError(message, code);
}

void check_setopt(CURLcode rc, const std::string &option) {
  if (rc != CURLE_OK) {
    throw TransportError("Failed to set transport option " + option + ": " + curl_easy_strerror(rc), rc);
  }
}

easy_ptr new_easy_handle() {
  easy_ptr easy(curl_easy_init());
  if (!easy) {
    throw TransportError("curl_easy_init failed");
  }
  return easy;
}

slist_ptr build_header_list(const HeaderList &headers) {
  slist_ptr list;
  for (const auto &[name, value] : headers) {
    const std::string line = name + ": " + value;
    curl_slist *next = curl_slist_append(list.get(), line.c_str());
    if (!next) {
      throw TransportError("Failed to build request header list");
    }
    list.release();
    list.reset(next);
  }
  return list;
}

bool follows_redirects(const TransportOptions &options) {
  const auto it = options.settings.find("FOLLOWLOCATION");
  return it == options.settings.end() || it->second != "0";
}

// Every setting is handed to libcurl by option name; the core never interprets them.
void apply_settings(CURL *easy, const TransportOptions &options) {
  for (const auto &[name, value] : options.settings) {
    const curl_easyoption *option = curl_easy_option_by_name(name.c_str());
    if (!option) {
      throw TransportError("Unknown transport option: " + name);
    }

    CURLcode rc = CURLE_OK;
    try {
      switch (option->type) {
      case CURLOT_LONG:
      case CURLOT_VALUES:
        rc = curl_easy_setopt(easy, option->id, static_cast<long>(std::stol(value)));
        break;
      case CURLOT_OFF_T:
        rc = curl_easy_setopt(easy, option->id, static_cast<curl_off_t>(std::stoll(value)));
        break;
      case CURLOT_STRING:
        rc = curl_easy_setopt(easy, option->id, value.c_str());
        break;
      default:
        throw TransportError("Transport option " + name + " cannot be set from a text value");
      }
    } catch (const std::invalid_argument &) {
      throw TransportError("Invalid value for transport option " + name + ": '" + value + "'");
    } catch (const std::out_of_range &) {
      throw TransportError("Value out of range for transport option " + name + ": '" + value + "'");
    }
    check_setopt(rc, name);
  }
}

struct HeaderState {
  CURL *easy = nullptr;
  bool follow_redirects = true;
  ResponseHeaders current;
  ResponseHeaders final_headers;
  long status = 0;
  bool complete = false;
};

size_t header_callback(char *data, size_t size, size_t nitems, void *userdata) {
  auto *state = static_cast<HeaderState *>(userdata);
  const size_t length = size * nitems;
  try {
    std::string line(data, length);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
      line.pop_back();
    }

    if (line.rfind("HTTP/", 0) == 0) {
      state->current = ResponseHeaders{};
      return length;
    }

    if (line.empty()) {
      long status = 0;
      curl_easy_getinfo(state->easy, CURLINFO_RESPONSE_CODE, &status);
      const bool interim = status >= 100 && status < 200;
      const bool redirect = state->follow_redirects && status >= 300 && status < 400 && state->current.contains("location");
      if (!interim && !redirect) {
        state->status = status;
        state->final_headers = state->current;
        state->complete = true;
      }
      return length;
    }

    const auto colon = line.find(':');
    if (colon != std::string::npos) {
      std::string value = line.substr(colon + 1);
      const auto first = value.find_first_not_of(" \t");
      value = first == std::string::npos ? std::string() : value.substr(first);
      state->current.set(line.substr(0, colon), std::move(value));
    }
  } catch (const std::exception &) {
    return 0; // aborts the transfer with CURLE_WRITE_ERROR
  }
  return length;
}

void configure_request(CURL *easy, const std::string &url, curl_slist *headers, const TransportOptions &options, HeaderState *state, char *error_buffer) {
  state->easy = easy;
  state->follow_redirects = follows_redirects(options);

  check_setopt(curl_easy_setopt(easy, CURLOPT_URL, url.c_str()), "URL");
  check_setopt(curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers), "HTTPHEADER");
  check_setopt(curl_easy_setopt(easy, CURLOPT_HEADERFUNCTION, header_callback), "HEADERFUNCTION");
  check_setopt(curl_easy_setopt(easy, CURLOPT_HEADERDATA, state), "HEADERDATA");
  check_setopt(curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, error_buffer), "ERRORBUFFER");
  check_setopt(curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L), "FOLLOWLOCATION");
  check_setopt(curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L), "NOSIGNAL");
  apply_settings(easy, options);
}

// ============================================================================
// CurlResponseBody
// ============================================================================

class CurlResponseBody final : public IResponseBody {
public:
  CurlResponseBody(easy_ptr easy, slist_ptr request_headers)
      : _easy(std::move(easy))
      , _request_headers(std::move(request_headers))
      , _error_buffer(CURL_ERROR_SIZE, '\0') {}

  ~CurlResponseBody() override { close(); }

  CurlResponseBody(const CurlResponseBody &) = delete;
  CurlResponseBody &operator=(const CurlResponseBody &) = delete;

  void start(const std::string &url, const TransportOptions &options) {
    configure_request(_easy.get(), url, _request_headers.get(), options, &_header_state, _error_buffer.data());
    check_setopt(curl_easy_setopt(_easy.get(), CURLOPT_WRITEFUNCTION, write_callback), "WRITEFUNCTION");
    check_setopt(curl_easy_setopt(_easy.get(), CURLOPT_WRITEDATA, this), "WRITEDATA");

    _multi = curl_multi_init();
    if (!_multi) {
      throw TransportError("curl_multi_init failed");
    }
    const CURLMcode mc = curl_multi_add_handle(_multi, _easy.get());
    if (mc != CURLM_OK) {
      throw TransportError(std::string("curl_multi_add_handle failed: ") + curl_multi_strerror(mc), mc);
    }

    while (!_header_state.complete && !_done) {
      pump();
    }
    check_result();
    if (!_header_state.complete) {
      throw TransportError("Connection closed before response headers were received: " + url);
    }
  }

  long status() const { return _header_state.status; }
  const ResponseHeaders &headers() const { return _header_state.final_headers; }

  size_t read(void *buffer, size_t size) override {
    if (_closed) {
      throw std::logic_error("read on a closed response body");
    }
    if (size == 0) {
      return 0;
    }

    while (_pending_pos == _pending.size()) {
      if (_paused) {
        _paused = false;
        const CURLcode rc = curl_easy_pause(_easy.get(), CURLPAUSE_CONT);
        if (rc != CURLE_OK) {
          throw_curl_error("Failed to resume transfer", rc, nullptr);
        }
        continue;
      }
      if (_done) {
        check_result();
        return 0;
      }
      pump();
    }

    const size_t available = _pending.size() - _pending_pos;
    const size_t count = std::min(size, available);
    std::memcpy(buffer, _pending.data() + _pending_pos, count);
    _pending_pos += count;
    if (_pending_pos == _pending.size()) {
      _pending.clear();
      _pending_pos = 0;
    }
    return count;
  }

  void close() override {
    if (_closed) {
      return;
    }
    _closed = true;
    if (_multi) {
      curl_multi_remove_handle(_multi, _easy.get());
      curl_multi_cleanup(_multi);
      _multi = nullptr;
    }
    _easy.reset();
    _request_headers.reset();
    _pending.clear();
    _pending.shrink_to_fit();
  }

  bool closed() const override { return _closed; }

private:
  static size_t write_callback(char *data, size_t size, size_t nmemb, void *userdata) {
    auto *body = static_cast<CurlResponseBody *>(userdata);
    const size_t length = size * nmemb;
    if (body->_pending.size() - body->_pending_pos >= kPauseThreshold) {
      body->_paused = true;
      return CURL_WRITEFUNC_PAUSE;
    }
    try {
      body->_pending.insert(body->_pending.end(), data, data + length);
    } catch (const std::bad_alloc &) {
      return 0;
    }
    return length;
  }

  void pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(_multi, &running);
    if (mc != CURLM_OK) {
      throw TransportError(std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc), mc);
    }

    int queued = 0;
    while (CURLMsg *message = curl_multi_info_read(_multi, &queued)) {
      if (message->msg == CURLMSG_DONE) {
        _done = true;
        _result = message->data.result;
      }
    }
    if (running == 0) {
      _done = true;
      return;
    }

    mc = curl_multi_poll(_multi, nullptr, 0, 1000, nullptr);
    if (mc != CURLM_OK) {
      throw TransportError(std::string("curl_multi_poll failed: ") + curl_multi_strerror(mc), mc);
    }
  }

  void check_result() const {
    if (_result != CURLE_OK) {
      throw_curl_error("Transfer failed", _result, _error_buffer.data());
    }
  }

  easy_ptr _easy;
  slist_ptr _request_headers;
  std::vector<char> _error_buffer;
  CURLM *_multi = nullptr;
  HeaderState _header_state;
  std::vector<char> _pending;
  size_t _pending_pos = 0;
  bool _paused = false;
  bool _done = false;
  bool _closed = false;
  CURLcode _result = CURLE_OK;
};

} // namespace

// ============================================================================
// CurlTransport
// ============================================================================

CurlTransport::CurlTransport() { ensure_global_init(); }

TransportResponse CurlTransport::get(const std::string &url, const HeaderList &headers, const TransportOptions &options) {
  auto body = std::make_unique<CurlResponseBody>(new_easy_handle(), build_header_list(headers));
  body->start(url, options);

  TransportResponse response;
  response.status = body->status();
  response.headers = body->headers();
  response.body = std::move(body);
  return response;
}

TransportResponse CurlTransport::head(const std::string &url, const HeaderList &headers, const TransportOptions &options) {
  easy_ptr easy = new_easy_handle();
  slist_ptr request_headers = build_header_list(headers);
  HeaderState state;
  std::vector<char> error_buffer(CURL_ERROR_SIZE, '\0');

  configure_request(easy.get(), url, request_headers.get(), options, &state, error_buffer.data());
  check_setopt(curl_easy_setopt(easy.get(), CURLOPT_NOBODY, 1L), "NOBODY");

  const CURLcode rc = curl_easy_perform(easy.get());
  if (rc != CURLE_OK) {
    throw_curl_error("HEAD request failed for " + url, rc, error_buffer.data());
  }

  TransportResponse response;
  if (state.complete) {
    response.status = state.status;
    response.headers = state.final_headers;
  } else {
    curl_easy_getinfo(easy.get(), CURLINFO_RESPONSE_CODE, &response.status);
    response.headers = state.current;
  }
  return response;
}

std::shared_ptr<ITransport> make_curl_transport() { return std::make_shared<CurlTransport>(); }

} // namespace remotezip
