// ============================================================================
// solr_cursor.cpp -- implementation of the SolrCursor producer
// ============================================================================
#include "solrdump/solr_cursor.hpp"

#include <cctype>
#include <cstdio>
#include <thread>
#include <utility>
#include <vector>

#include <curl/curl.h>

namespace solrdump {

// ============================================================================
// Request / response helpers
// ============================================================================
static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

/// Split on commas that are not inside parentheses (function sorts).
static std::vector<std::string> split_sort(const std::string& sort) {
  std::vector<std::string> out;
  std::string cur;
  int depth = 0;
  for (char c : sort) {
    if (c == '(') ++depth;
    if (c == ')') --depth;
    if (c == ',' && depth == 0) {
      out.push_back(trim(cur));
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  out.push_back(trim(cur));
  return out;
}

void validate_sort(const std::string& sort) {
  if (trim(sort).empty()) {
    throw StreamSetupError("wrong query. sort parameter is required");
  }
  for (const auto& clause : split_sort(sort)) {
    const auto sp = clause.find_last_of(" \t");
    if (clause.empty() || sp == std::string::npos) {
      throw StreamSetupError("wrong query. sort clause \"" + clause +
                             "\" must be \"<field> asc|desc\"");
    }
    const std::string field = trim(clause.substr(0, sp));
    std::string dir = clause.substr(sp + 1);
    for (auto& c : dir) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (field.empty() || (dir != "asc" && dir != "desc")) {
      throw StreamSetupError("wrong query. sort clause \"" + clause +
                             "\" must be \"<field> asc|desc\"");
    }
  }
}

static std::string url_encode(const std::string& s) {
  static const char* hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0F]);
    }
  }
  return out;
}

std::string build_select_url(const std::string& base, const QueryParams& qp,
                             const std::string& cursor_mark) {
  std::string url = base + "/select?";
  for (const auto& [k, v] : qp) {
    url += url_encode(k) + "=" + url_encode(v) + "&";
  }
  url += "wt=json&cursorMark=" + url_encode(cursor_mark);
  return url;
}

CursorPage parse_select_response(const HttpResponse& resp) {
  Document body;
  try {
    body = Document::parse(resp.body);
  } catch (const nlohmann::json::parse_error& e) {
    if (resp.status != 200) {
      throw std::runtime_error("http status " + std::to_string(resp.status));
    }
    throw std::runtime_error(std::string("malformed Solr response. ") + e.what());
  }

  if (resp.status != 200) {
    std::string msg = "http status " + std::to_string(resp.status);
    if (body.is_object() && body.contains("error") &&
        body["error"].is_object() && body["error"].contains("msg") &&
        body["error"]["msg"].is_string()) {
      msg += ": " + body["error"]["msg"].get<std::string>();
    }
    throw std::runtime_error(msg);
  }

  if (!body.is_object() || !body.contains("response") ||
      !body["response"].is_object() || !body["response"].contains("docs") ||
      !body["response"]["docs"].is_array()) {
    throw std::runtime_error("malformed Solr response: no response.docs array");
  }
  if (!body.contains("nextCursorMark") || !body["nextCursorMark"].is_string()) {
    throw std::runtime_error("malformed Solr response: no nextCursorMark");
  }

  CursorPage page;
  auto& docs = body["response"]["docs"];
  page.docs.reserve(docs.size());
  for (auto& d : docs) page.docs.push_back(std::move(d));
  page.next_mark = body["nextCursorMark"].get<std::string>();
  if (body["response"].contains("numFound") &&
      body["response"]["numFound"].is_number_unsigned()) {
    page.num_found = body["response"]["numFound"].get<uint64_t>();
  }
  return page;
}

// ============================================================================
// libcurl transport
// ============================================================================
class CurlGet {
public:
  explicit CurlGet(const Params& p) {
    curl_ = curl_easy_init();
    if (!curl_) {
      throw StreamSetupError("wrong query. failed to initialize CURL");
    }
    const std::string agent = std::string(PROGRAM_NAME) + "/" +
                              PROGRAM_VERSION + " (linux)";
    headers_ = curl_slist_append(headers_, "Accept: application/json");
    headers_ = curl_slist_append(headers_, "Connection: keep-alive");

    curl_easy_setopt(curl_, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(p.http_timeout));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &CurlGet::write_cb);
    if (!p.user.empty()) {
      curl_easy_setopt(curl_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
      curl_easy_setopt(curl_, CURLOPT_USERNAME, p.user.c_str());
      curl_easy_setopt(curl_, CURLOPT_PASSWORD, p.password.c_str());
    }
  }

  ~CurlGet() {
    if (headers_) curl_slist_free_all(headers_);
    if (curl_) curl_easy_cleanup(curl_);
  }

  CurlGet(const CurlGet&) = delete;
  CurlGet& operator=(const CurlGet&) = delete;

  HttpResponse get(const std::string& url) {
    HttpResponse resp;
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &resp.body);
    CURLcode rc = curl_easy_perform(curl_);
    if (rc != CURLE_OK) {
      throw std::runtime_error(std::string("CURL error: ") +
                               curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status);
    return resp;
  }

private:
  static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
  }

  CURL*        curl_{nullptr};
  curl_slist*  headers_{nullptr};
};

// ============================================================================
// Impl: implementation of the SolrCursor class
// ============================================================================
struct SolrCursor::Impl {
  Impl(std::string base_, Params params_, QueryParams qp_, ResultChannel& out_,
       HttpGetFn http_get_)
    : base(std::move(base_)), params(std::move(params_)), qp(std::move(qp_)),
      out(out_), http_get(std::move(http_get_)) {}

  std::string              base;
  Params                   params;
  QueryParams              qp;
  ResultChannel&           out;
  HttpGetFn                http_get;
  std::unique_ptr<CurlGet> curl;

  CursorPage        first;     // answer to cursorMark=*, fetched by start()
  std::thread       th;
  std::atomic<bool> run{false};
  Stats             stats_;

  void fail(const std::string& msg) {
    stats_.errors.fetch_add(1, std::memory_order_relaxed);
    out.push(StreamError{msg});
  }

  /// GET and decode one select URL. Throws on any failure.
  CursorPage fetch(const std::string& url) {
    stats_.requests.fetch_add(1, std::memory_order_relaxed);
    return parse_select_response(http_get(url));
  }

  /// Main loop: emit the current page, then request the next mark until
  /// the mark stops moving
  void loop() {
    std::string mark = "*";
    CursorPage page = std::move(first);
    while (true) {
      const bool last = page.docs.empty() || page.next_mark == mark;
      if (!page.docs.empty()) {
        stats_.pages.fetch_add(1, std::memory_order_relaxed);
        stats_.docs.fetch_add(page.docs.size(), std::memory_order_relaxed);
        if (!out.push(std::move(page.docs))) break;   // consumer went away
      }
      if (last || !run.load(std::memory_order_relaxed)) break;

      mark = std::move(page.next_mark);
      const std::string url = build_select_url(base, qp, mark);
      try {
        page = fetch(url);
      } catch (const std::exception& e) {
        fail(std::string("request ") + url + " failed. " + e.what());
        break;
      }
    }
    out.close();
  }
};

// ============================================================================
// `SolrCursor` class
// ============================================================================
SolrCursor::SolrCursor(std::string base_url, Params params, QueryParams qp,
                       ResultChannel& out, HttpGetFn http_get)
: impl_(std::make_unique<Impl>(std::move(base_url), std::move(params),
                               std::move(qp), out, std::move(http_get))) {}

SolrCursor::~SolrCursor() { stop(); }

void SolrCursor::start() {
  if (impl_->run.load()) return;

  validate_sort(impl_->params.sort);
  if (!impl_->http_get) {
    impl_->curl = std::make_unique<CurlGet>(impl_->params);
    CurlGet* c = impl_->curl.get();
    impl_->http_get = [c](const std::string& url) { return c->get(url); };
  }

  // the first page is requested here: a query Solr rejects, or a host that
  // cannot be reached, fails the setup instead of the stream
  const std::string url = build_select_url(impl_->base, impl_->qp, "*");
  try {
    impl_->first = impl_->fetch(url);
  } catch (const std::exception& e) {
    impl_->stats_.errors.fetch_add(1, std::memory_order_relaxed);
    impl_->out.close();
    throw StreamSetupError(std::string("wrong query. request ") + url +
                           " failed. " + e.what());
  }
  std::printf("SOLR: numFound=%llu\n", (unsigned long long)impl_->first.num_found);

  impl_->run.store(true);
  impl_->th = std::thread([this]{ impl_->loop(); });
}

void SolrCursor::stop() {
  if (!impl_->run.exchange(false)) return;
  // unblock a producer waiting on a full channel
  impl_->out.close();
  if (impl_->th.joinable()) impl_->th.join();
}

const SolrCursor::Stats& SolrCursor::stats() const noexcept {
  return impl_->stats_;
}

} // namespace solrdump
