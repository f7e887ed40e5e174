#include "fin_http_request.h"
#include <curl/curl.h>
#include <memory>

namespace {

  size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t real_size = size * nmemb;
    fin_string* mem = static_cast<fin_string*>(userp);
    mem->append(static_cast<char*>(contents), real_size);
    return real_size;
  }

  // One "Key: value\r\n" line per call
  size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t numbytes = size * nitems;
    finv_map* headers = static_cast<finv_map*>(userdata);
    fin_string header_line(buffer, numbytes);

    size_t colon_pos = header_line.find(":");
    if (colon_pos != fin_string::npos) {
      fin_string key = header_line.substr(0, colon_pos).trim();
      (*headers)[key] = header_line.substr(colon_pos + 1).trim();
    }
    return numbytes;
  }

} // namespace

fin_http_request::fin_http_request()
    : method_("GET"), timeout_seconds_(60), status_code_(0) {}

fin_http_request::fin_http_request(const fin_string& url)
    : url_(url), method_("GET"), timeout_seconds_(60), status_code_(0) {}

void fin_http_request::set_url(const fin_string& url) { url_ = url; }
fin_string fin_http_request::get_url() const { return url_; }
void fin_http_request::set_method(const fin_string& method) { method_ = method; }
fin_string fin_http_request::get_method() const { return method_; }
void fin_http_request::set_header(const fin_string& key, const fin_string& value) { headers_[key] = value; }
fin_string fin_http_request::get_header(const fin_string& key) const {
  auto it = headers_.find(key);
  return (it != headers_.end() && it->second.is_string()) ? it->second.string_value() : fin_string();
}
void fin_http_request::set_body(const fin_string& body) { body_ = body; }
void fin_http_request::set_timeout(long seconds) { timeout_seconds_ = seconds; }

bool fin_http_request::send() {
  status_code_ = 0;
  response_body_.clear();
  response_headers_.clear();
  error_message_.clear();

  if (url_.empty()) {
    error_message_ = "URL is empty.";
    return false;
  }

  auto curl_deleter = [](CURL* c) { if (c) curl_easy_cleanup(c); };
  auto slist_deleter = [](struct curl_slist* s) { if (s) curl_slist_free_all(s); };

  std::unique_ptr<CURL, decltype(curl_deleter)> curl(curl_easy_init(), curl_deleter);
  if (!curl) {
    error_message_ = "Failed to initialize libcurl.";
    return false;
  }

  std::unique_ptr<struct curl_slist, decltype(slist_deleter)> header_list(nullptr, slist_deleter);
  char errbuf[CURL_ERROR_SIZE] = {0};

  fin_string method_upper = method_.upper();

  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);

  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body_);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers_);

  for (const auto& pair : headers_) {
    if (pair.second.is_string()) {
      fin_string header_string = pair.first + ": " + pair.second.string_value();
      header_list.reset(curl_slist_append(header_list.release(), header_string.c_str()));
    }
  }
  if (header_list) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  }

  if (method_upper == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body_.length()));
  } else if (method_upper != "GET") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method_upper.c_str());
    if (!body_.empty()) {
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body_.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body_.length()));
    }
  }

  CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    error_message_ = fin_string("libcurl error: ") + curl_easy_strerror(res) + " - " + errbuf;
    return false;
  }

  long http_code = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
  status_code_ = static_cast<int>(http_code);

  if (status_code_ < 200 || status_code_ >= 300) {
    error_message_ = fin_string("HTTP error: ") + fin_string(status_code_) + " - " + response_body_;
    return false;
  }
  return true;
}

int fin_http_request::get_status_code() const { return status_code_; }
fin_string fin_http_request::get_response_body() const { return response_body_; }
const finv_map& fin_http_request::get_response_headers() const { return response_headers_; }
fin_string fin_http_request::get_error_message() const { return error_message_; }
