#ifndef FIN_HTTP_REQUEST_H
#define FIN_HTTP_REQUEST_H

#include "../../utils/fin_variant.h"

// Synchronous HTTP request over libcurl
class fin_http_request {
public:
  fin_http_request();
  explicit fin_http_request(const fin_string& url);

  void set_url(const fin_string& url);
  fin_string get_url() const;

  /**
   * @brief HTTP method, e.g. "GET" or "POST". Default is GET.
   */
  void set_method(const fin_string& method);
  fin_string get_method() const;

  void set_header(const fin_string& key, const fin_string& value);
  fin_string get_header(const fin_string& key) const;

  void set_body(const fin_string& body);

  /**
   * @brief Whole-request timeout in seconds, 0 disables it.
   */
  void set_timeout(long seconds);

  /**
   * @brief Sends the request.
   * @return true for a 2xx status. Otherwise get_error_message() holds the
   * transport error or the status line plus response body.
   */
  bool send();

  int get_status_code() const;
  fin_string get_response_body() const;
  const finv_map& get_response_headers() const;
  fin_string get_error_message() const;

private:
  fin_string url_;
  fin_string method_;
  finv_map headers_;
  fin_string body_;
  long timeout_seconds_;

  int status_code_;
  fin_string response_body_;
  finv_map response_headers_;
  fin_string error_message_;
};

#endif // FIN_HTTP_REQUEST_H
