namespace installer
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    // An explicit certificate file replaces the system trust store.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type req)
  {
    return perform (std::move (req), nullptr);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    return perform (request_type (http_method::get, url), nullptr);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  head (const string_type& url)
  {
    return perform (request_type (http_method::head, url), nullptr);
  }
}
