namespace appsync
{
  inline bool
  host_resolution_failure (const boost::system::error_code& ec) noexcept
  {
    return ec == asio::error::host_not_found ||
           ec == asio::error::host_not_found_try_again ||
           ec == asio::error::no_recovery ||
           ec == asio::error::no_data;
  }

  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (request_type req)
  {
    req.normalize (session_->traits ().user_agent);
    co_return co_await request_impl (std::move (req), 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  get (const string_type& url)
  {
    co_return co_await request (request_type (url));
  }

  template <typename T>
  inline asio::awaitable<std::uint64_t>
  basic_http_client<T>::
  download (const string_type& url,
            const fs::path& target,
            progress_callback progress)
  {
    co_return co_await download_impl (url, target, progress, 0);
  }
}
