#pragma once

#include <string>
#include <ostream>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace appsync
{
  namespace fs = std::filesystem;

  // Kind of recoverable failure of a sync pass.
  //
  // Connectivity problems (the host name doesn't resolve) are told apart
  // from everything else that can go wrong talking to the server since the
  // user can do something about the former.
  //
  enum class failure_kind
  {
    none,
    dns,  // Host name resolution failed.
    http  // Error status, bad response, or any other transport failure.
  };

  inline std::ostream&
  operator<< (std::ostream& os, failure_kind k)
  {
    switch (k)
    {
      case failure_kind::none: return os << "none";
      case failure_kind::dns:  return os << "dns";
      case failure_kind::http: return os << "http";
    }
    return os;
  }

  // Local filesystem failure (open, read, write, rename).
  //
  // These are deliberately not folded into the sync outcome: the engine lets
  // them escape to the caller since there is nothing a retry could fix.
  //
  class io_error: public std::runtime_error
  {
  public:
    io_error (const fs::path& p, const std::string& what)
      : std::runtime_error (what + ": " + p.string ()), path_ (p) {}

    io_error (const fs::path& p, const std::string& what, std::error_code ec)
      : std::runtime_error (what + ": " + p.string () + ": " + ec.message ()),
        path_ (p) {}

    const fs::path&
    path () const noexcept
    {
      return path_;
    }

  private:
    fs::path path_;
  };
}
