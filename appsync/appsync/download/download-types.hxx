#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <utility>
#include <ostream>
#include <stdexcept>
#include <functional>

#include <appsync/appsync-types.hxx>

namespace appsync
{
  // Batch download progress callback: overall percentage (0-100) and the
  // manifest path of the file being downloaded.
  //
  using download_progress_callback =
    std::function<void (int percent, const std::string& path)>;

  // Percentage of a file received, rounded down and capped at 100. The total
  // must not be 0.
  //
  inline int
  file_percent (std::uint64_t received, std::uint64_t total) noexcept
  {
    std::uint64_t p (received * 100 / total);
    return static_cast<int> (p > 100 ? 100 : p);
  }

  // Percentage of a batch of count files that is done while the file with
  // the 0-based index is file_pct percent done, rounded down. That is,
  // floor ((index + file_pct / 100) / count * 100) in exact arithmetic.
  //
  inline int
  batch_percent (std::size_t index, std::size_t count, int file_pct) noexcept
  {
    return static_cast<int> (
      (static_cast<std::uint64_t> (index) * 100 +
       static_cast<std::uint64_t> (file_pct)) / count);
  }

  // Download of a batch file failed because of the server or the network.
  //
  // Local filesystem failures are reported with io_error instead.
  //
  class transfer_error: public std::runtime_error
  {
  public:
    transfer_error (failure_kind k,
                    std::uint16_t status,
                    const std::string& message,
                    std::string path)
      : std::runtime_error (message),
        kind_ (k),
        status_ (status),
        path_ (std::move (path)) {}

    failure_kind
    kind () const noexcept
    {
      return kind_;
    }

    // HTTP status or 0 if there was no response.
    //
    std::uint16_t
    status () const noexcept
    {
      return status_;
    }

    // Manifest path of the file.
    //
    const std::string&
    path () const noexcept
    {
      return path_;
    }

  private:
    failure_kind kind_;
    std::uint16_t status_;
    std::string path_;
  };

  inline std::ostream&
  operator<< (std::ostream& os, const transfer_error& e)
  {
    os << e.path () << ": " << e.what ();
    if (e.status () != 0)
      os << " [status: " << e.status () << "]";
    return os;
  }
}
