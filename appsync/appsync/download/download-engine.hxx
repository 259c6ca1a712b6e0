#pragma once

#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include <appsync/appsync-types.hxx>
#include <appsync/http/http.hxx>
#include <appsync/manifest/manifest.hxx>
#include <appsync/download/download-types.hxx>

namespace appsync
{
  // Sequential whole-file downloader.
  //
  class download_engine
  {
  public:
    explicit
    download_engine (http_client& c)
      : client_ (c) {}

    download_engine (const download_engine&) = delete;
    download_engine& operator= (const download_engine&) = delete;

    // Download the files with the given manifest paths into the directory,
    // one after the other, in order.
    //
    // Each file is fetched from the manifest's file URL and streamed into
    // the staging directory (see download_staging_dir()) under its manifest
    // path. Once complete it is renamed over its destination, creating
    // parent directories as necessary. A partial download can thus never
    // overwrite a file of the installation, whatever the manifest paths. For
    // every chunk of a file whose size the server declares, the progress
    // callback gets the batch percentage (which never decreases within a
    // call) and the file path. Files without a declared size report nothing.
    //
    // The first failure aborts the batch: transfer_error for server and
    // network failures, io_error for local ones. Files completed before it
    // stay in place. The staging directory is removed in either case.
    //
    // Throw std::invalid_argument if a path is not in the manifest or the
    // directory has no parent to stage in.
    //
    asio::awaitable<void>
    download_all (const manifest& remote,
                  const std::vector<std::string>& paths,
                  const fs::path& dir,
                  const download_progress_callback& progress);

  private:
    asio::awaitable<void>
    download_file (const manifest& remote,
                   const manifest_file& file,
                   const fs::path& dir,
                   const fs::path& staging,
                   std::size_t index,
                   std::size_t count,
                   const download_progress_callback& progress);

  private:
    http_client& client_;
  };

  // Return the directory downloads into dir are staged in: a sibling of dir
  // named after it with the .part extension (app/ -> app.part/). Being
  // outside dir, it can't clash with a manifest path.
  //
  // Throw std::invalid_argument if dir is the filesystem root and io_error
  // if it can't be made absolute.
  //
  fs::path
  download_staging_dir (const fs::path& dir);
}
