#pragma once

#include <mutex>
#include <string>
#include <chrono>
#include <cstdint>

#include <installer/download/download-types.hxx>

namespace installer
{
  // Human-readable formatting.
  //
  std::string
  format_bytes (std::uint64_t);

  std::string
  format_speed (double bytes_per_second);

  std::string
  format_duration (int seconds);

  // Terminal progress for a single transfer.
  //
  // On a terminal we redraw an FTXUI gauge in place. Otherwise (output
  // redirected to a file or pipe) we print a plain line every ten percent.
  //
  class progress_display
  {
  public:
    explicit
    progress_display (std::string label);

    progress_display (const progress_display&) = delete;
    progress_display& operator= (const progress_display&) = delete;

    // Suitable as a chunked_downloader observer.
    //
    void
    update (const download_progress&);

    // Draw the final state and move past the display.
    //
    void
    finish ();

  private:
    void
    draw (const download_progress&, bool final);

    using clock = std::chrono::steady_clock;

    std::string label_;
    bool terminal_;
    bool drawn_ = false;
    bool finished_ = false;
    int last_decile_ = -1;
    std::string reset_;
    download_progress last_;
    clock::time_point start_;
    clock::time_point last_draw_;
    std::mutex mutex_;
  };
}
