#include <installer/installer-progress.hxx>

#include <cmath>
#include <iomanip>
#include <sstream>
#include <iostream>

#ifdef _WIN32
#  include <io.h>
#else
#  include <unistd.h>
#endif

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

using namespace std;

namespace installer
{
  string
  format_bytes (uint64_t b)
  {
    static const char* u[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    static const size_t n (sizeof (u) / sizeof (*u));

    double v (static_cast<double> (b));
    size_t i (0);

    while (v >= 1024.0 && i < n - 1)
    {
      v /= 1024.0;
      ++i;
    }

    ostringstream o;
    o << fixed << setprecision (1) << v << ' ' << u[i];
    return o.str ();
  }

  string
  format_speed (double bps)
  {
    return format_bytes (static_cast<uint64_t> (bps)) + "/s";
  }

  string
  format_duration (int s)
  {
    ostringstream o;

    if (s < 60)
      o << s << "s";
    else if (s < 3600)
      o << s / 60 << "m" << setw (2) << setfill ('0') << s % 60 << "s";
    else
      o << s / 3600 << "h" << setw (2) << setfill ('0') << (s % 3600) / 60
        << "m";

    return o.str ();
  }

  static bool
  stdout_terminal ()
  {
#ifdef _WIN32
    return _isatty (_fileno (stdout)) != 0;
#else
    return isatty (STDOUT_FILENO) != 0;
#endif
  }

  progress_display::
  progress_display (string l)
    : label_ (move (l)),
      terminal_ (stdout_terminal ()),
      start_ (clock::now ()),
      last_draw_ (start_)
  {
  }

  void progress_display::
  update (const download_progress& p)
  {
    lock_guard<mutex> l (mutex_);

    if (finished_)
      return;

    last_ = p;

    if (terminal_)
    {
      // Redrawing on every 8 KiB read would spend more time in the terminal
      // than on the network.
      //
      auto now (clock::now ());
      if (drawn_ && now - last_draw_ < chrono::milliseconds (100))
        return;

      last_draw_ = now;
      draw (p, false);
    }
    else if (p.total_bytes != 0)
    {
      int d (static_cast<int> (p.percent () / 10));

      if (d != last_decile_)
      {
        last_decile_ = d;
        draw (p, false);
      }
    }
  }

  void progress_display::
  finish ()
  {
    lock_guard<mutex> l (mutex_);

    if (finished_)
      return;

    finished_ = true;

    if (terminal_)
    {
      draw (last_, true);
      cout << endl;
    }
    else
      cout << label_ << ": " << format_bytes (last_.downloaded_bytes)
           << " done" << endl;
  }

  void progress_display::
  draw (const download_progress& p, bool final)
  {
    double el (chrono::duration<double> (clock::now () - start_).count ());
    double speed (el > 0 ? p.downloaded_bytes / el : 0.0);

    if (!terminal_)
    {
      cout << label_ << ": " << static_cast<int> (p.percent ()) << "% ("
           << format_bytes (p.downloaded_bytes) << " / "
           << format_bytes (p.total_bytes) << ")" << endl;
      return;
    }

    using namespace ftxui;

    float r (p.total_bytes != 0
             ? static_cast<float> (p.percent () / 100.0)
             : 0.0f);

    ostringstream s;
    s << right << setw (4) << static_cast<int> (p.percent ()) << "% "
      << setw (10) << format_bytes (p.downloaded_bytes);

    if (p.total_bytes != 0)
      s << " / " << setw (10) << format_bytes (p.total_bytes);

    s << " | " << setw (12) << format_speed (speed);

    if (!final && speed > 0 && p.total_bytes > p.downloaded_bytes)
    {
      int eta (static_cast<int> ((p.total_bytes - p.downloaded_bytes) /
                                 speed));
      s << " | " << format_duration (eta);
    }

    Element doc (hbox ({
      text (label_ + " "),
      gauge (r) | flex,
      text (" " + s.str ())}));

    if (final)
      doc = doc | color (Color::Green);

    auto screen (Screen::Create (Dimension::Full (), Dimension::Fit (doc)));
    Render (screen, doc);

    cout << reset_;
    screen.Print ();
    cout << flush;

    reset_ = screen.ResetPosition ();
    drawn_ = true;
  }
}
