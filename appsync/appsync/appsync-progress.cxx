#include <appsync/appsync-progress.hxx>

#include <iomanip>
#include <sstream>
#include <algorithm>

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

using namespace std;

namespace appsync
{
  using namespace ftxui;

  console_progress::
  console_progress (ostream& os)
    : os_ (os)
  {
  }

  console_progress::
  ~console_progress ()
  {
    finish ();
  }

  void console_progress::
  on_progress (int percent, const string& label)
  {
    progress_event e (clamp (percent, 0, 100), label);

    if (shown_ && e == last_)
      return;

    // The label is the file path during downloads. Keep the right side at a
    // fixed width so the gauge doesn't jump around as the label changes.
    //
    Element doc (hbox ({
      text (e.label),
      filler (),
      text (" "),
      gauge (static_cast<float> (e.percent) / 100.0f) | size (WIDTH, EQUAL, 30),
      text (format_percent (e.percent))
    }));

    auto screen (Screen::Create (Dimension::Full (), Dimension::Fit (doc)));
    Render (screen, doc);

    os_ << reset_ << screen.ToString () << flush;
    reset_ = screen.ResetPosition ();

    last_ = move (e);
    shown_ = true;
  }

  void console_progress::
  finish ()
  {
    if (shown_)
    {
      os_ << endl;
      shown_ = false;
      reset_.clear ();
    }
  }

  string
  format_percent (int p)
  {
    ostringstream o;
    o << right << setw (4) << p << '%';
    return o.str ();
  }
}
