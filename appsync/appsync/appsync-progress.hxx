#pragma once

#include <string>
#include <ostream>

#include <appsync/progress/progress-types.hxx>

namespace appsync
{
  // Single-line console progress display.
  //
  // Each event redraws the line in place: the label on the left, a gauge and
  // the percentage on the right. Repeated identical events are not redrawn.
  //
  class console_progress: public progress_sink
  {
  public:
    explicit
    console_progress (std::ostream& os);

    console_progress (const console_progress&) = delete;
    console_progress& operator= (const console_progress&) = delete;

    ~console_progress () override;

    void
    on_progress (int percent, const std::string& label) override;

    // Move past the progress line so that subsequent output starts on a line
    // of its own. Called by the destructor if not called explicitly.
    //
    void
    finish ();

  private:
    std::ostream& os_;
    progress_event last_;
    bool shown_ = false;
    std::string reset_;
  };

  // Format an integer percentage right-aligned in four columns ("  7%").
  //
  std::string
  format_percent (int);
}
