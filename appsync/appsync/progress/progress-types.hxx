#pragma once

#include <string>
#include <utility>
#include <ostream>
#include <functional>

namespace appsync
{
  // Progress event: percentage (0-100) and a label identifying what is
  // being worked on ("manifest", a file path, or "done").
  //
  struct progress_event
  {
    int percent = 0;
    std::string label;

    progress_event () = default;

    progress_event (int p, std::string l)
      : percent (p), label (std::move (l)) {}
  };

  inline bool
  operator== (const progress_event& x, const progress_event& y)
  {
    return x.percent == y.percent && x.label == y.label;
  }

  inline bool
  operator!= (const progress_event& x, const progress_event& y)
  {
    return !(x == y);
  }

  inline std::ostream&
  operator<< (std::ostream& os, const progress_event& e)
  {
    return os << e.percent << "% " << e.label;
  }

  // Progress observer.
  //
  // Events are delivered synchronously on the task driving the sync pass and
  // in the order they happen. Implementations should return quickly.
  //
  class progress_sink
  {
  public:
    virtual
    ~progress_sink () = default;

    virtual void
    on_progress (int percent, const std::string& label) = 0;
  };

  // Sink forwarding to a function.
  //
  class function_progress_sink: public progress_sink
  {
  public:
    using function_type = std::function<void (int, const std::string&)>;

    explicit
    function_progress_sink (function_type f)
      : f_ (std::move (f)) {}

    void
    on_progress (int percent, const std::string& label) override
    {
      if (f_)
        f_ (percent, label);
    }

  private:
    function_type f_;
  };
}
