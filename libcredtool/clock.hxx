// file      : libcredtool/clock.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_CLOCK_HXX
#define LIBCREDTOOL_CLOCK_HXX

#include <atomic>

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

namespace credtool
{
  // External cancellation request.
  //
  // Note that cancel() is async-signal-safe and can be called from a signal
  // handler.
  //
  class cancellation
  {
  public:
    void
    cancel () noexcept {flag_.store (true, std::memory_order_relaxed);}

    bool
    cancelled () const noexcept
    {
      return flag_.load (std::memory_order_relaxed);
    }

  private:
    std::atomic<bool> flag_ {false};
  };

  // Time source and sleep facility used by the pipeline.
  //
  class pipeline_clock
  {
  public:
    virtual
    ~pipeline_clock () = default;

    virtual timestamp
    now () const = 0;

    // Sleep for the specified period. Return false if cancelled before the
    // period has elapsed.
    //
    virtual bool
    sleep (duration, const cancellation&) = 0;
  };

  // The system clock. Sleeps in short slices checking for cancellation in
  // between.
  //
  class real_clock: public pipeline_clock
  {
  public:
    virtual timestamp
    now () const override;

    virtual bool
    sleep (duration, const cancellation&) override;
  };

  // Manually advanced clock. Sleeping advances the time instantly and
  // records the requested period.
  //
  class manual_clock: public pipeline_clock
  {
  public:
    explicit
    manual_clock (timestamp t = system_clock::now ()): time_ (t) {}

    virtual timestamp
    now () const override {return time_;}

    virtual bool
    sleep (duration, const cancellation&) override;

    void
    advance (duration d) {time_ += d;}

    // Periods passed to sleep(), in order.
    //
    vector<duration> sleeps;

    // If set, called on every sleep() after the time is advanced. Can be used
    // to cancel the operation being retried.
    //
    function<void (duration)> on_sleep;

  private:
    timestamp time_;
  };
}

#endif // LIBCREDTOOL_CLOCK_HXX
