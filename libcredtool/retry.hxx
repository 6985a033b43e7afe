// file      : libcredtool/retry.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_RETRY_HXX
#define LIBCREDTOOL_RETRY_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>
#include <libcredtool/failure.hxx>

namespace credtool
{
  struct retry_policy
  {
    // Maximum number of attempts, including the first one.
    //
    size_t attempts = 4;

    // Delay before the second attempt. Doubled for every subsequent attempt
    // and capped by max_delay.
    //
    duration delay = std::chrono::seconds (1);
    duration max_delay = std::chrono::seconds (60);

    // Add a random [0, delay/2] jitter to the exponential delay so that the
    // runners started simultaneously don't retry in lockstep.
    //
    bool jitter = true;
  };

  // Return the delay before the attempt following the failed attempt number
  // `attempt` (1-based) given the previous delay and the platform-advised
  // one, if any. The delay never decreases from attempt to attempt and is
  // never less than the advised one. Return nullopt if the advised delay
  // exceeds the policy's max_delay.
  //
  optional<duration>
  retry_delay (const retry_policy&,
               size_t attempt,
               duration previous,
               const optional<std::chrono::seconds>& retry_after);

  // Call f() until it succeeds, throws a non-retryable failure, or the
  // attempts are exhausted, sleeping between the attempts. The last failure
  // is propagated as is. Throw failure_kind::cancelled failure if cancelled
  // before an attempt or while sleeping.
  //
  // If specified, the notify function is called before sleeping with the
  // failed attempt number, its failure, and the delay.
  //
  using retry_notify = function<void (size_t, const failure&, duration)>;

  template <typename F>
  auto
  retry (const retry_policy& p,
         pipeline_clock& clk,
         const cancellation& c,
         F&& f,
         const retry_notify& notify = nullptr) -> decltype (f ())
  {
    assert (p.attempts != 0);

    duration pd (duration::zero ()); // Previous delay.

    for (size_t a (1);; ++a)
    {
      if (c.cancelled ())
        throw failure (failure_kind::cancelled, "operation cancelled");

      optional<duration> d;
      try
      {
        return f ();
      }
      catch (const failure& e)
      {
        if (!retryable (e.kind) || a == p.attempts)
          throw;

        if (!(d = retry_delay (p, a, pd, e.retry_after)))
          throw;

        if (notify)
          notify (a, e, *d);
      }

      if (!clk.sleep (*d, c))
        throw failure (failure_kind::cancelled, "operation cancelled");

      pd = *d;
    }
  }
}

#endif // LIBCREDTOOL_RETRY_HXX
