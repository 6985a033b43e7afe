// file      : libcredtool/retry.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/retry.hxx>

#include <random>

using namespace std;

static thread_local mt19937 rand_gen (random_device {} ());

namespace credtool
{
  optional<duration>
  retry_delay (const retry_policy& p,
               size_t attempt,
               duration previous,
               const optional<chrono::seconds>& retry_after)
  {
    if (retry_after && *retry_after > p.max_delay)
      return nullopt;

    // Exponential delay: delay * 2^(attempt - 1), capped.
    //
    duration d (p.delay);
    for (size_t i (1); i < attempt && d < p.max_delay; ++i)
      d *= 2;

    if (p.jitter && d > duration::zero ())
    {
      uniform_int_distribution<duration::rep> j (0, d.count () / 2);
      d += duration (j (rand_gen));
    }

    if (d > p.max_delay)
      d = p.max_delay;

    if (retry_after && d < *retry_after)
      d = *retry_after;

    if (d < previous)
      d = previous;

    return d;
  }
}
