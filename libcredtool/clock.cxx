// file      : libcredtool/clock.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/clock.hxx>

#include <thread> // this_thread::sleep_for()

using namespace std;

namespace credtool
{
  timestamp real_clock::
  now () const
  {
    return system_clock::now ();
  }

  bool real_clock::
  sleep (duration d, const cancellation& c)
  {
    using namespace chrono;

    const duration slice (milliseconds (10));

    for (timestamp e (system_clock::now () + d);; )
    {
      if (c.cancelled ())
        return false;

      timestamp n (system_clock::now ());
      if (n >= e)
        return true;

      this_thread::sleep_for (min (slice, e - n));
    }
  }

  bool manual_clock::
  sleep (duration d, const cancellation& c)
  {
    if (c.cancelled ())
      return false;

    time_ += d;
    sleeps.push_back (d);

    if (on_sleep)
      on_sleep (d);

    return !c.cancelled ();
  }
}
