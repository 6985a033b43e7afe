// file      : libcredtool/process.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libcredtool/process.hxx>

#include <sys/time.h>   // timeval
#include <sys/select.h>

#include <ratio>        // ratio_greater_equal
#include <cerrno>
#include <type_traits>  // static_assert

using namespace std;
using namespace butl;

namespace credtool
{
  read_status
  read_output (process& pr,
               auto_fd&& fd,
               string& out,
               duration timeout,
               const cancellation& c)
  {
    using namespace chrono;

    // Make sure that the system clock has at least milliseconds resolution.
    //
    static_assert (
      ratio_greater_equal<milliseconds::period, duration::period>::value,
      "The system clock resolution is too low");

    // Set the non-blocking mode for the stream, try to read from it with the
    // 10 milliseconds timeout and check the cancellation flag and the
    // execution time between the reads.
    //
    ifdstream is (move (fd), fdstream_mode::non_blocking);

    const size_t nbuf (8192);
    char buf[nbuf];

    timestamp deadline (system_clock::now () + timeout);

    while (is.is_open ())
    {
      if (c.cancelled ())
      {
        pr.kill ();
        return read_status::cancelled;
      }

      timeval tm {0 /* seconds */, 10000 /* microseconds */};

      fd_set rd;
      FD_ZERO (&rd);
      FD_SET  (is.fd (), &rd);

      int r (select (is.fd () + 1, &rd, nullptr, nullptr, &tm));

      if (r == -1)
      {
        // Don't fail if the select() call was interrupted by the signal.
        //
        if (errno != EINTR)
          throw_system_ios_failure (errno, "select failed");
      }
      else if (r != 0) // Is data available?
      {
        // The only legal way to read from non-blocking ifdstream.
        //
        streamsize n (is.readsome (buf, nbuf));

        if (is.eof ())
          is.close ();
        else
          out.append (buf, static_cast<size_t> (n));
      }

      if (is.is_open () && system_clock::now () >= deadline)
      {
        pr.kill ();
        return read_status::timeout;
      }
    }

    return read_status::complete;
  }
}
