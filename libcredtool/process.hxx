// file      : libcredtool/process.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_PROCESS_HXX
#define LIBCREDTOOL_PROCESS_HXX

#include <libbutl/process.hxx>
#include <libbutl/fdstream.hxx>

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/clock.hxx>

namespace credtool
{
  enum class read_status
  {
    complete,  // Eof reached.
    timeout,   // Timeout expired, process killed.
    cancelled  // Cancellation requested, process killed.
  };

  // Read the process output from the pipe until eof, the timeout expiration,
  // or the cancellation request, whichever comes first. In the latter two
  // cases kill the process.
  //
  // Note that the process is not waited for if the eof is reached.
  //
  // Throw io_error if unable to read from the pipe.
  //
  read_status
  read_output (butl::process&,
               butl::auto_fd&& in,
               string& out,
               duration timeout,
               const cancellation&);
}

#endif // LIBCREDTOOL_PROCESS_HXX
