// file      : libcredtool/delivery.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBCREDTOOL_DELIVERY_HXX
#define LIBCREDTOOL_DELIVERY_HXX

#include <libcredtool/types.hxx>
#include <libcredtool/utility.hxx>

#include <libcredtool/failure.hxx>
#include <libcredtool/credentials.hxx>
#include <libcredtool/diagnostics.hxx>

namespace credtool
{
  // Where the registration token is delivered to.
  //
  // The textual representation is one of:
  //
  // stdout
  // file:<path>
  // exec:<program>
  //
  class destination
  {
  public:
    enum kind_type {standard_output, file, program};

    kind_type kind = standard_output;

    // The file to write or the runner program to execute.
    //
    path target;

    // Arguments passed to the runner program before the --jitconfig option.
    //
    strings arguments;

    // Throw invalid_argument if the representation is invalid.
    //
    explicit
    destination (const string&);

    destination () = default;
  };

  string
  to_string (const destination&);

  inline ostream&
  operator<< (ostream& os, const destination& d)
  {
    return os << to_string (d);
  }

  // Deliver the token value to the destination.
  //
  // Standard output: write the token followed by the newline to `out`.
  //
  // File: write the token followed by the newline to a temporary file in the
  // target's directory, created exclusively with the owner-only read/write
  // permissions, and rename it over the target. Either the complete token is
  // written or the target is left untouched.
  //
  // Program: execute the runner program passing the arguments followed by
  // `--jitconfig <token>` and wait for its termination. Note that the token
  // never touches the file system.
  //
  // Throw failure (delivery_failure).
  //
  void
  deliver (const runner_registration_token&,
           const destination&,
           ostream& out,
           const basic_mark* trace = nullptr);

  // Write the value to the file atomically (see above). If specified, call
  // the written function after the value is written to the temporary file
  // but before it is renamed over the target.
  //
  // Throw failure (delivery_failure).
  //
  void
  deliver_file (const string& value,
                const path& target,
                const function<void (const path& temp)>& written = nullptr);
}

#endif // LIBCREDTOOL_DELIVERY_HXX
